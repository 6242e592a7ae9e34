#pragma once

#include <cassert>
#include <utility>

// The two columns of an input file
enum Side
{
  Left = 1,
  Right = 2,
};

inline const char *str_for_side(Side side)
{
  switch (side)
  {
  case Side::Left:
    return "left";
  case Side::Right:
    return "right";
  default:
    assert(false);
    __builtin_unreachable();
  }
}

template <class T>
class PerSide
{
public:
  PerSide(T left, T right) : left(std::move(left)), right(std::move(right)){};

  inline T &at(Side side)
  {
    switch (side)
    {
    case Side::Left:
      return left;
    case Side::Right:
      return right;
    default:
      assert(false);
      __builtin_unreachable();
    }
  }

  inline const T &at(Side side) const
  {
    return ((PerSide *)this)->at(side);
  }

  inline bool operator==(const PerSide<T> &other) const
  {
    return left == other.left && right == other.right;
  }

private:
  T left;
  T right;
};
