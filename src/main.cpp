#include <iostream>
#include "parts.hpp"

int main()
{
  std::ios_base::sync_with_stdio(false);

  if (!part1(input_path, std::cout))
  {
    return 1;
  }
  if (!part2(input_path, std::cout))
  {
    return 1;
  }

  return 0;
}
