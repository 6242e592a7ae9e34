#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <vector>

// Sum of distances between the i-th smallest values of each column.
// Columns of different length are paired up to the shorter one.
inline std::int64_t calculate_total_distance(std::vector<int> left, std::vector<int> right)
{
  std::sort(left.begin(), left.end());
  std::sort(right.begin(), right.end());

  const size_t pairs = std::min(left.size(), right.size());
  std::int64_t total = 0;
  for (size_t i = 0; i < pairs; i++)
  {
    total += std::llabs(static_cast<std::int64_t>(left[i]) - right[i]);
  }
  return total;
}
