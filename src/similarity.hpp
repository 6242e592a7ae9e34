#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

// Each left value weighted by the number of times it appears in the right column.
// Returns nullopt if the score does not fit in 64 bits.
inline std::optional<std::int64_t> calculate_similarity_score(const std::vector<int> &left, const std::vector<int> &right)
{
  std::unordered_map<int, std::int64_t> right_counts;
  for (int value : right)
  {
    right_counts[value]++;
  }

  std::int64_t score = 0;
  for (int value : left)
  {
    auto it = right_counts.find(value);
    if (it == right_counts.end())
    {
      continue;
    }

    std::int64_t weighted;
    if (__builtin_mul_overflow(static_cast<std::int64_t>(value), it->second, &weighted) || __builtin_add_overflow(score, weighted, &score))
    {
      return std::nullopt;
    }
  }
  return std::optional{score};
}
