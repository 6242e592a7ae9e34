#pragma once

#include <chrono> // chrono::high_resolution_clock
#include <optional>
#include <ostream>
#include <string>
#include "distance.hpp"
#include "read_columns.hpp"
#include "similarity.hpp"
#include "util.hpp"

const std::string input_path = "1.txt";

inline bool part1(const std::string &path, std::ostream &out)
{
  auto t_start = std::chrono::high_resolution_clock::now();

  std::optional<Columns> columns = read_columns_from_file(path);
  if (!columns.has_value())
  {
    return false;
  }

  std::int64_t total_distance = calculate_total_distance(columns->at(Side::Left), columns->at(Side::Right));
  out << "Total distance: " << total_distance << std::endl;

  auto t_end = std::chrono::high_resolution_clock::now();
  DEBUG(1, "part1 [μs]: \t" << std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count());
  return true;
}

inline bool part2(const std::string &path, std::ostream &out)
{
  auto t_start = std::chrono::high_resolution_clock::now();

  std::optional<Columns> columns = read_columns_from_file(path);
  if (!columns.has_value())
  {
    return false;
  }

  std::optional<std::int64_t> similarity_score = calculate_similarity_score(columns->at(Side::Left), columns->at(Side::Right));
  if (!similarity_score.has_value())
  {
    std::cerr << "Similarity score of " << path << " does not fit in 64 bits" << std::endl;
    return false;
  }
  out << "Similarity score: " << *similarity_score << std::endl;

  auto t_end = std::chrono::high_resolution_clock::now();
  DEBUG(1, "part2 [μs]: \t" << std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count());
  return true;
}
