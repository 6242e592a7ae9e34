#pragma once

#include <iostream>
#include <vector>

const int debug_level = 1;

#ifndef NDEBUG
#define DEBUG(level, x)          \
  if (debug_level >= level)      \
  {                              \
    std::cerr << x << std::endl; \
  }
#define DEBUG_NO_LINE(level, x) \
  if (debug_level >= level)     \
  {                             \
    std::cerr << x;             \
  }
#else
#define DEBUG(level, x)
#define DEBUG_NO_LINE(level, x)
#endif

inline void print_vector(const char *label, const std::vector<int> &vec)
{
  DEBUG_NO_LINE(2, label << ":");
  for (int i = 0; i < vec.size(); i++)
  {
    DEBUG_NO_LINE(2, " " << vec.at(i));
  }
  DEBUG_NO_LINE(2, std::endl);
}
