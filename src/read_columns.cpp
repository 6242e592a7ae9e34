#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include "read_columns.hpp"
#include "util.hpp"

std::optional<int> parse_int(const std::string &token)
{
  size_t digits_start = 0;
  if (!token.empty() && (token[0] == '+' || token[0] == '-'))
  {
    digits_start = 1;
  }
  if (digits_start == token.size())
  {
    return std::nullopt;
  }
  for (size_t i = digits_start; i < token.size(); i++)
  {
    if (token[i] < '0' || token[i] > '9')
    {
      return std::nullopt;
    }
  }

  errno = 0;
  long long value = std::strtoll(token.c_str(), nullptr, 10);
  if (errno == ERANGE || value < INT_MIN || value > INT_MAX)
  {
    return std::nullopt;
  }
  return std::optional{static_cast<int>(value)};
}

int decode_utf8(const std::string &line, size_t i, unsigned int &code_point)
{
  unsigned char c = line[i];
  int continuation;
  if (c < 0x80)
  {
    code_point = c;
    return 1;
  }
  else if ((c & 0xE0) == 0xC0)
  {
    continuation = 1;
    code_point = c & 0x1F;
  }
  else if ((c & 0xF0) == 0xE0)
  {
    continuation = 2;
    code_point = c & 0x0F;
  }
  else if ((c & 0xF8) == 0xF0)
  {
    continuation = 3;
    code_point = c & 0x07;
  }
  else
  {
    return 0;
  }

  if (i + continuation >= line.size())
  {
    return 0;
  }
  for (int j = 1; j <= continuation; j++)
  {
    unsigned char next = line[i + j];
    if ((next & 0xC0) != 0x80)
    {
      return 0;
    }
    code_point = (code_point << 6) | (next & 0x3F);
  }

  // overlong encodings, surrogates and values past U+10FFFF
  const unsigned int min_for_length[] = {0, 0x80, 0x800, 0x10000};
  if (code_point < min_for_length[continuation] || (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF)
  {
    return 0;
  }
  return continuation + 1;
}

bool is_unicode_whitespace(unsigned int code_point)
{
  return (code_point >= 0x09 && code_point <= 0x0D) || code_point == 0x20 || code_point == 0x85 || code_point == 0xA0 || code_point == 0x1680 || (code_point >= 0x2000 && code_point <= 0x200A) || code_point == 0x2028 || code_point == 0x2029 || code_point == 0x202F || code_point == 0x205F || code_point == 0x3000;
}

std::optional<std::vector<std::string>> split_whitespace(const std::string &line)
{
  std::vector<std::string> tokens;
  std::string token;
  size_t i = 0;
  while (i < line.size())
  {
    unsigned int code_point;
    int length = decode_utf8(line, i, code_point);
    if (length == 0)
    {
      return std::nullopt;
    }

    if (is_unicode_whitespace(code_point))
    {
      if (!token.empty())
      {
        tokens.push_back(std::move(token));
        token.clear();
      }
    }
    else
    {
      token.append(line, i, length);
    }
    i += length;
  }
  if (!token.empty())
  {
    tokens.push_back(std::move(token));
  }
  return std::optional{std::move(tokens)};
}

std::optional<std::pair<int, int>> parse_line(const std::string &line)
{
  std::optional<std::vector<std::string>> tokens = split_whitespace(line);
  if (!tokens.has_value())
  {
    return std::nullopt;
  }

  std::vector<int> numbers;
  for (const std::string &token : *tokens)
  {
    std::optional<int> value = parse_int(token);
    if (value.has_value())
    {
      numbers.push_back(*value);
    }
  }

  if (numbers.size() != 2)
  {
    return std::nullopt;
  }
  return std::optional{std::make_pair(numbers.at(0), numbers.at(1))};
}

std::optional<Columns> read_columns(std::istream &in)
{
  std::vector<int> left, right;
  std::string line;
  int line_number = 0;
  while (std::getline(in, line))
  {
    line_number++;
    std::optional<std::pair<int, int>> pair = parse_line(line);
    if (!pair.has_value())
    {
      DEBUG(3, "skipping line " << line_number);
      continue;
    }
    left.push_back(pair->first);
    right.push_back(pair->second);
  }

  if (in.bad())
  {
    return std::nullopt;
  }

  DEBUG(2, "read " << left.size() << " rows, skipped " << line_number - left.size());
  print_vector(str_for_side(Side::Left), left);
  print_vector(str_for_side(Side::Right), right);

  return std::optional{Columns(std::move(left), std::move(right))};
}

std::optional<Columns> read_columns_from_file(const std::string &path)
{
  errno = 0;
  std::ifstream file(path);
  if (!file.is_open())
  {
    std::cerr << "Could not open file " << path;
    if (errno != 0)
    {
      std::cerr << ": " << std::strerror(errno);
    }
    std::cerr << std::endl;
    return std::nullopt;
  }

  std::optional<Columns> columns = read_columns(file);
  if (!columns.has_value())
  {
    std::cerr << "Could not read file " << path << std::endl;
  }
  return columns;
}
