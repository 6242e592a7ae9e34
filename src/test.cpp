#include <climits>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include "distance.hpp"
#include "parts.hpp"
#include "read_columns.hpp"
#include "similarity.hpp"

const std::string example_input = "3   4\n4 3\n2 5\n1 3\n3 9\n3 3\n";

class TempFile
{
public:
  std::string path;

  TempFile(const std::string &name, const std::string &contents)
      : path((std::filesystem::temp_directory_path() / name).string())
  {
    std::ofstream file(path);
    file << contents;
  }

  ~TempFile()
  {
    std::remove(path.c_str());
  }
};

// Serves its contents once, then fails like a device error
class FailingBuffer : public std::streambuf
{
public:
  FailingBuffer(const std::string &contents) : contents(contents), served(false){};

protected:
  int_type underflow() override
  {
    if (served)
    {
      throw std::runtime_error("device error");
    }
    served = true;
    setg(&contents[0], &contents[0], &contents[0] + contents.size());
    return traits_type::to_int_type(contents[0]);
  }

private:
  std::string contents;
  bool served;
};

TEST_CASE("read_columns - concrete example")
{
  std::istringstream in(example_input);
  std::optional<Columns> columns = read_columns(in);

  REQUIRE(columns.has_value());
  REQUIRE(columns->at(Side::Left) == std::vector<int>{3, 4, 2, 1, 3, 3});
  REQUIRE(columns->at(Side::Right) == std::vector<int>{4, 3, 5, 3, 9, 3});
  REQUIRE(calculate_total_distance(columns->at(Side::Left), columns->at(Side::Right)) == 11);
  REQUIRE(calculate_similarity_score(columns->at(Side::Left), columns->at(Side::Right)) == 31);
}

TEST_CASE("read_columns - malformed lines are dropped")
{
  std::istringstream in("3 4\nnotanumber\n5\n1 2 3\n");
  std::optional<Columns> columns = read_columns(in);

  REQUIRE(columns.has_value());
  REQUIRE(*columns == Columns(std::vector<int>{3}, std::vector<int>{4}));
}

TEST_CASE("read_columns - empty input")
{
  std::istringstream in("");
  std::optional<Columns> columns = read_columns(in);

  REQUIRE(columns.has_value());
  REQUIRE(columns->at(Side::Left).empty());
  REQUIRE(columns->at(Side::Right).empty());
}

TEST_CASE("read_columns - windows line endings and missing final newline")
{
  std::istringstream in("10 20\r\n-5 +7");
  std::optional<Columns> columns = read_columns(in);

  REQUIRE(columns.has_value());
  REQUIRE(*columns == Columns(std::vector<int>{10, -5}, std::vector<int>{20, 7}));
}

TEST_CASE("parse_line - counts integers after filtering")
{
  REQUIRE(parse_line("1 2") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("  \t1\t\t2  ") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("a 1 b 2 c") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("1 x") == std::nullopt);
  REQUIRE(parse_line("1 2 3") == std::nullopt);
  REQUIRE(parse_line("1 2.5 3") == std::optional{std::make_pair(1, 3)});
  REQUIRE(parse_line("") == std::nullopt);
  REQUIRE(parse_line("   ") == std::nullopt);
}

TEST_CASE("parse_line - invalid utf-8 drops the line")
{
  REQUIRE(parse_line("1 2 \xff") == std::nullopt);
  REQUIRE(parse_line("1 2 \xc3") == std::nullopt);
  REQUIRE(parse_line("1 2 \xc3\xa9") == std::optional{std::make_pair(1, 2)});
}

TEST_CASE("parse_line - unicode whitespace separates tokens")
{
  REQUIRE(parse_line("1\xc2\xa0" "2") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("1\xe3\x80\x80" "2") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("1\xc2\x85" "2") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("1\xe2\x80\x83" "2\xe2\x80\xaf") == std::optional{std::make_pair(1, 2)});
  REQUIRE(parse_line("1\v2\f") == std::optional{std::make_pair(1, 2)});
  // U+200B is not whitespace, so "1<ZWSP>2" is one token that is not an integer
  REQUIRE(parse_line("1\xe2\x80\x8b" "2 3") == std::nullopt);
}

TEST_CASE("split_whitespace - tokens keep their bytes")
{
  std::optional<std::vector<std::string>> tokens = split_whitespace("  a\xc3\xa9\xe3\x80\x80" "b  c ");
  REQUIRE(tokens.has_value());
  REQUIRE(*tokens == std::vector<std::string>{"a\xc3\xa9", "b", "c"});
  REQUIRE(split_whitespace("a \xe3\x80") == std::nullopt);
  REQUIRE(split_whitespace("\xed\xa0\x80") == std::nullopt);
  REQUIRE(split_whitespace("\xc0\xaf") == std::nullopt);
}

TEST_CASE("parse_int - accepted and rejected tokens")
{
  REQUIRE(parse_int("0") == 0);
  REQUIRE(parse_int("-17") == -17);
  REQUIRE(parse_int("+17") == 17);
  REQUIRE(parse_int("007") == 7);
  REQUIRE(parse_int("2147483647") == INT_MAX);
  REQUIRE(parse_int("-2147483648") == INT_MIN);

  REQUIRE(parse_int("2147483648") == std::nullopt);
  REQUIRE(parse_int("-2147483649") == std::nullopt);
  REQUIRE(parse_int("99999999999999999999999") == std::nullopt);
  REQUIRE(parse_int("") == std::nullopt);
  REQUIRE(parse_int("-") == std::nullopt);
  REQUIRE(parse_int("+") == std::nullopt);
  REQUIRE(parse_int("1.5") == std::nullopt);
  REQUIRE(parse_int("0x10") == std::nullopt);
  REQUIRE(parse_int("3,") == std::nullopt);
  REQUIRE(parse_int("--3") == std::nullopt);
}

TEST_CASE("read_columns_from_file - reads a file")
{
  TempFile file("list_distance_test_input.txt", example_input);
  std::optional<Columns> columns = read_columns_from_file(file.path);

  REQUIRE(columns.has_value());
  REQUIRE(columns->at(Side::Left).size() == 6);
  REQUIRE(columns->at(Side::Right).size() == 6);
}

TEST_CASE("read_columns_from_file - missing file")
{
  std::string path = (std::filesystem::temp_directory_path() / "list_distance_test_does_not_exist.txt").string();
  std::remove(path.c_str());

  std::ostringstream errors;
  auto cerr_buf = std::cerr.rdbuf(errors.rdbuf());
  std::optional<Columns> columns = read_columns_from_file(path);
  std::cerr.rdbuf(cerr_buf);

  REQUIRE(columns == std::nullopt);
  REQUIRE(errors.str().rfind("Could not open file " + path, 0) == 0);
}

TEST_CASE("read_columns - read error discards rows already read")
{
  FailingBuffer buffer("1 2\n3 4\n");
  std::istream in(&buffer);

  REQUIRE(read_columns(in) == std::nullopt);
}

TEST_CASE("read_columns_from_file - read error")
{
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "list_distance_test_dir";
  std::filesystem::create_directories(dir);

  std::ostringstream errors;
  auto cerr_buf = std::cerr.rdbuf(errors.rdbuf());
  std::optional<Columns> columns = read_columns_from_file(dir.string());
  std::cerr.rdbuf(cerr_buf);
  std::filesystem::remove(dir);

  REQUIRE(columns == std::nullopt);
  REQUIRE(errors.str().find("Could not") == 0);
}

TEST_CASE("calculate_total_distance - symmetric and order independent")
{
  std::vector<int> left{3, 4, 2, 1, 3, 3};
  std::vector<int> right{4, 3, 5, 3, 9, 3};
  std::vector<int> left_reordered{1, 3, 3, 4, 2, 3};
  std::vector<int> right_reordered{9, 3, 3, 3, 5, 4};

  REQUIRE(calculate_total_distance(left, right) == 11);
  REQUIRE(calculate_total_distance(right, left) == 11);
  REQUIRE(calculate_total_distance(left_reordered, right_reordered) == 11);
}

TEST_CASE("calculate_total_distance - permutations are at distance zero")
{
  REQUIRE(calculate_total_distance({5, -1, 7, 7}, {7, 5, 7, -1}) == 0);
  REQUIRE(calculate_total_distance({}, {}) == 0);
}

TEST_CASE("calculate_total_distance - pairs up to the shorter column")
{
  REQUIRE(calculate_total_distance({1, 2, 3}, {4}) == 3);
  REQUIRE(calculate_total_distance({10}, {}) == 0);
}

TEST_CASE("calculate_total_distance - no overflow at the limits of int")
{
  REQUIRE(calculate_total_distance({INT_MIN}, {INT_MAX}) == 4294967295LL);
  REQUIRE(calculate_total_distance({INT_MIN, INT_MIN}, {INT_MAX, INT_MAX}) == 2 * 4294967295LL);
}

TEST_CASE("calculate_similarity_score - concrete examples")
{
  REQUIRE(calculate_similarity_score({3, 4, 2, 1, 3, 3}, {4, 3, 5, 3, 9, 3}) == 31);
  REQUIRE(calculate_similarity_score({1, 2, 3}, {}) == 0);
  REQUIRE(calculate_similarity_score({}, {1, 2, 3}) == 0);
  REQUIRE(calculate_similarity_score({-2, 5}, {-2, -2, 5}) == 1);
  REQUIRE(calculate_similarity_score({2000000000}, {2000000000, 2000000000}) == 4000000000LL);
}

TEST_CASE("calculate_similarity_score - overflow is reported")
{
  std::vector<int> large(70000, INT_MAX);

  REQUIRE(calculate_similarity_score(large, large) == std::nullopt);
  REQUIRE(calculate_similarity_score({INT_MAX}, large) == static_cast<std::int64_t>(INT_MAX) * 70000);
  REQUIRE(calculate_similarity_score({INT_MIN, INT_MIN}, {INT_MIN}) == 2 * static_cast<std::int64_t>(INT_MIN));
}

TEST_CASE("part1 and part2 - print labeled results")
{
  TempFile file("list_distance_test_parts.txt", example_input);

  std::ostringstream out_1, out_2;
  REQUIRE(part1(file.path, out_1));
  REQUIRE(part2(file.path, out_2));
  REQUIRE(out_1.str() == "Total distance: 11\n");
  REQUIRE(out_2.str() == "Similarity score: 31\n");
}

TEST_CASE("part1 and part2 - missing file")
{
  std::string path = (std::filesystem::temp_directory_path() / "list_distance_test_no_parts.txt").string();
  std::remove(path.c_str());

  std::ostringstream out;
  REQUIRE(!part1(path, out));
  REQUIRE(!part2(path, out));
  REQUIRE(out.str().empty());
}
