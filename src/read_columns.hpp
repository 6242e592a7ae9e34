#pragma once

#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "side.hpp"

typedef PerSide<std::vector<int>> Columns;

/** Parse a token as a signed 32-bit integer. The whole token must be consumed. */
std::optional<int> parse_int(const std::string &token);

/**
 * Decode the code point starting at byte i of line.
 * Returns its length in bytes, or 0 if the bytes are not well-formed UTF-8.
 */
int decode_utf8(const std::string &line, size_t i, unsigned int &code_point);

/** Code points with the Unicode White_Space property */
bool is_unicode_whitespace(unsigned int code_point);

/** Split a line on runs of Unicode whitespace. Returns nullopt for malformed UTF-8. */
std::optional<std::vector<std::string>> split_whitespace(const std::string &line);

/**
 * Extract the (left, right) pair of a line.
 *
 * Tokens which are not integers are skipped. The line yields a pair only if
 * exactly two integers remain, so "1 x 2" is accepted and "1 2 3" is not.
 */
std::optional<std::pair<int, int>> parse_line(const std::string &line);

/** Read all lines of a stream. Returns nullopt if the stream fails mid-read. */
std::optional<Columns> read_columns(std::istream &in);

std::optional<Columns> read_columns_from_file(const std::string &path);
