#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Small string measurements shared by the rule bodies.
namespace gatekeeper::rules {

/// Non-overlapping occurrences of `needle`; 0 for an empty needle.
std::size_t count_occurrences(std::string_view haystack, std::string_view needle);

std::size_t count_char(std::string_view text, char value);

/// Number of '\n'-separated lines; an empty string is one line.
std::size_t count_lines(std::string_view text);

/// 1-based line and 0-based column of a byte offset.
std::size_t line_of_offset(std::string_view text, std::size_t offset);
std::size_t column_of_offset(std::string_view text, std::size_t offset);

/// Count of leading whitespace characters (newlines included).
std::size_t leading_whitespace(std::string_view text);

std::string_view trim(std::string_view text);

bool contains(std::string_view text, std::string_view needle);

/// `part` as a percentage of `whole`; 100 when `whole` is 0 and `part` is not.
double percent_of(std::size_t part, std::size_t whole);

/// One decimal, e.g. "12.5".
std::string format_percent(double value);

}  // namespace gatekeeper::rules
