#include <gatekeeper/rules/text.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace gatekeeper::rules {

std::size_t count_occurrences(const std::string_view haystack,
                              const std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  auto count = std::size_t{};
  auto position = haystack.find(needle);
  while (position != std::string_view::npos) {
    ++count;
    position = haystack.find(needle, position + needle.size());
  }
  return count;
}

std::size_t count_char(const std::string_view text, const char value) {
  return static_cast<std::size_t>(
      std::count(std::begin(text), std::end(text), value));
}

std::size_t count_lines(const std::string_view text) {
  return count_char(text, '\n') + 1;
}

std::size_t line_of_offset(const std::string_view text,
                           const std::size_t offset) {
  return count_lines(text.substr(0, std::min(offset, text.size())));
}

std::size_t column_of_offset(const std::string_view text,
                             const std::size_t offset) {
  if (offset == 0 || text.empty()) {
    return 0;
  }
  const auto bounded = std::min(offset, text.size());
  const auto newline = text.rfind('\n', bounded - 1);
  if (newline == std::string_view::npos) {
    return bounded;
  }
  return bounded - newline - 1;
}

std::size_t leading_whitespace(const std::string_view text) {
  auto count = std::size_t{};
  while (count < text.size() &&
         std::isspace(static_cast<unsigned char>(text[count])) != 0) {
    ++count;
  }
  return count;
}

std::string_view trim(std::string_view text) {
  text.remove_prefix(leading_whitespace(text));
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool contains(const std::string_view text, const std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

double percent_of(const std::size_t part, const std::size_t whole) {
  if (whole == 0) {
    return part == 0 ? 0.0 : 100.0;
  }
  return (static_cast<double>(part) / static_cast<double>(whole)) * 100.0;
}

std::string format_percent(const double value) {
  return fmt::format("{:.1f}", value);
}

}  // namespace gatekeeper::rules
