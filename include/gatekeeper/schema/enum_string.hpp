#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name tables for the enums that appear in reports and CLI options. Each enum
// header declares a `k<Enum>Mappings` array; lookups are linear, the tables
// hold a handful of entries.
namespace gatekeeper::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "silent, summary or full": the accepted names, for option help and errors.
template <typename Enum, std::size_t N>
std::string accepted_names(const enum_mappings_t<Enum, N>& mappings) {
  auto names = std::string{};
  for (std::size_t i = 0; i < N; ++i) {
    if (i > 0) {
      names += i + 1 == N ? " or " : ", ";
    }
    names += mappings[i].first;
  }
  return names;
}

/// Parse a name read from the command line, the environment or a config file.
/// Enums that can be configured specialise this beside their mappings; the
/// rest never parse.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace gatekeeper::schema
