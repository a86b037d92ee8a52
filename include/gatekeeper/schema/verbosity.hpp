#pragma once

#include <gatekeeper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: report verbosity.
// Presentation only: how much of a verdict the text formatter renders.
namespace gatekeeper::schema {

enum class verbosity_t : uint8_t {
  silent = 0,
  summary = 1,
  full = 2,
};

inline constexpr auto kVerbosityMappings = std::array{
    std::pair<std::string_view, verbosity_t>{"silent", verbosity_t::silent},
    std::pair<std::string_view, verbosity_t>{"summary", verbosity_t::summary},
    std::pair<std::string_view, verbosity_t>{"full", verbosity_t::full}};

template <>
inline std::optional<verbosity_t> try_from_string<verbosity_t>(
    const std::string_view value) {
  return from_string(value, kVerbosityMappings);
}

inline constexpr std::string_view to_string(const verbosity_t value) {
  return to_string(value, kVerbosityMappings).value_or("unknown");
}

}  // namespace gatekeeper::schema
