#pragma once

#include <gatekeeper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: risk level.
// Alignment workflow: coarse classification derived from the aggregate
// confidence and the presence of failed critical checks.
namespace gatekeeper::schema {

enum class risk_level_t : uint8_t {
  low = 0,
  medium = 1,
  high = 2,
  critical = 3,
};

inline constexpr auto kRiskLevelMappings =
    std::array{std::pair<std::string_view, risk_level_t>{"LOW", risk_level_t::low},
               std::pair<std::string_view, risk_level_t>{"MEDIUM",
                                                         risk_level_t::medium},
               std::pair<std::string_view, risk_level_t>{"HIGH",
                                                         risk_level_t::high},
               std::pair<std::string_view, risk_level_t>{
                   "CRITICAL", risk_level_t::critical}};

template <>
inline std::optional<risk_level_t> try_from_string<risk_level_t>(
    const std::string_view value) {
  return from_string(value, kRiskLevelMappings);
}

inline constexpr std::string_view to_string(const risk_level_t value) {
  return to_string(value, kRiskLevelMappings).value_or("UNKNOWN");
}

}  // namespace gatekeeper::schema
