#pragma once

#include <gatekeeper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: failure kind.
// Alignment workflow: separates a predicate that evaluated to false from a
// predicate that faulted (threw or timed out).
namespace gatekeeper::schema {

enum class failure_kind_t : uint8_t {
  none = 0,
  predicate_failed = 1,
  predicate_error = 2,
};

inline constexpr auto kFailureKindMappings = std::array{
    std::pair<std::string_view, failure_kind_t>{"none", failure_kind_t::none},
    std::pair<std::string_view, failure_kind_t>{
        "predicate_failed", failure_kind_t::predicate_failed},
    std::pair<std::string_view, failure_kind_t>{
        "predicate_error", failure_kind_t::predicate_error}};

inline constexpr std::string_view to_string(const failure_kind_t value) {
  return to_string(value, kFailureKindMappings).value_or("unknown");
}

}  // namespace gatekeeper::schema
