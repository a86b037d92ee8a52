#pragma once

#include <gatekeeper/schema/failure_kind.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gatekeeper::schema {

template <uint16_t Version>
struct check_result;

/// Outcome of one check within one validation call.
template <>
struct check_result<1> final {
  uint16_t version{1};
  std::string name;
  std::string display_name;
  std::string category;
  bool critical{false};
  uint32_t confidence{};
  bool passed{false};
  duration_microseconds_t elapsed{};
  std::optional<std::string> message;
  failure_kind_t failure_kind{failure_kind_t::none};
  std::optional<std::string> error;  // set for predicate_error only
};

using check_result_t = check_result<1>;

}  // namespace gatekeeper::schema
