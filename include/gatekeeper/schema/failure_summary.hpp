#pragma once

#include <gatekeeper/schema/failure_kind.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gatekeeper::schema {

struct failure_entry final {
  std::string name;
  std::string display_name;
  std::string category;
  failure_kind_t failure_kind{failure_kind_t::predicate_failed};
  std::optional<std::string> message;
  std::optional<std::string> error;
};

using failure_entry_t = failure_entry;

template <uint16_t Version>
struct failure_summary;

/// Why a verdict was denied, ordered critical failures first.
template <>
struct failure_summary<1> final {
  uint16_t version{1};
  std::vector<failure_entry_t> critical_failures;
  std::vector<failure_entry_t> non_critical_failures;
  std::vector<std::string> policy_violations;
};

using failure_summary_t = failure_summary<1>;

}  // namespace gatekeeper::schema
