#pragma once

#include <gatekeeper/schema/primitives.hpp>

#include <cstdint>
#include <map>

namespace gatekeeper::schema {

struct operation_counters final {
  uint64_t total{};
  uint64_t passed{};
  uint64_t failed{};
};

using operation_counters_t = operation_counters;

template <uint16_t Version>
struct engine_statistics;

/// Point-in-time copy of the engine's running counters.
template <>
struct engine_statistics<1> final {
  uint16_t version{1};
  uint64_t total_operations{};
  uint64_t passed_operations{};
  uint64_t failed_operations{};
  std::map<operation_type_t, operation_counters_t> by_operation_type;
};

using engine_statistics_t = engine_statistics<1>;

}  // namespace gatekeeper::schema
