#pragma once

#include <gatekeeper/schema/check_result.hpp>
#include <gatekeeper/schema/failure_summary.hpp>
#include <gatekeeper/schema/primitives.hpp>
#include <gatekeeper/schema/risk_level.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace gatekeeper::schema {

template <uint16_t Version>
struct alignment_verdict;

/// Complete output of one validation call.
///
/// `results` follow the parameter set's registration order.
/// `failure_summary` is present iff `allowed` is false.
template <>
struct alignment_verdict<1> final {
  uint16_t version{1};
  operation_type_t operation_type;
  timestamp_milliseconds_t timestamp{};
  duration_microseconds_t total_elapsed{};
  std::vector<check_result_t> results;
  uint32_t passed_count{};
  uint32_t failed_count{};
  uint32_t critical_total{};
  uint32_t critical_passed{};
  uint32_t critical_failed{};
  uint32_t confidence{};
  risk_level_t risk_level{risk_level_t::low};
  bool allowed{false};
  std::optional<failure_summary_t> failure_summary;
};

using alignment_verdict_t = alignment_verdict<1>;

}  // namespace gatekeeper::schema
