#pragma once

#include <gatekeeper/schema/check_result.hpp>
#include <gatekeeper/schema/failure_summary.hpp>
#include <gatekeeper/schema/policy_config.hpp>
#include <gatekeeper/schema/risk_level.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace gatekeeper::alignment {

struct aggregation final {
  uint32_t confidence{};
  schema::risk_level_t risk_level{schema::risk_level_t::low};
  bool allowed{false};
  std::optional<schema::failure_summary_t> failure_summary;
};

using aggregation_t = aggregation;

/// Weighted average of passed confidences; critical checks weigh 2.
///
/// Rounded half up. Returns 0 for an empty result list.
uint32_t calculate_confidence(const std::vector<schema::check_result_t>& results);

/// CRITICAL on any failed critical check, then HIGH below 70, MEDIUM below 85.
schema::risk_level_t assess_risk(
    const std::vector<schema::check_result_t>& results,
    uint32_t confidence);

/// Every failing check, critical first, plus the violated policy rules.
schema::failure_summary_t summarize_failures(
    const std::vector<schema::check_result_t>& results,
    uint32_t confidence,
    const schema::policy_config_t& policy);

/// Turns raw check results into the allow decision under one policy.
class aggregator final {
 public:
  /// Throws configuration_error when minimum_confidence exceeds 100.
  explicit aggregator(schema::policy_config_t policy = {});

  aggregation_t aggregate(
      const std::vector<schema::check_result_t>& results) const;

  /// Critical unanimity, confidence floor and non-critical failure budget.
  bool is_allowed(const std::vector<schema::check_result_t>& results,
                  uint32_t confidence) const;

  const schema::policy_config_t& policy() const;

 private:
  schema::policy_config_t policy_;
};

}  // namespace gatekeeper::alignment
