#include <algorithm>
#include <gatekeeper/alignment/aggregator.hpp>
#include <gatekeeper/alignment/errors.hpp>
#include <iterator>
#include <string>

namespace {

constexpr auto kCriticalWeight = uint64_t{2};
constexpr auto kNonCriticalWeight = uint64_t{1};
constexpr auto kHighRiskBelow = uint32_t{70};
constexpr auto kMediumRiskBelow = uint32_t{85};

uint32_t count_failed(const std::vector<gatekeeper::schema::check_result_t>& results,
                      const bool critical) {
  return static_cast<uint32_t>(std::count_if(
      std::begin(results), std::end(results),
      [&](const gatekeeper::schema::check_result_t& result) {
        return result.critical == critical && !result.passed;
      }));
}

gatekeeper::schema::failure_entry_t make_failure_entry(
    const gatekeeper::schema::check_result_t& result) {
  return gatekeeper::schema::failure_entry_t{
      .name = result.name,
      .display_name = result.display_name,
      .category = result.category,
      .failure_kind = result.failure_kind,
      .message = result.message,
      .error = result.error};
}

}  // namespace

namespace gatekeeper::alignment {

uint32_t calculate_confidence(
    const std::vector<schema::check_result_t>& results) {
  if (results.empty()) {
    return 0;
  }
  auto weighted_sum = uint64_t{};
  auto total_weight = uint64_t{};
  for (const auto& result : results) {
    const auto weight = result.critical ? kCriticalWeight : kNonCriticalWeight;
    total_weight += weight;
    if (result.passed) {
      weighted_sum += weight * result.confidence;
    }
  }
  // round(sum / weight) with halves rounded up, in integers.
  return static_cast<uint32_t>((2 * weighted_sum + total_weight) /
                               (2 * total_weight));
}

schema::risk_level_t assess_risk(
    const std::vector<schema::check_result_t>& results,
    const uint32_t confidence) {
  if (count_failed(results, true) > 0) {
    return schema::risk_level_t::critical;
  }
  if (confidence < kHighRiskBelow) {
    return schema::risk_level_t::high;
  }
  if (confidence < kMediumRiskBelow) {
    return schema::risk_level_t::medium;
  }
  return schema::risk_level_t::low;
}

schema::failure_summary_t summarize_failures(
    const std::vector<schema::check_result_t>& results,
    const uint32_t confidence,
    const schema::policy_config_t& policy) {
  auto summary = schema::failure_summary_t{};
  for (const auto& result : results) {
    if (result.passed) {
      continue;
    }
    if (result.critical) {
      summary.critical_failures.push_back(make_failure_entry(result));
    } else {
      summary.non_critical_failures.push_back(make_failure_entry(result));
    }
  }

  if (!summary.critical_failures.empty()) {
    summary.policy_violations.push_back(
        std::to_string(summary.critical_failures.size()) +
        " critical check(s) failed");
  }
  if (confidence < policy.minimum_confidence) {
    summary.policy_violations.push_back(
        "confidence " + std::to_string(confidence) + "% is below minimum " +
        std::to_string(policy.minimum_confidence) + "%");
  }
  if (summary.non_critical_failures.size() > policy.max_non_critical_failures) {
    summary.policy_violations.push_back(
        std::to_string(summary.non_critical_failures.size()) +
        " non-critical failure(s) exceed budget of " +
        std::to_string(policy.max_non_critical_failures));
  }
  return summary;
}

aggregator::aggregator(schema::policy_config_t policy) : policy_{policy} {
  if (policy_.minimum_confidence > 100) {
    throw configuration_error{"minimum confidence " +
                              std::to_string(policy_.minimum_confidence) +
                              " outside [0, 100]"};
  }
}

const schema::policy_config_t& aggregator::policy() const {
  return policy_;
}

bool aggregator::is_allowed(const std::vector<schema::check_result_t>& results,
                            const uint32_t confidence) const {
  const auto critical_pass = count_failed(results, true) == 0;
  const auto confident = confidence >= policy_.minimum_confidence;
  const auto within_budget =
      count_failed(results, false) <= policy_.max_non_critical_failures;
  return critical_pass && confident && within_budget;
}

aggregation_t aggregator::aggregate(
    const std::vector<schema::check_result_t>& results) const {
  auto out = aggregation_t{};
  out.confidence = calculate_confidence(results);
  out.risk_level = assess_risk(results, out.confidence);
  // An empty result list carries no evidence and is never allowed.
  out.allowed = !results.empty() && is_allowed(results, out.confidence);
  if (!out.allowed) {
    out.failure_summary = summarize_failures(results, out.confidence, policy_);
  }
  return out;
}

}  // namespace gatekeeper::alignment
