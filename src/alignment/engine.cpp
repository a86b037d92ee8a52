#include <spdlog/spdlog.h>
#include <chrono>
#include <gatekeeper/alignment/engine.hpp>
#include <gatekeeper/schema/risk_level.hpp>
#include <string>
#include <utility>

namespace {

using steady_clock_t = std::chrono::steady_clock;

void count_results(gatekeeper::schema::alignment_verdict_t& verdict) {
  for (const auto& result : verdict.results) {
    if (result.passed) {
      ++verdict.passed_count;
    } else {
      ++verdict.failed_count;
    }
    if (!result.critical) {
      continue;
    }
    ++verdict.critical_total;
    if (result.passed) {
      ++verdict.critical_passed;
    } else {
      ++verdict.critical_failed;
    }
  }
}

}  // namespace

namespace gatekeeper::alignment {

engine::engine(registry checks,
               schema::policy_config_t policy,
               const schema::duration_milliseconds_t check_timeout)
    : registry_{std::make_shared<const registry>(std::move(checks))},
      aggregator_{policy},
      runner_{check_timeout} {
  for (const auto& operation_type : registry_->operation_types()) {
    statistics_.track(operation_type);
  }
  spdlog::info(
      "Alignment engine ready with {} parameter set(s); minimum confidence "
      "{}%, non-critical failure budget {}, check timeout {} ms",
      registry_->size(), aggregator_.policy().minimum_confidence,
      aggregator_.policy().max_non_critical_failures,
      runner_.check_timeout());
}

schema::alignment_verdict_t engine::validate(
    const std::string_view operation_type,
    const schema::parameter_bundle& params) {
  const auto started = steady_clock_t::now();
  auto verdict = schema::alignment_verdict_t{};
  verdict.timestamp = schema::now_milliseconds();

  // Keep the registry alive for the whole call even if it is replaced.
  const auto checks = current_registry();
  const auto& parameter_set = checks->lookup(operation_type);
  spdlog::debug("Starting alignment validation for '{}' ({} check(s))",
                operation_type, parameter_set.checks.size());

  verdict.operation_type = parameter_set.operation_type;
  verdict.results = runner_.run(parameter_set.checks, params);
  count_results(verdict);

  auto aggregation = aggregator_.aggregate(verdict.results);
  verdict.confidence = aggregation.confidence;
  verdict.risk_level = aggregation.risk_level;
  verdict.allowed = aggregation.allowed;
  verdict.failure_summary = std::move(aggregation.failure_summary);
  verdict.total_elapsed = static_cast<schema::duration_microseconds_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          steady_clock_t::now() - started)
          .count());

  statistics_.record(verdict.operation_type, verdict.allowed);

  if (verdict.allowed) {
    spdlog::debug("'{}' aligned: {}/{} passed, confidence {}%, risk {}",
                  verdict.operation_type, verdict.passed_count,
                  verdict.results.size(), verdict.confidence,
                  schema::to_string(verdict.risk_level));
  } else {
    spdlog::warn(
        "'{}' rejected: {}/{} failed ({} critical), confidence {}%, risk {}",
        verdict.operation_type, verdict.failed_count, verdict.results.size(),
        verdict.critical_failed, verdict.confidence,
        schema::to_string(verdict.risk_level));
  }
  return verdict;
}

schema::engine_statistics_t engine::statistics() const {
  return statistics_.snapshot();
}

const schema::policy_config_t& engine::policy() const {
  return aggregator_.policy();
}

std::vector<schema::operation_type_t> engine::operation_types() const {
  return current_registry()->operation_types();
}

void engine::replace_registry(registry checks) {
  auto replacement = std::make_shared<const registry>(std::move(checks));
  for (const auto& operation_type : replacement->operation_types()) {
    statistics_.track(operation_type);
  }
  {
    auto lock = std::scoped_lock{registry_mutex_};
    registry_ = std::move(replacement);
  }
  spdlog::info("Alignment registry replaced; {} parameter set(s) active",
               current_registry()->size());
}

std::shared_ptr<const registry> engine::current_registry() const {
  auto lock = std::scoped_lock{registry_mutex_};
  return registry_;
}

}  // namespace gatekeeper::alignment
