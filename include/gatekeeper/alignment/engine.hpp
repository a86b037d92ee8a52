#pragma once

#include <gatekeeper/alignment/aggregator.hpp>
#include <gatekeeper/alignment/registry.hpp>
#include <gatekeeper/alignment/runner.hpp>
#include <gatekeeper/alignment/statistics.hpp>
#include <gatekeeper/schema/alignment_verdict.hpp>
#include <gatekeeper/schema/engine_statistics.hpp>
#include <gatekeeper/schema/parameter_bundle.hpp>
#include <gatekeeper/schema/policy_config.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace gatekeeper::alignment {

/// Pre-execution alignment gate.
///
/// The engine resolves the parameter set bound to an operation type, runs all
/// of its checks concurrently, aggregates their results under the configured
/// policy and updates its running statistics. It is the only entry point for
/// callers: individual checks are never reachable on their own.
///
/// validate() may be called from several threads at once.
class engine final {
 public:
  /// Construct the engine from an already validated registry.
  ///
  /// `policy` is fixed for the engine's lifetime. `check_timeout` bounds each
  /// predicate (milliseconds, 0 disables the deadline).
  explicit engine(
      registry checks,
      schema::policy_config_t policy = {},
      schema::duration_milliseconds_t check_timeout = kDefaultCheckTimeout);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Evaluate one operation and return the complete verdict.
  ///
  /// Throws configuration_error when `operation_type` is not registered; in
  /// that case no statistics are recorded. Predicate faults never escape:
  /// they are reported inside the verdict.
  schema::alignment_verdict_t validate(std::string_view operation_type,
                                       const schema::parameter_bundle& params);

  /// Snapshot of cumulative and per-operation-type counters.
  schema::engine_statistics_t statistics() const;

  const schema::policy_config_t& policy() const;

  std::vector<schema::operation_type_t> operation_types() const;

  /// Swap in a new registry as a whole.
  ///
  /// Calls already in flight finish against the registry they resolved.
  void replace_registry(registry checks);

 private:
  std::shared_ptr<const registry> current_registry() const;

  mutable std::mutex registry_mutex_;
  std::shared_ptr<const registry> registry_;
  aggregator aggregator_;
  check_runner runner_;
  statistics_store statistics_;
};

}  // namespace gatekeeper::alignment
