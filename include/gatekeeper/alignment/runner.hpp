#pragma once

#include <gatekeeper/alignment/check.hpp>
#include <gatekeeper/schema/check_result.hpp>
#include <gatekeeper/schema/parameter_bundle.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <vector>

namespace gatekeeper::alignment {

inline constexpr auto kDefaultCheckTimeout = schema::duration_milliseconds_t{1000};
// One day. Larger values overflow the steady_clock deadline.
inline constexpr auto kMaxCheckTimeout =
    schema::duration_milliseconds_t{86'400'000};

/// Runs every check of a parameter set concurrently and joins on all of them.
///
/// Each check runs on its own worker. A predicate that throws becomes a
/// predicate_error result for that check alone; a predicate still running at
/// the deadline becomes predicate_error "timeout" and its worker is detached.
/// Results come back in registration order.
class check_runner final {
 public:
  /// `check_timeout` of 0 waits for every predicate without a deadline.
  /// Throws configuration_error above kMaxCheckTimeout.
  explicit check_runner(
      schema::duration_milliseconds_t check_timeout = kDefaultCheckTimeout);

  /// Throws configuration_error when `checks` is empty.
  std::vector<schema::check_result_t> run(
      const std::vector<check_t>& checks,
      const schema::parameter_bundle& params) const;

  schema::duration_milliseconds_t check_timeout() const;

 private:
  schema::duration_milliseconds_t check_timeout_;
};

namespace detail {

/// Evaluate one check on the calling thread. Worker body of check_runner.
schema::check_result_t evaluate_check(const check_t& check,
                                      const schema::parameter_bundle& params);

}  // namespace detail

}  // namespace gatekeeper::alignment
