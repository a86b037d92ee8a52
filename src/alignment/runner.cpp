#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <future>
#include <gatekeeper/alignment/errors.hpp>
#include <gatekeeper/alignment/runner.hpp>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace {

using steady_clock_t = std::chrono::steady_clock;

gatekeeper::schema::duration_microseconds_t elapsed_since(
    const steady_clock_t::time_point started) {
  return static_cast<gatekeeper::schema::duration_microseconds_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          steady_clock_t::now() - started)
          .count());
}

gatekeeper::schema::check_result_t make_result(
    const gatekeeper::alignment::check_t& check) {
  auto result = gatekeeper::schema::check_result_t{};
  result.name = check.name;
  result.display_name =
      check.display_name.empty() ? check.name : check.display_name;
  result.category = check.category;
  result.critical = check.critical;
  result.confidence = check.confidence;
  return result;
}

// Workers detached at the deadline can outlive spdlog::shutdown(), which
// drops the default logger.
template <typename... Args>
void log_check(const spdlog::level::level_enum level,
               spdlog::format_string_t<Args...> format,
               Args&&... args) {
  if (auto logger = spdlog::default_logger()) {
    logger->log(level, format, std::forward<Args>(args)...);
  }
}

// Workers own copies of everything they touch, so the ones still running
// when the runner unwinds are released rather than waited on.
class detach_guard final {
 public:
  explicit detach_guard(std::vector<std::thread>& workers)
      : workers_{workers} {}
  detach_guard(const detach_guard&) = delete;
  detach_guard& operator=(const detach_guard&) = delete;

  ~detach_guard() {
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.detach();
      }
    }
  }

 private:
  std::vector<std::thread>& workers_;
};

}  // namespace

namespace gatekeeper::alignment {

check_runner::check_runner(const schema::duration_milliseconds_t check_timeout)
    : check_timeout_{check_timeout} {
  if (check_timeout_ > kMaxCheckTimeout) {
    throw configuration_error{fmt::format(
        "check timeout of {} ms exceeds the maximum of {} ms", check_timeout_,
        kMaxCheckTimeout)};
  }
}

schema::duration_milliseconds_t check_runner::check_timeout() const {
  return check_timeout_;
}

std::vector<schema::check_result_t> check_runner::run(
    const std::vector<check_t>& checks,
    const schema::parameter_bundle& params) const {
  if (checks.empty()) {
    throw configuration_error{"cannot run a parameter set with no checks"};
  }

  auto shared_params = std::make_shared<const schema::parameter_bundle>(params);
  auto futures = std::vector<std::future<schema::check_result_t>>{};
  auto workers = std::vector<std::thread>{};
  futures.reserve(checks.size());
  workers.reserve(checks.size());
  auto guard = detach_guard{workers};

  spdlog::debug("Firing {} alignment check(s) in parallel", checks.size());
  for (const auto& check : checks) {
    auto task = std::packaged_task<schema::check_result_t()>{
        [check, shared_params] { return detail::evaluate_check(check, *shared_params); }};
    futures.push_back(task.get_future());
    workers.emplace_back(std::move(task));
  }

  const auto deadline =
      steady_clock_t::now() + std::chrono::milliseconds{check_timeout_};
  auto results = std::vector<schema::check_result_t>{};
  results.reserve(checks.size());
  for (std::size_t i = 0; i < checks.size(); ++i) {
    if (check_timeout_ == 0 ||
        futures[i].wait_until(deadline) == std::future_status::ready) {
      workers[i].join();
      results.push_back(futures[i].get());
      continue;
    }

    workers[i].detach();
    spdlog::warn("Alignment check '{}' did not finish within {} ms",
                 checks[i].name, check_timeout_);
    auto timed_out = make_result(checks[i]);
    timed_out.passed = false;
    timed_out.failure_kind = schema::failure_kind_t::predicate_error;
    timed_out.error = "timeout";
    timed_out.elapsed = check_timeout_ * 1000;
    results.push_back(std::move(timed_out));
  }
  return results;
}

namespace detail {

schema::check_result_t evaluate_check(const check_t& check,
                                      const schema::parameter_bundle& params) {
  auto result = make_result(check);
  auto outcome = std::optional<check_outcome_t>{};

  const auto started = steady_clock_t::now();
  try {
    outcome = check.predicate(params);
  } catch (const std::exception& ex) {
    result.error = ex.what();
  } catch (...) {
    result.error = "unknown exception";
  }
  result.elapsed = elapsed_since(started);

  if (!outcome) {
    result.passed = false;
    result.failure_kind = schema::failure_kind_t::predicate_error;
    log_check(spdlog::level::err, "Alignment check '{}' raised: {}",
              check.name, *result.error);
    return result;
  }

  result.passed = outcome->passed;
  result.failure_kind = result.passed ? schema::failure_kind_t::none
                                      : schema::failure_kind_t::predicate_failed;
  if (!check.describe) {
    return result;
  }
  // A failing describe only costs the message.
  try {
    result.message = check.describe(result.passed, params, outcome->scratch);
  } catch (const std::exception& ex) {
    log_check(spdlog::level::debug,
              "Describe step of alignment check '{}' failed: {}", check.name,
              ex.what());
  } catch (...) {
    log_check(spdlog::level::debug,
              "Describe step of alignment check '{}' failed", check.name);
  }
  return result;
}

}  // namespace detail

}  // namespace gatekeeper::alignment
