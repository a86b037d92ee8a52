#pragma once

#include <gatekeeper/alignment/check.hpp>
#include <gatekeeper/alignment/runner.hpp>
#include <gatekeeper/schema/check_result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace gatekeeper::testing {

inline alignment::check_t make_check(const std::string& name,
                                     const bool critical,
                                     const uint32_t confidence,
                                     const bool passes) {
  return alignment::check_t{
      .name = name,
      .display_name = name,
      .category = "Test",
      .critical = critical,
      .confidence = confidence,
      .predicate =
          [passes](const schema::parameter_bundle&) {
            return alignment::check_outcome_t{.passed = passes};
          },
      .describe = {}};
}

inline alignment::check_t make_sleeping_check(
    const std::string& name,
    const std::chrono::milliseconds delay) {
  auto check = make_check(name, false, 100, true);
  check.predicate = [delay](const schema::parameter_bundle&) {
    std::this_thread::sleep_for(delay);
    return alignment::check_outcome_t{.passed = true};
  };
  return check;
}

inline schema::check_result_t make_result(const std::string& name,
                                          const bool critical,
                                          const uint32_t confidence,
                                          const bool passed) {
  auto result = schema::check_result_t{};
  result.name = name;
  result.display_name = name;
  result.category = "Test";
  result.critical = critical;
  result.confidence = confidence;
  result.passed = passed;
  result.failure_kind = passed ? schema::failure_kind_t::none
                               : schema::failure_kind_t::predicate_failed;
  return result;
}

// Evaluate the check called `name` out of a rule set.
inline schema::check_result_t evaluate_named(
    const std::vector<alignment::check_t>& checks,
    const std::string_view name,
    const schema::parameter_bundle& params) {
  for (const auto& check : checks) {
    if (check.name == name) {
      return alignment::detail::evaluate_check(check, params);
    }
  }
  throw std::invalid_argument{"no check named " + std::string{name}};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline std::string write_temp_file(const std::string_view prefix,
                                   const std::string_view content) {
  auto path = make_temp_path(prefix);
  auto file = std::ofstream{path, std::ios::binary};
  file << content;
  return path;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace gatekeeper::testing
