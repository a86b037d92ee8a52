#include <gatekeeper/report/formatter.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <vector>

namespace {

constexpr auto kRuleWidth = std::size_t{80};

std::string rule() {
  return std::string(kRuleWidth, '=') + "\n";
}

std::string title_of(std::string_view operation_type) {
  auto title = std::string{operation_type};
  std::transform(std::begin(title), std::end(title), std::begin(title),
                 [](const char c) {
                   return c == '_' ? ' '
                                   : static_cast<char>(std::toupper(
                                         static_cast<unsigned char>(c)));
                 });
  return title;
}

std::string upper(std::string value) {
  std::transform(std::begin(value), std::end(value), std::begin(value),
                 [](const char c) {
                   return static_cast<char>(
                       std::toupper(static_cast<unsigned char>(c)));
                 });
  return value;
}

void append_entries(std::string& out,
                    const std::string_view heading,
                    const std::vector<gatekeeper::schema::failure_entry_t>& entries) {
  if (entries.empty()) {
    return;
  }
  out += fmt::format("{}:\n", heading);
  for (const auto& entry : entries) {
    const auto& detail =
        entry.message ? *entry.message : entry.error.value_or("Failed");
    out += fmt::format("   * {}: {}\n", entry.display_name, detail);
  }
}

void append_matrix(std::string& out,
                   const gatekeeper::schema::alignment_verdict_t& verdict) {
  auto categories = std::vector<std::string>{};
  for (const auto& result : verdict.results) {
    if (std::find(std::begin(categories), std::end(categories),
                  result.category) == std::end(categories)) {
      categories.push_back(result.category);
    }
  }

  out += fmt::format("ALIGNMENT MATRIX ({} Parameters):\n\n",
                     verdict.results.size());
  for (const auto& category : categories) {
    out += fmt::format("{}:\n", upper(category));
    for (const auto& result : verdict.results) {
      if (result.category != category) {
        continue;
      }
      out += fmt::format("  [{} {:>3}%] {}{}\n", result.passed ? "PASS" : "FAIL",
                         result.confidence, result.display_name,
                         result.critical ? " (critical)" : "");
      if (result.message) {
        out += fmt::format("       -> {}\n", *result.message);
      }
      if (result.error) {
        out += fmt::format("       -> ERROR: {}\n", *result.error);
      }
    }
    out += "\n";
  }

  out += fmt::format("Alignment check completed in {:.3f} ms\n",
                     static_cast<double>(verdict.total_elapsed) / 1000.0);
  out += fmt::format("Results: {}/{} parameters passed ({} failed)\n",
                     verdict.passed_count, verdict.results.size(),
                     verdict.failed_count);
  out += fmt::format("Critical systems: {}/{} passed\n\n",
                     verdict.critical_passed, verdict.critical_total);
}

}  // namespace

namespace gatekeeper::report {

std::string render_failure_summary(const schema::failure_summary_t& summary) {
  auto out = std::string{};
  append_entries(out, "CRITICAL FAILURES", summary.critical_failures);
  append_entries(out, "NON-CRITICAL FAILURES", summary.non_critical_failures);
  if (!summary.policy_violations.empty()) {
    out += "POLICY:\n";
    for (const auto& violation : summary.policy_violations) {
      out += fmt::format("   * {}\n", violation);
    }
  }
  return out;
}

std::string render_verdict(const schema::alignment_verdict_t& verdict,
                           const schema::verbosity_t verbosity) {
  if (verbosity == schema::verbosity_t::silent) {
    return {};
  }

  auto out = std::string{};
  if (verbosity == schema::verbosity_t::full) {
    out += rule();
    out += fmt::format("{} TARGETING ALIGNMENT\n", title_of(verdict.operation_type));
    out += rule();
    out += "\n";
    append_matrix(out, verdict);
  }

  out += rule();
  if (verdict.allowed) {
    out += fmt::format("ALL {} SYSTEMS ALIGNED - TARGETING LOCK CONFIRMED\n",
                       verdict.results.size());
    out += fmt::format("CONFIDENCE: {}% | RISK: {} | STATUS: SAFE TO PROCEED\n",
                       verdict.confidence,
                       schema::to_string(verdict.risk_level));
  } else {
    out += fmt::format(
        "ALIGNMENT FAILED - {}/{} SYSTEMS REJECTED TARGETING SOLUTION\n",
        verdict.failed_count, verdict.results.size());
    out += fmt::format("CONFIDENCE: {}% | RISK: {} | STATUS: OPERATION ABORTED\n",
                       verdict.confidence,
                       schema::to_string(verdict.risk_level));
    if (verdict.failure_summary) {
      out += "\n";
      out += render_failure_summary(*verdict.failure_summary);
    }
  }
  out += rule();
  return out;
}

std::string render_statistics(const schema::engine_statistics_t& statistics) {
  auto out = fmt::format("Operations: {} total, {} passed, {} failed\n",
                         statistics.total_operations,
                         statistics.passed_operations,
                         statistics.failed_operations);
  for (const auto& [operation_type, counters] : statistics.by_operation_type) {
    out += fmt::format("  {}: {} total, {} passed, {} failed\n", operation_type,
                       counters.total, counters.passed, counters.failed);
  }
  return out;
}

}  // namespace gatekeeper::report
