#include <gatekeeper/rules/command_execution.hpp>
#include <gatekeeper/rules/text.hpp>
#include <gatekeeper/schema/parameter_names.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <regex>
#include <string>

namespace {

namespace names = gatekeeper::schema::parameter_names;
using gatekeeper::alignment::check_outcome_t;
using gatekeeper::alignment::check_t;
using gatekeeper::schema::parameter_bundle;

constexpr auto kSafetyChecks = "Safety Checks";

check_t not_destructive() {
  return check_t{
      .name = "not_destructive",
      .display_name = "Not Destructive Command",
      .category = kSafetyChecks,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            static const auto kDestructive = std::array{
                std::regex{R"(rm\s+-rf)"},
                std::regex{R"(del\s+/[fs])", std::regex::icase},
                std::regex{R"(format\s+)", std::regex::icase},
                std::regex{R"(mkfs)"}, std::regex{R"(>/dev/)"}};
            const auto& command = params.get<std::string>(names::kCommand);
            const auto destructive = std::any_of(
                std::begin(kDestructive), std::end(kDestructive),
                [&](const std::regex& pattern) {
                  return std::regex_search(command, pattern);
                });
            return check_outcome_t{.passed = !destructive};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "No dangerous patterns"
                      : "DESTRUCTIVE COMMAND DETECTED";
      }};
}

check_t working_directory_correct() {
  return check_t{
      .name = "working_directory_correct",
      .display_name = "Working Directory Correct",
      .category = kSafetyChecks,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto& cwd = params.get<std::string>(names::kCwd);
            const auto& root = params.get<std::string>(names::kWorkspaceRoot);
            return check_outcome_t{.passed = !root.empty() && cwd.starts_with(root)};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Within workspace" : "Outside workspace";
      }};
}

check_t path_safety() {
  return check_t{
      .name = "path_safety",
      .display_name = "Path Safety",
      .category = kSafetyChecks,
      .critical = true,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            const auto& command = params.get<std::string>(names::kCommand);
            return check_outcome_t{
                .passed = !gatekeeper::rules::contains(command, "..")};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "No path traversal" : "Path traversal detected";
      }};
}

}  // namespace

namespace gatekeeper::rules {

std::vector<alignment::check_t> make_command_execution_checks() {
  return {not_destructive(), working_directory_correct(), path_safety()};
}

}  // namespace gatekeeper::rules
