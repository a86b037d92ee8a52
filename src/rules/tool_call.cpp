#include <gatekeeper/rules/tool_call.hpp>
#include <gatekeeper/schema/parameter_names.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace {

namespace names = gatekeeper::schema::parameter_names;
using gatekeeper::alignment::check_outcome_t;
using gatekeeper::alignment::check_t;
using gatekeeper::schema::parameter_bundle;

constexpr auto kToolValidation = "Tool Validation";
constexpr auto kContextChecks = "Context Checks";
constexpr auto kReadBeforeEditTool = "surgical_edit";
constexpr auto kReadTool = "read_file";

check_t tool_exists() {
  return check_t{
      .name = "tool_exists",
      .display_name = "Tool Exists",
      .category = kToolValidation,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto& tool = params.get<std::string>(names::kToolName);
            const auto& available =
                params.get<gatekeeper::schema::string_list_t>(
                    names::kAvailableTools);
            return check_outcome_t{
                .passed = std::find(std::begin(available), std::end(available),
                                    tool) != std::end(available)};
          },
      .describe = [](const bool passed, const parameter_bundle& params,
                     const parameter_bundle&) -> std::optional<std::string> {
        const auto& tool = params.get<std::string>(names::kToolName);
        if (passed) {
          return fmt::format("'{}' registered", tool);
        }
        return fmt::format("Unknown tool: {}", tool);
      }};
}

check_t parameters_valid() {
  return check_t{
      .name = "parameters_valid",
      .display_name = "Parameters Valid",
      .category = kToolValidation,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            return check_outcome_t{
                .passed = params.try_get<gatekeeper::schema::string_map_t>(
                              names::kToolParams) != nullptr};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Parameters well-formed" : "Invalid parameters";
      }};
}

check_t prerequisites_met(gatekeeper::rules::clock_fn_t now) {
  return check_t{
      .name = "prerequisites_met",
      .display_name = "Prerequisites Met",
      .category = kContextChecks,
      .critical = true,
      .confidence = 100,
      .predicate =
          [now = std::move(now)](const parameter_bundle& params) {
            const auto& tool = params.get<std::string>(names::kToolName);
            if (tool != kReadBeforeEditTool) {
              return check_outcome_t{.passed = true};
            }
            const auto& actions =
                params.get<gatekeeper::schema::recent_actions_t>(
                    names::kRecentActions);
            const auto current = now();
            const auto recent_read = std::any_of(
                std::begin(actions), std::end(actions),
                [&](const gatekeeper::schema::recent_action_t& action) {
                  return action.tool == kReadTool &&
                         (action.timestamp > current ||
                          current - action.timestamp <
                              gatekeeper::rules::kReadBeforeEditWindow);
                });
            return check_outcome_t{.passed = recent_read};
          },
      .describe = [](const bool passed, const parameter_bundle& params,
                     const parameter_bundle&) -> std::optional<std::string> {
        if (params.get<std::string>(names::kToolName) != kReadBeforeEditTool) {
          return "No prerequisites";
        }
        return passed ? "File read <60s ago" : "Must read file first";
      }};
}

}  // namespace

namespace gatekeeper::rules {

std::vector<alignment::check_t> make_tool_call_checks(clock_fn_t now) {
  return {tool_exists(), parameters_valid(), prerequisites_met(std::move(now))};
}

}  // namespace gatekeeper::rules
