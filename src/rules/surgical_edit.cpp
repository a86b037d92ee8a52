#include <gatekeeper/rules/surgical_edit.hpp>
#include <gatekeeper/rules/text.hpp>
#include <gatekeeper/schema/parameter_names.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <regex>
#include <string>

namespace {

namespace names = gatekeeper::schema::parameter_names;
using gatekeeper::alignment::check_outcome_t;
using gatekeeper::alignment::check_t;
using gatekeeper::schema::parameter_bundle;

constexpr auto kExactTargeting = "Exact Targeting";
constexpr auto kSizeAndScope = "Size & Scope";
constexpr auto kSyntaxPreservation = "Syntax Preservation";
constexpr auto kStructuralIntegrity = "Structural Integrity";

constexpr auto kMaxSizeDeltaPercent = 10.0;
constexpr auto kMaxLineDeltaPercent = 20.0;
constexpr auto kMaxSelectionPercent = 30.0;

struct edit_view final {
  const std::string& content;
  const std::string& old_string;
  const std::string& new_string;
};

edit_view read_edit(const parameter_bundle& params) {
  return edit_view{.content = params.get<std::string>(names::kContent),
                   .old_string = params.get<std::string>(names::kOldString),
                   .new_string = params.get<std::string>(names::kNewString)};
}

std::size_t find_target(const edit_view& edit) {
  if (edit.old_string.empty()) {
    return std::string::npos;
  }
  return edit.content.find(edit.old_string);
}

struct pair_count final {
  int64_t open{};
  int64_t close{};
};

pair_count count_pair(const std::string_view text, const char open,
                      const char close) {
  return pair_count{.open = static_cast<int64_t>(gatekeeper::rules::count_char(text, open)),
                    .close = static_cast<int64_t>(gatekeeper::rules::count_char(text, close))};
}

// Counts for the whole file after `old_string` is swapped for `new_string`.
pair_count count_after(const edit_view& edit, const char open,
                       const char close) {
  const auto before = count_pair(edit.content, open, close);
  const auto removing = count_pair(edit.old_string, open, close);
  const auto adding = count_pair(edit.new_string, open, close);
  return pair_count{.open = before.open - removing.open + adding.open,
                    .close = before.close - removing.close + adding.close};
}

int64_t imbalance(const pair_count& count) {
  return std::abs(count.open - count.close);
}

std::size_t count_matches(const std::string& text, const std::regex& pattern) {
  return static_cast<std::size_t>(std::distance(
      std::sregex_iterator{std::begin(text), std::end(text), pattern},
      std::sregex_iterator{}));
}

check_t exact_match() {
  return check_t{
      .name = "exact_match",
      .display_name = "Exact Match Found",
      .category = kExactTargeting,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto occurrences = static_cast<int64_t>(
                gatekeeper::rules::count_occurrences(edit.content,
                                                     edit.old_string));
            auto outcome = check_outcome_t{.passed = occurrences > 0};
            outcome.scratch.set("occurrences", occurrences);
            if (occurrences > 0) {
              outcome.scratch.set(
                  "line", static_cast<int64_t>(gatekeeper::rules::line_of_offset(
                              edit.content, find_target(edit))));
            }
            return outcome;
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        if (!passed) {
          return "String not found in file";
        }
        return fmt::format("Found {} occurrence(s) at line {}",
                           scratch.get<int64_t>("occurrences"),
                           scratch.get<int64_t>("line"));
      }};
}

check_t position_verify() {
  return check_t{
      .name = "position_verify",
      .display_name = "Position Verified",
      .category = kExactTargeting,
      .critical = false,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto index = find_target(edit);
            if (index == std::string::npos) {
              return check_outcome_t{.passed = false};
            }
            auto outcome = check_outcome_t{.passed = true};
            outcome.scratch.set(
                "line", static_cast<int64_t>(
                            gatekeeper::rules::line_of_offset(edit.content, index)));
            outcome.scratch.set(
                "column", static_cast<int64_t>(gatekeeper::rules::column_of_offset(
                              edit.content, index)));
            return outcome;
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        if (!passed) {
          return std::nullopt;
        }
        return fmt::format("Line {}, Column {}", scratch.get<int64_t>("line"),
                           scratch.get<int64_t>("column"));
      }};
}

check_t boundary_detect() {
  return check_t{
      .name = "boundary_detect",
      .display_name = "Boundary Detected",
      .category = kExactTargeting,
      .critical = false,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            static const auto kWordStart = std::regex{R"(^\s*\w)"};
            const auto& old_string = params.get<std::string>(names::kOldString);
            const auto starts_line = old_string.starts_with('\n') ||
                                     std::regex_search(old_string, kWordStart);
            const auto ends_line =
                old_string.ends_with('\n') || old_string.ends_with(';');
            return check_outcome_t{.passed = starts_line || ends_line};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Aligned to code boundary"
                      : "Selection starts and ends mid-statement";
      }};
}

check_t size_delta() {
  return check_t{
      .name = "size_delta",
      .display_name = "Size Delta Safe",
      .category = kSizeAndScope,
      .critical = false,
      .confidence = 98,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto old_size = edit.old_string.size();
            const auto new_size = edit.new_string.size();
            const auto delta =
                old_size > new_size ? old_size - new_size : new_size - old_size;
            const auto percent =
                gatekeeper::rules::percent_of(delta, edit.content.size());
            auto outcome =
                check_outcome_t{.passed = percent < kMaxSizeDeltaPercent};
            outcome.scratch.set("delta", static_cast<int64_t>(delta));
            outcome.scratch.set("percent", percent);
            return outcome;
          },
      .describe = [](const bool, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        return fmt::format(
            "+/-{} chars ({}% of file)", scratch.get<int64_t>("delta"),
            gatekeeper::rules::format_percent(scratch.get<double>("percent")));
      }};
}

check_t line_delta() {
  return check_t{
      .name = "line_delta",
      .display_name = "Line Delta Safe",
      .category = kSizeAndScope,
      .critical = false,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto old_lines = gatekeeper::rules::count_lines(edit.old_string);
            const auto new_lines = gatekeeper::rules::count_lines(edit.new_string);
            const auto delta = old_lines > new_lines ? old_lines - new_lines
                                                     : new_lines - old_lines;
            const auto percent = gatekeeper::rules::percent_of(
                delta, gatekeeper::rules::count_lines(edit.content));
            auto outcome =
                check_outcome_t{.passed = percent < kMaxLineDeltaPercent};
            outcome.scratch.set("delta", static_cast<int64_t>(delta));
            outcome.scratch.set("percent", percent);
            return outcome;
          },
      .describe = [](const bool, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        return fmt::format(
            "+/-{} lines ({}% of file)", scratch.get<int64_t>("delta"),
            gatekeeper::rules::format_percent(scratch.get<double>("percent")));
      }};
}

check_t range_contained() {
  return check_t{
      .name = "range_contained",
      .display_name = "Range Contained",
      .category = kSizeAndScope,
      .critical = true,
      .confidence = 99,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto index = find_target(edit);
            if (index == std::string::npos) {
              return check_outcome_t{.passed = false};
            }
            const auto remaining =
                edit.content.size() - (index + edit.old_string.size());
            const auto selected = gatekeeper::rules::percent_of(
                edit.old_string.size(), edit.content.size());
            auto outcome =
                check_outcome_t{.passed = selected < kMaxSelectionPercent};
            outcome.scratch.set("selected", selected);
            outcome.scratch.set("remaining", gatekeeper::rules::percent_of(
                                                 remaining, edit.content.size()));
            return outcome;
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        const auto selected =
            gatekeeper::rules::format_percent(scratch.get<double>("selected"));
        if (!passed) {
          return fmt::format("RUNAWAY SELECTION: selecting {}% of file",
                             selected);
        }
        return fmt::format(
            "{}% selected, {}% remaining", selected,
            gatekeeper::rules::format_percent(scratch.get<double>("remaining")));
      }};
}

check_t scope_containment() {
  return check_t{
      .name = "scope_containment",
      .display_name = "Scope Containment",
      .category = kSizeAndScope,
      .critical = false,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            static const auto kDeepIndent = std::regex{R"(^\s{4,})"};
            const auto& old_string = params.get<std::string>(names::kOldString);
            const auto opens_scope = gatekeeper::rules::contains(old_string, "{") &&
                                     !gatekeeper::rules::contains(old_string, "}");
            auto outcome = check_outcome_t{.passed = !opens_scope};
            outcome.scratch.set("top_level",
                                !std::regex_search(old_string, kDeepIndent));
            return outcome;
          },
      .describe = [](const bool, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        return scratch.get<bool>("top_level") ? "Top-level statement"
                                              : "Nested scope";
      }};
}

check_t brace_balance() {
  return check_t{
      .name = "brace_balance",
      .display_name = "Brace Balance Maintained",
      .category = kSyntaxPreservation,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto before = count_pair(edit.content, '{', '}');
            const auto after = count_after(edit, '{', '}');
            // Balance may improve or stay, never get worse.
            auto outcome =
                check_outcome_t{.passed = imbalance(after) <= imbalance(before)};
            outcome.scratch.set("open_before", before.open);
            outcome.scratch.set("open_after", after.open);
            outcome.scratch.set("close_before", before.close);
            outcome.scratch.set("close_after", after.close);
            return outcome;
          },
      .describe = [](const bool, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        return fmt::format("{{{}->{}, }}{}->{}",
                           scratch.get<int64_t>("open_before"),
                           scratch.get<int64_t>("open_after"),
                           scratch.get<int64_t>("close_before"),
                           scratch.get<int64_t>("close_after"));
      }};
}

check_t paren_balance() {
  return check_t{
      .name = "paren_balance",
      .display_name = "Parenthesis Balance OK",
      .category = kSyntaxPreservation,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            return check_outcome_t{
                .passed = imbalance(count_after(edit, '(', ')')) <=
                          imbalance(count_pair(edit.content, '(', ')'))};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Parentheses balanced"
                      : "Parenthesis imbalance would increase";
      }};
}

check_t quote_balance() {
  return check_t{
      .name = "quote_balance",
      .display_name = "Quote Balance Maintained",
      .category = kSyntaxPreservation,
      .critical = false,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            auto paired = true;
            for (const auto quote : std::array{'\'', '"', '`'}) {
              const auto after =
                  gatekeeper::rules::count_char(edit.content, quote) -
                  gatekeeper::rules::count_char(edit.old_string, quote) +
                  gatekeeper::rules::count_char(edit.new_string, quote);
              paired = paired && (after % 2 == 0);
            }
            return check_outcome_t{.passed = paired};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "All quotes paired" : "Unpaired quotes detected";
      }};
}

check_t semicolon_consistency() {
  return check_t{
      .name = "semicolon_consistency",
      .display_name = "Semicolon Consistency",
      .category = kSyntaxPreservation,
      .critical = false,
      .confidence = 90,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            const auto old_ends =
                gatekeeper::rules::trim(edit.old_string).ends_with(';');
            const auto new_ends =
                gatekeeper::rules::trim(edit.new_string).ends_with(';');
            return check_outcome_t{.passed = old_ends == new_ends};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Semicolon style consistent"
                      : "Semicolon style changed";
      }};
}

check_t critical_patterns() {
  return check_t{
      .name = "critical_patterns",
      .display_name = "Critical Patterns Safe",
      .category = kStructuralIntegrity,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            static const auto kDefinitions = std::array{
                std::regex{R"(function\s+\w+)"}, std::regex{R"(class\s+\w+)"},
                std::regex{R"(const\s+\w+\s*=)"},
                std::regex{R"(export\s+(default\s+)?)"},
                std::regex{R"(import\s+)"}};
            const auto edit = read_edit(params);
            auto deletions = int64_t{};
            for (const auto& pattern : kDefinitions) {
              const auto removed = count_matches(edit.old_string, pattern);
              if (removed > 0 && count_matches(edit.new_string, pattern) == 0) {
                deletions += static_cast<int64_t>(removed);
              }
            }
            auto outcome = check_outcome_t{.passed = deletions == 0};
            outcome.scratch.set("deletions", deletions);
            return outcome;
          },
      .describe = [](const bool, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        const auto deletions = scratch.get<int64_t>("deletions");
        if (deletions > 0) {
          return fmt::format("Deleting {} critical definition(s)", deletions);
        }
        return "No critical deletions";
      }};
}

check_t indentation_consistent() {
  return check_t{
      .name = "indentation_consistent",
      .display_name = "Indentation Consistent",
      .category = kStructuralIntegrity,
      .critical = false,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            const auto edit = read_edit(params);
            return check_outcome_t{
                .passed = gatekeeper::rules::leading_whitespace(edit.old_string) ==
                          gatekeeper::rules::leading_whitespace(edit.new_string)};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Indentation maintained" : "Indentation changed";
      }};
}

check_t block_integrity() {
  return check_t{
      .name = "block_integrity",
      .display_name = "Block Integrity Preserved",
      .category = kStructuralIntegrity,
      .critical = false,
      .confidence = 98,
      .predicate =
          [](const parameter_bundle& params) {
            const auto& old_string = params.get<std::string>(names::kOldString);
            const auto opens = gatekeeper::rules::contains(old_string, "{");
            const auto closes = gatekeeper::rules::contains(old_string, "}");
            return check_outcome_t{.passed = !opens || closes};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Block structure intact" : "May break block structure";
      }};
}

}  // namespace

namespace gatekeeper::rules {

std::vector<alignment::check_t> make_surgical_edit_checks() {
  return {exact_match(),        position_verify(),   boundary_detect(),
          size_delta(),         line_delta(),        range_contained(),
          scope_containment(),  brace_balance(),     paren_balance(),
          quote_balance(),      semicolon_consistency(), critical_patterns(),
          indentation_consistent(), block_integrity()};
}

}  // namespace gatekeeper::rules
