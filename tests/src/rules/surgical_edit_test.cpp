#include <gtest/gtest.h>
#include <gatekeeper/rules/surgical_edit.hpp>
#include <gatekeeper/testing/common.hpp>

#include <string>

using gatekeeper::schema::failure_kind_t;
using gatekeeper::testing::evaluate_named;

namespace {

const auto kSource = std::string{
    "function a() {\n  return 1;\n}\n"
    "function b() {\n  return 2;\n}\n"
    "function c() {\n  return 3;\n}\n"};

gatekeeper::schema::parameter_bundle make_edit(const std::string& content,
                                               const std::string& old_string,
                                               const std::string& new_string) {
  return gatekeeper::schema::parameter_bundle{{"content", content},
                                              {"old_string", old_string},
                                              {"new_string", new_string}};
}

gatekeeper::schema::check_result_t run_check(
    const std::string_view name,
    const gatekeeper::schema::parameter_bundle& params) {
  return evaluate_named(gatekeeper::rules::make_surgical_edit_checks(), name,
                        params);
}

}  // namespace

TEST(surgical_edit, set_has_fourteen_checks_with_five_critical) {
  const auto checks = gatekeeper::rules::make_surgical_edit_checks();
  ASSERT_EQ(checks.size(), 14u);
  auto critical = 0;
  for (const auto& check : checks) {
    critical += check.critical ? 1 : 0;
  }
  EXPECT_EQ(critical, 5);
  EXPECT_EQ(checks.front().name, "exact_match");
  EXPECT_EQ(checks.back().name, "block_integrity");
}

TEST(surgical_edit, exact_match_reports_line) {
  const auto result = run_check(
      "exact_match", make_edit(kSource, "  return 2;\n", "  return 20;\n"));
  EXPECT_TRUE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "Found 1 occurrence(s) at line 5");
}

TEST(surgical_edit, exact_match_fails_when_target_is_missing) {
  const auto result =
      run_check("exact_match", make_edit(kSource, "return 42;", "return 4;"));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.failure_kind, failure_kind_t::predicate_failed);
  EXPECT_EQ(result.message.value_or(""), "String not found in file");
}

TEST(surgical_edit, empty_old_string_is_not_a_target) {
  const auto params = make_edit(kSource, "", "inserted");
  EXPECT_FALSE(run_check("exact_match", params).passed);
  EXPECT_FALSE(run_check("position_verify", params).passed);
  EXPECT_FALSE(run_check("range_contained", params).passed);
}

TEST(surgical_edit, position_verify_reports_line_and_column) {
  const auto result = run_check(
      "position_verify", make_edit(kSource, "return 2;", "return 20;"));
  EXPECT_TRUE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "Line 5, Column 2");
}

TEST(surgical_edit, boundary_detect_rejects_mid_statement_selection) {
  const auto result =
      run_check("boundary_detect", make_edit("a + b + c", "+ b", "- b"));
  EXPECT_FALSE(result.passed);
  EXPECT_TRUE(run_check("boundary_detect",
                        make_edit(kSource, "  return 2;", "  return 20;"))
                  .passed);
}

TEST(surgical_edit, size_delta_limits_growth) {
  const auto content = std::string(100, 'a');
  const auto result = run_check(
      "size_delta", make_edit(content, std::string(5, 'a'), std::string(20, 'a')));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "+/-15 chars (15.0% of file)");
}

TEST(surgical_edit, line_delta_limits_added_lines) {
  const auto result =
      run_check("line_delta", make_edit("a\nb\nc\nd\ne", "c", "c\nx\ny"));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "+/-2 lines (40.0% of file)");
}

TEST(surgical_edit, range_contained_flags_runaway_selection) {
  const auto result =
      run_check("range_contained", make_edit("abcdefghij", "abcd", "x"));
  EXPECT_FALSE(result.passed);
  EXPECT_TRUE(result.critical);
  EXPECT_EQ(result.message.value_or(""),
            "RUNAWAY SELECTION: selecting 40.0% of file");
}

TEST(surgical_edit, brace_balance_rejects_removed_closing_brace) {
  const auto result = run_check(
      "brace_balance", make_edit("int f() {\n  x();\n}\n", "}\n", "\n"));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "{1->1, }1->0");
}

TEST(surgical_edit, brace_balance_accepts_repair) {
  const auto result =
      run_check("brace_balance", make_edit("a {{ b }", "b }", "b }}"));
  EXPECT_TRUE(result.passed);
}

TEST(surgical_edit, paren_balance_rejects_dropped_parenthesis) {
  const auto result = run_check(
      "paren_balance", make_edit("call(a, b);", "call(a, b);", "call(a, b;"));
  EXPECT_FALSE(result.passed);
}

TEST(surgical_edit, quote_balance_rejects_unpaired_quote) {
  const auto result =
      run_check("quote_balance", make_edit("say(\"hi\");", "\"hi\"", "\"hi"));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "Unpaired quotes detected");
}

TEST(surgical_edit, semicolon_and_indentation_must_be_kept) {
  const auto semicolon =
      run_check("semicolon_consistency", make_edit("x = 1;", "x = 1;", "x = 1"));
  EXPECT_FALSE(semicolon.passed);
  const auto indentation = run_check(
      "indentation_consistent", make_edit("  x = 1;", "  x = 1;", "    x = 1;"));
  EXPECT_FALSE(indentation.passed);
}

TEST(surgical_edit, critical_patterns_count_removed_definitions) {
  const auto old_string = std::string{"function helper() {}\nconst x = 1;"};
  const auto result =
      run_check("critical_patterns", make_edit(old_string, old_string, ""));
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "Deleting 2 critical definition(s)");
}

TEST(surgical_edit, critical_patterns_allow_renamed_definitions) {
  const auto result = run_check(
      "critical_patterns",
      make_edit("function helper() {}", "function helper() {}",
                "function assist() {}"));
  EXPECT_TRUE(result.passed);
  EXPECT_EQ(result.message.value_or(""), "No critical deletions");
}

TEST(surgical_edit, open_block_selection_fails_structure_checks) {
  const auto params = make_edit("if (a) {\n  b();\n}", "if (a) {", "if (c) {");
  EXPECT_FALSE(run_check("block_integrity", params).passed);
  const auto scope = run_check("scope_containment", params);
  EXPECT_FALSE(scope.passed);
  EXPECT_EQ(scope.message.value_or(""), "Top-level statement");
}

TEST(surgical_edit, missing_content_is_a_predicate_error) {
  const auto result = run_check(
      "exact_match", gatekeeper::schema::parameter_bundle{
                         {"old_string", std::string{"a"}},
                         {"new_string", std::string{"b"}}});
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.failure_kind, failure_kind_t::predicate_error);
}
