#include <gtest/gtest.h>
#include <gatekeeper/alignment/engine.hpp>
#include <gatekeeper/alignment/errors.hpp>
#include <gatekeeper/rules/default_registry.hpp>
#include <gatekeeper/schema/operation_type.hpp>
#include <gatekeeper/testing/common.hpp>

#include <string>
#include <thread>
#include <vector>

using gatekeeper::testing::make_check;

namespace {

gatekeeper::alignment::registry make_test_registry() {
  auto builder = gatekeeper::alignment::registry_builder{};
  builder
      .add("deploy", {make_check("approved", true, 100, true),
                      make_check("tested", false, 95, true)})
      .add("rollback", {make_check("approved", true, 100, false),
                        make_check("tested", false, 95, true)});
  return builder.build();
}

gatekeeper::schema::parameter_bundle make_edit_params() {
  return gatekeeper::schema::parameter_bundle{
      {"content", std::string{"function a() {\n  return 1;\n}\n"
                              "function b() {\n  return 2;\n}\n"
                              "function c() {\n  return 3;\n}\n"}},
      {"old_string", std::string{"  return 2;\n"}},
      {"new_string", std::string{"  return 20;\n"}}};
}

}  // namespace

TEST(engine_types, validate_builds_counted_verdict) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  const auto verdict = engine.validate("deploy", {});

  EXPECT_EQ(verdict.operation_type, "deploy");
  ASSERT_EQ(verdict.results.size(), 2u);
  EXPECT_EQ(verdict.passed_count, 2u);
  EXPECT_EQ(verdict.failed_count, 0u);
  EXPECT_EQ(verdict.critical_total, 1u);
  EXPECT_EQ(verdict.critical_passed, 1u);
  EXPECT_EQ(verdict.critical_failed, 0u);
  EXPECT_EQ(verdict.confidence, 98u);
  EXPECT_TRUE(verdict.allowed);
  EXPECT_FALSE(verdict.failure_summary.has_value());
  EXPECT_GT(verdict.timestamp, 0u);
}

TEST(engine_types, denied_verdict_carries_failure_summary) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  const auto verdict = engine.validate("rollback", {});

  EXPECT_FALSE(verdict.allowed);
  EXPECT_EQ(verdict.critical_failed, 1u);
  EXPECT_EQ(verdict.risk_level, gatekeeper::schema::risk_level_t::critical);
  ASSERT_TRUE(verdict.failure_summary.has_value());
  EXPECT_EQ(verdict.failure_summary->critical_failures.front().name,
            "approved");
}

TEST(engine_types, unregistered_type_throws_without_recording) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  EXPECT_THROW(static_cast<void>(engine.validate("teleport", {})),
               gatekeeper::alignment::configuration_error);

  const auto statistics = engine.statistics();
  EXPECT_EQ(statistics.total_operations, 0u);
  EXPECT_FALSE(statistics.by_operation_type.contains("teleport"));
}

TEST(engine_types, statistics_track_each_verdict) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  static_cast<void>(engine.validate("deploy", {}));
  static_cast<void>(engine.validate("deploy", {}));
  static_cast<void>(engine.validate("rollback", {}));

  const auto statistics = engine.statistics();
  EXPECT_EQ(statistics.total_operations, 3u);
  EXPECT_EQ(statistics.passed_operations, 2u);
  EXPECT_EQ(statistics.failed_operations, 1u);
  EXPECT_EQ(statistics.by_operation_type.at("deploy").total, 2u);
  EXPECT_EQ(statistics.by_operation_type.at("deploy").passed, 2u);
  EXPECT_EQ(statistics.by_operation_type.at("rollback").failed, 1u);
}

TEST(engine_types, registered_types_start_at_zero) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  const auto statistics = engine.statistics();
  ASSERT_EQ(statistics.by_operation_type.size(), 2u);
  EXPECT_EQ(statistics.by_operation_type.at("rollback").total, 0u);
}

TEST(engine_types, concurrent_validations_are_all_counted) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  constexpr auto kThreads = 8;
  constexpr auto kCallsPerThread = 25;

  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&engine, t] {
      for (auto i = 0; i < kCallsPerThread; ++i) {
        static_cast<void>(
            engine.validate(t % 2 == 0 ? "deploy" : "rollback", {}));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto statistics = engine.statistics();
  EXPECT_EQ(statistics.total_operations,
            static_cast<uint64_t>(kThreads * kCallsPerThread));
  EXPECT_EQ(statistics.passed_operations,
            static_cast<uint64_t>(kThreads * kCallsPerThread / 2));
  EXPECT_EQ(statistics.failed_operations,
            static_cast<uint64_t>(kThreads * kCallsPerThread / 2));
  EXPECT_EQ(statistics.by_operation_type.at("deploy").total +
                statistics.by_operation_type.at("rollback").total,
            statistics.total_operations);
}

TEST(engine_types, replace_registry_swaps_parameter_sets) {
  auto engine = gatekeeper::alignment::engine{make_test_registry()};
  static_cast<void>(engine.validate("deploy", {}));

  auto builder = gatekeeper::alignment::registry_builder{};
  builder.add("migrate", {make_check("backup_taken", true, 100, true)});
  engine.replace_registry(builder.build());

  EXPECT_EQ(engine.operation_types(), (std::vector<std::string>{"migrate"}));
  EXPECT_THROW(static_cast<void>(engine.validate("deploy", {})),
               gatekeeper::alignment::configuration_error);
  EXPECT_TRUE(engine.validate("migrate", {}).allowed);

  const auto statistics = engine.statistics();
  EXPECT_EQ(statistics.total_operations, 2u);
  EXPECT_EQ(statistics.by_operation_type.at("deploy").total, 1u);
  EXPECT_EQ(statistics.by_operation_type.at("migrate").total, 1u);
}

TEST(engine_types, surgical_edit_with_default_registry_is_allowed) {
  auto engine =
      gatekeeper::alignment::engine{gatekeeper::rules::make_default_registry()};
  const auto verdict = engine.validate(gatekeeper::schema::kSurgicalEdit,
                                       make_edit_params());

  EXPECT_EQ(verdict.results.size(), 14u);
  EXPECT_EQ(verdict.critical_total, 5u);
  EXPECT_EQ(verdict.critical_failed, 0u);
  EXPECT_TRUE(verdict.allowed);
  EXPECT_EQ(verdict.risk_level, gatekeeper::schema::risk_level_t::low);
}

TEST(engine_types, missing_parameters_fault_every_check_without_throwing) {
  auto engine =
      gatekeeper::alignment::engine{gatekeeper::rules::make_default_registry()};
  const auto verdict =
      engine.validate(gatekeeper::schema::kCommandExecution, {});

  EXPECT_FALSE(verdict.allowed);
  for (const auto& result : verdict.results) {
    EXPECT_EQ(result.failure_kind,
              gatekeeper::schema::failure_kind_t::predicate_error);
  }
  EXPECT_EQ(verdict.confidence, 0u);
}

TEST(engine_types, invalid_policy_is_rejected_at_construction) {
  EXPECT_THROW(
      gatekeeper::alignment::engine(make_test_registry(),
                                    gatekeeper::schema::policy_config_t{
                                        .minimum_confidence = 150}),
      gatekeeper::alignment::configuration_error);
}

TEST(engine_types, oversized_check_timeout_is_rejected_at_construction) {
  EXPECT_THROW(gatekeeper::alignment::engine(
                   make_test_registry(), gatekeeper::schema::policy_config_t{},
                   gatekeeper::alignment::kMaxCheckTimeout + 1),
               gatekeeper::alignment::configuration_error);
}
