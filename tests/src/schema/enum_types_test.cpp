#include <gtest/gtest.h>
#include <gatekeeper/schema/failure_kind.hpp>
#include <gatekeeper/schema/risk_level.hpp>
#include <gatekeeper/schema/verbosity.hpp>

TEST(enum_types, risk_level_round_trips_through_names) {
  using gatekeeper::schema::risk_level_t;
  for (const auto level : {risk_level_t::low, risk_level_t::medium,
                           risk_level_t::high, risk_level_t::critical}) {
    auto parsed = gatekeeper::schema::try_from_string<risk_level_t>(
        gatekeeper::schema::to_string(level));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, level);
  }
  EXPECT_EQ(gatekeeper::schema::to_string(risk_level_t::critical), "CRITICAL");
}

TEST(enum_types, verbosity_rejects_unknown_names) {
  using gatekeeper::schema::verbosity_t;
  EXPECT_EQ(gatekeeper::schema::try_from_string<verbosity_t>("summary"),
            verbosity_t::summary);
  EXPECT_FALSE(
      gatekeeper::schema::try_from_string<verbosity_t>("loud").has_value());
}

TEST(enum_types, failure_kind_names) {
  EXPECT_EQ(gatekeeper::schema::to_string(
                gatekeeper::schema::failure_kind_t::predicate_error),
            "predicate_error");
}

TEST(enum_types, accepted_names_read_as_a_list) {
  EXPECT_EQ(gatekeeper::schema::accepted_names(
                gatekeeper::schema::kVerbosityMappings),
            "silent, summary or full");
  EXPECT_EQ(gatekeeper::schema::accepted_names(
                gatekeeper::schema::kRiskLevelMappings),
            "LOW, MEDIUM, HIGH or CRITICAL");
}

TEST(enum_types, unparseable_enums_never_parse) {
  EXPECT_FALSE(gatekeeper::schema::try_from_string<
                   gatekeeper::schema::failure_kind_t>("predicate_error")
                   .has_value());
}
