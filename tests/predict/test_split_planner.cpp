/// @file tests/predict/test_split_planner.cpp
/// @brief Unit tests for SplitPlanner.
///
/// Test categories:
///   - Implied start / finish rows
///   - Time shares proportional to leg cost
///   - Fatigue drift (front-loaded pacing)
///   - Leg gain / loss and waypoint altitude
///   - Parameter validation
///   - Strategy set (main / aggressive / even)

#include <gtest/gtest.h>
#include "trka/config_loader.hpp"
#include "trka/predictor.hpp"

#include <vector>

using namespace trka;
using namespace trka::predict;

namespace {

constexpr double HOUR = 3600.0;

/// `n` flat 1 km segments at `altitude_m`.
std::vector<ProfileSegment> flat_km(int n, double altitude_m = 1000.0) {
    std::vector<ProfileSegment> prof;
    for (int i = 0; i < n; ++i) {
        prof.push_back(ProfileSegment{
            .start_km          = static_cast<double>(i),
            .length_km         = 1.0,
            .start_elevation_m = altitude_m,
            .elevation_delta_m = 0.0,
            .slope_pct         = 0.0,
        });
    }
    return prof;
}

/// 1 km flat at 500 m, then 1 km climbing 100 m.
std::vector<ProfileSegment> flat_then_climb() {
    return {
        ProfileSegment{0.0, 1.0, 500.0, 0.0, 0.0},
        ProfileSegment{1.0, 1.0, 500.0, 100.0, 10.0},
    };
}

Seconds hours(double h) { return Seconds{h * HOUR}; }

}  // namespace

// ─── Stops ────────────────────────────────────────────────────────────────────

TEST(SplitPlannerTest, NoWaypointsGivesStartAndFinish) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    auto plan = planner.plan(prof, hours(10.0), {});
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 2u);

    EXPECT_EQ(plan->splits[0].name, "Start");
    EXPECT_DOUBLE_EQ(plan->splits[0].km, 0.0);
    EXPECT_DOUBLE_EQ(plan->splits[0].cumulative_time.count(), 0.0);

    EXPECT_EQ(plan->splits[1].name, "Finish");
    EXPECT_DOUBLE_EQ(plan->splits[1].km, 10.0);
    EXPECT_NEAR(plan->splits[1].cumulative_time.count(), 10.0 * HOUR, 1e-6);
}

TEST(SplitPlannerTest, WaypointsNearEndsReplaceImpliedRows) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    const std::vector<Waypoint> wps{{9.8, "Arrivee"}, {0.0, "Depart"}};
    auto plan = planner.plan(prof, hours(2.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 2u);
    EXPECT_EQ(plan->splits[0].name, "Depart");
    EXPECT_EQ(plan->splits[1].name, "Arrivee");
    EXPECT_DOUBLE_EQ(plan->splits[1].km, 9.8);
    // The last leg still runs to the end of the profile.
    EXPECT_NEAR(plan->splits[1].segment_km, 10.0, 1e-9);
    EXPECT_NEAR(plan->splits[1].cumulative_time.count(), 2.0 * HOUR, 1e-6);
}

TEST(SplitPlannerTest, WaypointsBeyondCourseAreDropped) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    const std::vector<Waypoint> wps{{5.0, "Aid"}, {25.0, "Typo"}, {-3.0, "Car park"}};
    auto plan = planner.plan(prof, hours(1.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 3u);
    EXPECT_EQ(plan->splits[0].name, "Start");
    EXPECT_EQ(plan->splits[1].name, "Aid");
    EXPECT_EQ(plan->splits[2].name, "Finish");
}

// ─── Time shares ──────────────────────────────────────────────────────────────

TEST(SplitPlannerTest, EqualLegsShareTimeEqually) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    const std::vector<Waypoint> wps{{5.0, "Aid"}};
    auto plan = planner.plan(prof, hours(10.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 3u);
    EXPECT_NEAR(plan->splits[1].segment_time.count(), 5.0 * HOUR, 1e-6);
    EXPECT_NEAR(plan->splits[2].segment_time.count(), 5.0 * HOUR, 1e-6);
    EXPECT_NEAR(plan->splits[2].cumulative_time.count(), 10.0 * HOUR, 1e-6);
}

TEST(SplitPlannerTest, ClimbingLegGetsMoreTime) {
    SplitPlanner planner;
    const auto prof = flat_then_climb();
    const std::vector<Waypoint> wps{{1.0, "Foot of climb"}};
    auto plan = planner.plan(prof, hours(3.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 3u);

    // Costs 1 and 1 + 100/100.
    EXPECT_NEAR(plan->splits[1].segment_time.count(), 1.0 * HOUR, 1e-6);
    EXPECT_NEAR(plan->splits[2].segment_time.count(), 2.0 * HOUR, 1e-6);
    EXPECT_NEAR(plan->splits[2].segment_gain_m, 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(plan->splits[2].segment_loss_m, 0.0);
}

TEST(SplitPlannerTest, LoadedConfigReachesThePlanner) {
    const auto cfg = core::ConfigLoader::parse_json_string(
        R"({ "predictor": { "climb_penalty_m": 50 } })");
    ASSERT_TRUE(cfg.has_value());

    SplitPlanner planner(cfg->predictor);
    const auto prof = flat_then_climb();
    const std::vector<Waypoint> wps{{1.0, "Foot of climb"}};
    auto plan = planner.plan(prof, hours(3.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 3u);

    // Costs 1 and 1 + 100/50.
    EXPECT_NEAR(plan->splits[1].segment_time.count(), 0.75 * HOUR, 1e-6);
    EXPECT_NEAR(plan->splits[2].segment_time.count(), 2.25 * HOUR, 1e-6);
}

TEST(SplitPlannerTest, FatigueFrontLoadsThePace) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    const std::vector<Waypoint> wps{{5.0, "Aid"}};
    auto plan = planner.plan(prof, hours(10.0), wps, 1.25);
    ASSERT_TRUE(plan.has_value());
    // Weights 5 × 1 and 5 × 1.125.
    EXPECT_NEAR(plan->splits[1].segment_time.count(), 10.0 * HOUR * 5.0 / 10.625, 1e-6);
    EXPECT_LT(plan->splits[1].segment_time, plan->splits[2].segment_time);
    EXPECT_NEAR(plan->splits[2].cumulative_time.count(), 10.0 * HOUR, 1e-6);
}

// ─── Altitude ─────────────────────────────────────────────────────────────────

TEST(SplitPlannerTest, WaypointAltitudeIsInterpolated) {
    SplitPlanner planner;
    const auto prof = flat_then_climb();
    const std::vector<Waypoint> wps{{1.5, "Mid climb"}};
    auto plan = planner.plan(prof, hours(1.0), wps);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->splits.size(), 3u);
    EXPECT_DOUBLE_EQ(plan->splits[0].altitude_m, 500.0);
    EXPECT_NEAR(plan->splits[1].altitude_m, 550.0, 1e-9);
    EXPECT_NEAR(plan->splits[2].altitude_m, 600.0, 1e-9);
}

// ─── Validation ───────────────────────────────────────────────────────────────

TEST(SplitPlannerTest, RejectsNonPositiveTarget) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    auto plan = planner.plan(prof, Seconds{0.0}, {});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().kind, ErrorKind::InvalidProfile);
}

TEST(SplitPlannerTest, RejectsNonPositiveFatigue) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    auto plan = planner.plan(prof, hours(1.0), {}, -1.0);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().kind, ErrorKind::InvalidProfile);
}

TEST(SplitPlannerTest, RejectsEmptyProfile) {
    SplitPlanner planner;
    auto plan = planner.plan({}, hours(1.0), {});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().kind, ErrorKind::InsufficientData);
}

// ─── Strategies ───────────────────────────────────────────────────────────────

TEST(SplitPlannerTest, StrategySetCarriesThreePlans) {
    SplitPlanner planner;
    const auto prof = flat_km(10);
    const std::vector<Waypoint> wps{{5.0, "Aid"}};
    auto set = planner.plan_strategies(prof, hours(10.0), wps, 1.1);
    ASSERT_TRUE(set.has_value());
    EXPECT_DOUBLE_EQ(set->main.fatigue_factor, 1.1);
    EXPECT_DOUBLE_EQ(set->aggressive.fatigue_factor, StrategySet::AGGRESSIVE_FATIGUE);
    EXPECT_DOUBLE_EQ(set->even.fatigue_factor, 1.0);

    EXPECT_LT(set->aggressive.splits[1].segment_time, set->main.splits[1].segment_time);
    EXPECT_LT(set->main.splits[1].segment_time, set->even.splits[1].segment_time);
}

TEST(SplitPlannerTest, StrategySetPropagatesErrors) {
    SplitPlanner planner;
    auto set = planner.plan_strategies(flat_km(3), Seconds{-5.0}, {});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().kind, ErrorKind::InvalidProfile);
}
