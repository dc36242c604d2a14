/// @file tests/core/test_report.cpp
/// @brief Enum names, duration formatting and report rendering.

#include <gtest/gtest.h>
#include "trka/errors.hpp"
#include "trka/predictor.hpp"
#include "trka/types.hpp"

#include <cmath>
#include <string>

using namespace trka;

namespace {

AnalysisResult sample_result() {
    return AnalysisResult{
        .geometry = GeometrySummary{
            .total_distance_km    = 21.1,
            .elevation_gain_m     = 1250.0,
            .elevation_loss_m     = 1250.0,
            .max_altitude_m       = 2450.0,
            .min_altitude_m       = 1200.0,
            .avg_altitude_m       = 1800.0,
            .max_slope_pct        = 38.0,
            .avg_uphill_slope_pct = 14.0,
            .longest_climb_m      = 900.0,
            .elevation_available  = true,
        },
        .route_type = RouteType::OutAndBack,
        .topology = TopologyReport{
            .route_type                = RouteType::OutAndBack,
            .closure_distance_m        = 12.0,
            .overlap_ratio             = 0.97,
            .median_overlap_distance_m = 4.0,
            .samples                   = 200,
        },
        .technicity = TechnicityProfile{
            .technicity_score = 62.0,
            .level            = TechnicityLevel::VeryTechnical,
            .environment_tags = {EnvironmentTag::HighMountain, EnvironmentTag::Skyrunning},
            .mud_index        = MudIndex::Low,
            .exposure         = Exposure::Exposed,
        },
        .effort = EffortSummary{33.6, 36, 1},
        .predictions = {
            PredictionResult{
                .archetype           = Archetype::Runner,
                .fitness_index       = std::nullopt,
                .flat_speed_kmeh     = 9.0,
                .effort_km           = 33.6,
                .total_time_estimate = Seconds{5.0 * 3600.0},
                .checkpoint_splits   = {},
                .band = IntensityBand{Seconds{21176.0}, Seconds{18000.0}, Seconds{15652.0}},
            },
        },
        .recorded = RecordedTiming{Seconds{4.0 * 3600.0 + 12.0 * 60.0}, 8.0},
        .start    = Coordinate{45.9, 6.9},
        .end      = Coordinate{45.9, 6.9},
    };
}

}  // namespace

// ─── format_duration ──────────────────────────────────────────────────────────

TEST(FormatDurationTest, HoursAndPaddedMinutes) {
    EXPECT_EQ(format_duration(Seconds{4.0 * 3600.0 + 5.0 * 60.0 + 59.0}), "4h05");
    EXPECT_EQ(format_duration(Seconds{0.0}), "0h00");
    EXPECT_EQ(format_duration(Seconds{100.0 * 3600.0}), "100h00");
}

TEST(FormatDurationTest, NegativeAndNonFiniteClampToZero) {
    EXPECT_EQ(format_duration(Seconds{-60.0}), "0h00");
    EXPECT_EQ(format_duration(Seconds{std::nan("")}), "0h00");
}

// ─── Enum names ───────────────────────────────────────────────────────────────

TEST(EnumNamesTest, UpperSnakeCase) {
    EXPECT_STREQ(to_string(RouteType::OutAndBack), "OUT_AND_BACK");
    EXPECT_STREQ(to_string(RouteType::PointToPoint), "POINT_TO_POINT");
    EXPECT_STREQ(to_string(EnvironmentTag::HighMountain), "HIGH_MOUNTAIN");
    EXPECT_STREQ(to_string(MudIndex::Unknown), "UNKNOWN");
    EXPECT_STREQ(to_string(Exposure::Exposed), "EXPOSED");
    EXPECT_STREQ(to_string(TechnicityLevel::SlightlyTechnical), "SLIGHTLY_TECHNICAL");
    EXPECT_STREQ(to_string(Archetype::Elite), "ELITE");
    EXPECT_STREQ(to_string(ErrorKind::TemporalOrder), "TEMPORAL_ORDER");
}

// ─── AnalysisError ────────────────────────────────────────────────────────────

TEST(AnalysisErrorTest, ToStringWithAndWithoutIndex) {
    const auto with = make_error(ErrorKind::MalformedPoint, "latitude out of range", 3);
    EXPECT_EQ(with.to_string(), "MALFORMED_POINT at point 3: latitude out of range");

    const auto without = make_error(ErrorKind::InsufficientData, "need two points");
    EXPECT_EQ(without.to_string(), "INSUFFICIENT_DATA: need two points");
}

// ─── Reports ──────────────────────────────────────────────────────────────────

TEST(AnalysisResultTest, ReportMentionsEveryBlock) {
    const std::string text = sample_result().to_string();
    EXPECT_NE(text.find("OUT_AND_BACK"), std::string::npos);
    EXPECT_NE(text.find("VERY_TECHNICAL"), std::string::npos);
    EXPECT_NE(text.find("HIGH_MOUNTAIN"), std::string::npos);
    EXPECT_NE(text.find("SKYRUNNING"), std::string::npos);
    EXPECT_NE(text.find("RUNNER"), std::string::npos);
    EXPECT_NE(text.find("5h00"), std::string::npos);
    EXPECT_NE(text.find("Recorded: 4h12"), std::string::npos);
    EXPECT_EQ(text.find("no elevation data"), std::string::npos);
}

TEST(AnalysisResultTest, ReportFlagsMissingElevation) {
    auto r = sample_result();
    r.geometry.elevation_available = false;
    r.recorded.reset();
    const std::string text = r.to_string();
    EXPECT_NE(text.find("no elevation data"), std::string::npos);
    EXPECT_EQ(text.find("Recorded"), std::string::npos);
}

TEST(SplitPlanTest, ReportListsWaypoints) {
    predict::SplitPlan plan{
        .target_time    = Seconds{3.0 * 3600.0},
        .fatigue_factor = 1.1,
        .splits = {
            predict::PlannedSplit{"Start", 0.0, 500.0, 0.0, 0.0, 0.0, Seconds{0.0}, Seconds{0.0}},
            predict::PlannedSplit{"Refuge", 8.0, 1900.0, 8.0, 1400.0, 0.0,
                                  Seconds{7200.0}, Seconds{7200.0}},
        },
    };
    const std::string text = plan.to_string();
    EXPECT_NE(text.find("target 3h00"), std::string::npos);
    EXPECT_NE(text.find("Refuge"), std::string::npos);
    EXPECT_NE(text.find("2h00"), std::string::npos);
}
