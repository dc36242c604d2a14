/// @file tests/normalize/test_point_normalizer.cpp
/// @brief Unit tests for PointNormalizer.
///
/// Test categories:
///   - Too few points / too few distinct points → InsufficientData
///   - Out-of-range or non-finite coordinates and elevations → MalformedPoint
///   - Consecutive duplicates collapse, first occurrence wins
///   - Non-consecutive repeats survive
///   - Interior elevation gaps interpolate by distance; edges clamp
///   - No elevation at all → zeros and elevation_available == false
///   - Timestamp regression: fatal when load-bearing, dropped otherwise
///   - Idempotence

#include <gtest/gtest.h>
#include "trka/normalizer.hpp"
#include "trka/constants.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace trka;
using namespace trka::normalize;

namespace {

constexpr double M_PER_DEG = constants::EARTH_RADIUS_M * constants::DEG_TO_RAD;

/// Point `north_m` metres north of (45, 6).
TrackPoint north(double north_m,
                 std::optional<double> ele = std::nullopt,
                 std::optional<double> ts  = std::nullopt) {
    return TrackPoint{45.0 + north_m / M_PER_DEG, 6.0, ele, ts};
}

std::vector<TrackPoint> to_raw(const NormalizedTrack& t) {
    std::vector<TrackPoint> raw;
    for (const auto& p : t.points()) {
        raw.push_back(TrackPoint{p.latitude, p.longitude, p.elevation, p.timestamp});
    }
    return raw;
}

}  // namespace

// ─── Insufficient data ────────────────────────────────────────────────────────

TEST(PointNormalizerTest, EmptyInputIsInsufficient) {
    PointNormalizer n;
    auto r = n.normalize({});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InsufficientData);
}

TEST(PointNormalizerTest, SinglePointIsInsufficient) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0, 100.0)};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InsufficientData);
}

TEST(PointNormalizerTest, RepeatedSinglePositionIsInsufficient) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), north(0.0), north(0.0)};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InsufficientData);
}

// ─── Malformed points ─────────────────────────────────────────────────────────

TEST(PointNormalizerTest, LatitudeOutOfRangeIsMalformed) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), TrackPoint{91.0, 6.0, {}, {}}, north(10.0)};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::MalformedPoint);
    ASSERT_TRUE(r.error().point_index.has_value());
    EXPECT_EQ(*r.error().point_index, 1u);
}

TEST(PointNormalizerTest, LongitudeOutOfRangeIsMalformed) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), north(10.0), TrackPoint{45.0, -180.5, {}, {}}};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::MalformedPoint);
    EXPECT_EQ(r.error().point_index.value_or(0), 2u);
}

TEST(PointNormalizerTest, NonFiniteCoordinateIsMalformed) {
    PointNormalizer n;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<TrackPoint> raw{TrackPoint{nan, 6.0, {}, {}}, north(10.0)};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::MalformedPoint);
    EXPECT_EQ(r.error().point_index.value_or(99), 0u);
}

TEST(PointNormalizerTest, ImplausibleElevationIsMalformed) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0, 100.0), north(10.0, 12000.0)};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::MalformedPoint);
}

TEST(PointNormalizerTest, ElevationLimitsFollowConfig) {
    PointNormalizer strict(NormalizerConfig{.min_elevation_m = 0.0, .max_elevation_m = 500.0});
    std::vector<TrackPoint> raw{north(0.0, 100.0), north(10.0, 600.0)};
    EXPECT_FALSE(strict.normalize(raw).has_value());

    PointNormalizer lenient;
    EXPECT_TRUE(lenient.normalize(raw).has_value());
}

TEST(PointNormalizerTest, MalformedWinsOverInsufficient) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{TrackPoint{0.0, 200.0, {}, {}}};
    auto r = n.normalize(raw);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::MalformedPoint);
}

// ─── Duplicates ───────────────────────────────────────────────────────────────

TEST(PointNormalizerTest, ConsecutiveDuplicatesCollapseToFirst) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0, 100.0, 10.0),
        north(0.0, 105.0, 11.0),
        north(50.0, 110.0, 20.0),
    };
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 2u);
    EXPECT_DOUBLE_EQ(r->front().elevation, 100.0);
    EXPECT_DOUBLE_EQ(r->front().timestamp.value_or(-1.0), 10.0);
}

TEST(PointNormalizerTest, DuplicateDonatesMissingElevation) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), north(0.0, 250.0), north(50.0, 260.0)};
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 2u);
    EXPECT_DOUBLE_EQ(r->front().elevation, 250.0);
}

TEST(PointNormalizerTest, NonConsecutiveRepeatsArePreserved) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), north(100.0), north(0.0)};
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size(), 3u);
}

// ─── Elevation gaps ───────────────────────────────────────────────────────────

TEST(PointNormalizerTest, InteriorGapInterpolatesByDistance) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0, 100.0),
        north(100.0),
        north(400.0, 500.0),
    };
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    // 100 m of 400 m → a quarter of the way from 100 to 500.
    EXPECT_NEAR(r->points()[1].elevation, 200.0, 1e-6);
    EXPECT_TRUE(r->elevation_available());
}

TEST(PointNormalizerTest, EdgeGapsClampToNearestKnown) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0),
        north(100.0, 300.0),
        north(200.0, 320.0),
        north(300.0),
    };
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->points()[0].elevation, 300.0);
    EXPECT_DOUBLE_EQ(r->points()[3].elevation, 320.0);
}

TEST(PointNormalizerTest, NoElevationAnywhereGivesZeros) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{north(0.0), north(100.0), north(200.0)};
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->elevation_available());
    for (const auto& p : r->points()) {
        EXPECT_DOUBLE_EQ(p.elevation, 0.0);
    }
}

// ─── Timestamps ───────────────────────────────────────────────────────────────

TEST(PointNormalizerTest, RegressionIsFatalWhenLoadBearing) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0, 100.0, 1000.0),
        north(0.0, 100.0, 1001.0),  // duplicate, collapses
        north(100.0, 100.0, 1010.0),
        north(200.0, 100.0, 1005.0),
    };
    auto r = n.normalize(raw, /*timestamps_load_bearing=*/true);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::TemporalOrder);
    // Reported against the raw input, not the collapsed sequence.
    EXPECT_EQ(r.error().point_index.value_or(0), 3u);
}

TEST(PointNormalizerTest, RegressionDropsTimestampsOtherwise) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0, 100.0, 1000.0),
        north(100.0, 100.0, 1010.0),
        north(200.0, 100.0, 1005.0),
    };
    auto r = n.normalize(raw);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_timestamps());
}

TEST(PointNormalizerTest, OrderedTimestampsAreKept) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0, 100.0, 1000.0),
        north(100.0, 100.0),
        north(200.0, 100.0, 1020.0),
    };
    auto r = n.normalize(raw, true);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->has_timestamps());
    EXPECT_FALSE(r->points()[1].timestamp.has_value());
    EXPECT_DOUBLE_EQ(r->back().timestamp.value_or(0.0), 1020.0);
}

// ─── Idempotence ──────────────────────────────────────────────────────────────

TEST(PointNormalizerTest, NormalizingTwiceChangesNothing) {
    PointNormalizer n;
    std::vector<TrackPoint> raw{
        north(0.0),
        north(0.0, 120.0),
        north(80.0),
        north(250.0, 160.0, 50.0),
        north(250.0),
        north(400.0, 140.0, 80.0),
        north(500.0),
    };
    auto once = n.normalize(raw);
    ASSERT_TRUE(once.has_value());
    const auto again_raw = to_raw(*once);
    auto twice = n.normalize(again_raw);
    ASSERT_TRUE(twice.has_value());

    ASSERT_EQ(once->size(), twice->size());
    for (std::size_t i = 0; i < once->size(); ++i) {
        const auto& a = once->points()[i];
        const auto& b = twice->points()[i];
        EXPECT_EQ(a.latitude,  b.latitude);
        EXPECT_EQ(a.longitude, b.longitude);
        EXPECT_EQ(a.elevation, b.elevation);
        EXPECT_EQ(a.timestamp, b.timestamp);
    }
    EXPECT_EQ(once->elevation_available(), twice->elevation_available());
}
