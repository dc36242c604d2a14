#pragma once

/// @file include/trka/types.hpp
/// @brief Shared value types for the track analytics core.
///
/// Every entity here is created fresh per analysis request and never mutated
/// afterwards. Nothing in the core persists them; storing an AnalysisResult is
/// the caller's business.

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace trka {

namespace normalize {
class PointNormalizer;
}  // namespace normalize

/// Durations are fractional seconds throughout.
using Seconds = std::chrono::duration<double>;

// ─── Raw and Normalized Points ────────────────────────────────────────────────

/// One raw GPS sample as produced by a file parser.
struct TrackPoint {
    double latitude;                  ///< Degrees, WGS84
    double longitude;                 ///< Degrees, WGS84
    std::optional<double> elevation;  ///< Metres above sea level
    std::optional<double> timestamp;  ///< Unix epoch seconds (UTC)
};

/// A cleaned sample: elevation is always present.
struct NormalizedPoint {
    double latitude;
    double longitude;
    double elevation;
    std::optional<double> timestamp;
};

/// Ordered, cleaned point sequence.
///
/// Invariants (established by PointNormalizer, the only producer):
///   - at least two points
///   - no two consecutive points share both coordinates
///   - every elevation is set (interpolated where the source had gaps)
///   - timestamps, where present, never decrease
class NormalizedTrack {
public:
    [[nodiscard]] std::span<const NormalizedPoint> points() const noexcept {
        return points_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] const NormalizedPoint& front() const noexcept { return points_.front(); }
    [[nodiscard]] const NormalizedPoint& back() const noexcept { return points_.back(); }

    /// False when the raw track carried no elevation at all (elevations are 0).
    [[nodiscard]] bool elevation_available() const noexcept { return elevation_available_; }

    /// True when at least one point carries a timestamp.
    [[nodiscard]] bool has_timestamps() const noexcept;

private:
    friend class normalize::PointNormalizer;

    NormalizedTrack(std::vector<NormalizedPoint> points, bool elevation_available)
        : points_(std::move(points)), elevation_available_(elevation_available) {}

    std::vector<NormalizedPoint> points_;
    bool elevation_available_;
};

// ─── Geometry ─────────────────────────────────────────────────────────────────

/// Scalar descriptors of one track.
struct GeometrySummary {
    double total_distance_km;     ///< Sum of great-circle segments, 3 decimals
    double elevation_gain_m;      ///< Committed positive elevation change
    double elevation_loss_m;      ///< Committed negative elevation change (≥ 0)
    double max_altitude_m;
    double min_altitude_m;
    double avg_altitude_m;        ///< Arithmetic mean over points
    double max_slope_pct;         ///< Max |segment slope|
    double avg_uphill_slope_pct;  ///< Distance-weighted mean of climbing segments
    double longest_climb_m;       ///< Largest single committed climb
    bool   elevation_available;   ///< False → all elevation fields are 0
};

/// One consecutive-point segment of the elevation profile.
struct ProfileSegment {
    double start_km;                  ///< Cumulative distance at segment start
    double length_km;                 ///< Horizontal length
    double start_elevation_m;
    double elevation_delta_m;         ///< end − start
    std::optional<double> slope_pct;  ///< Unset for zero-length segments
};

/// Km-effort style indices derived from distance and climbing.
struct EffortSummary {
    double km_effort;    ///< distance + gain / 100, one decimal
    int    ibp_index;    ///< Slope-weighted effort index
    int    itra_points;  ///< 0..6
};

// ─── Topology ─────────────────────────────────────────────────────────────────

enum class RouteType {
    Loop,
    OutAndBack,
    PointToPoint,
};

[[nodiscard]] const char* to_string(RouteType t) noexcept;

/// Classification plus the measurements that produced it.
struct TopologyReport {
    RouteType   route_type;
    double      closure_distance_m;
    double      overlap_ratio;              ///< Share of outbound samples on the return path
    double      median_overlap_distance_m;  ///< Median nearest distance to the return path
    std::size_t samples;                    ///< Outbound samples taken
};

// ─── Technicity ───────────────────────────────────────────────────────────────

enum class EnvironmentTag {
    HighMountain,
    MidMountain,
    Forest,
    Coastal,
    Urban,
    Vertical,
    Skyrunning,
};

[[nodiscard]] const char* to_string(EnvironmentTag t) noexcept;

/// Advisory ordinal: how likely the terrain holds mud.
enum class MudIndex { Unknown, Low, Moderate, High };

/// Advisory ordinal: exposure to sun, wind and drops.
enum class Exposure { Unknown, Sheltered, Moderate, Exposed };

/// Coarse difficulty band of the technicity score (20 points per band).
enum class TechnicityLevel { Smooth, SlightlyTechnical, Technical, VeryTechnical, Aerial };

[[nodiscard]] const char* to_string(MudIndex m) noexcept;
[[nodiscard]] const char* to_string(Exposure e) noexcept;
[[nodiscard]] const char* to_string(TechnicityLevel l) noexcept;

struct TechnicityProfile {
    double                   technicity_score;  ///< [0, 100]
    TechnicityLevel          level;
    std::set<EnvironmentTag> environment_tags;
    MudIndex                 mud_index;
    Exposure                 exposure;
};

// ─── Runner Profiles & Predictions ────────────────────────────────────────────

enum class Archetype { Hiker, Runner, Elite };

[[nodiscard]] const char* to_string(Archetype a) noexcept;

/// External runner descriptor. With neither field set, the predictor
/// evaluates all three archetypes.
struct RunnerProfile {
    std::optional<double>    fitness_index;  ///< ITRA-like performance index
    std::optional<Archetype> archetype;
};

struct Checkpoint {
    double  distance_km;
    Seconds cumulative_time;
};

/// Finish times at three effort levels; `race` equals the headline estimate.
struct IntensityBand {
    Seconds endurance;
    Seconds race;
    Seconds push;
};

struct PredictionResult {
    std::optional<Archetype> archetype;
    std::optional<double>    fitness_index;
    double                   flat_speed_kmeh;  ///< Before technicity and fatigue
    double                   effort_km;
    Seconds                  total_time_estimate;
    std::vector<Checkpoint>  checkpoint_splits;
    IntensityBand            band;
};

/// Pace actually achieved on the recording (timestamps load-bearing).
struct RecordedTiming {
    Seconds elapsed;
    double  effort_speed_kmeh;
};

// ─── Analysis Result ──────────────────────────────────────────────────────────

struct Coordinate {
    double latitude;
    double longitude;
};

struct AnalysisResult {
    GeometrySummary               geometry;
    RouteType                     route_type;
    TopologyReport                topology;
    TechnicityProfile             technicity;
    EffortSummary                 effort;
    std::vector<PredictionResult> predictions;
    std::optional<RecordedTiming> recorded;
    Coordinate                    start;
    Coordinate                    end;

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

/// "4h05" style rendering, minutes truncated.
[[nodiscard]] std::string format_duration(Seconds d);

}  // namespace trka
