#pragma once

/// @file include/trka/geometry.hpp
/// @brief GeometryEngine: distance, elevation and slope descriptors of a track.
///
/// # Module: Geometry & Elevation Engine
///
/// ## Responsibility
/// Reduce a NormalizedTrack to a GeometrySummary and a per-segment elevation
/// profile.
///
/// ## Elevation Gain and Loss
/// Raw point-to-point summation overstates climbing by 2–5× on noisy
/// recordings. The engine therefore commits elevation change with
/// hysteresis: swings smaller than `noise_threshold_m` are absorbed into the
/// surrounding trend and only moves that accumulate past the threshold count
/// as gain or loss. The filter works on the turning points of the elevation
/// series and retires the smallest sub-threshold swing first, which makes the
/// result independent of traversal direction: reversing a track swaps gain
/// and loss exactly. The first and last moves of the track are always kept,
/// so a clean monotonic climb commits its full raw sum.
///
/// ## Slopes
///   slope_pct = Δelevation / horizontal_distance × 100
/// skipped for zero-length segments. max_slope_pct is the largest absolute
/// segment slope; avg_uphill_slope_pct is the distance-weighted mean over
/// climbing segments, i.e. Σ Δe⁺ / Σ d⁺ × 100.
///
/// ## Guarantees
/// - Pure and deterministic: identical input → bit-identical output
/// - total_distance_km, elevation_gain_m, elevation_loss_m are all ≥ 0

#include "trka/config.hpp"
#include "trka/types.hpp"

#include <span>
#include <vector>

namespace trka::geometry {

/// Summary plus the per-segment profile it was computed from.
struct GeometryReport {
    GeometrySummary             summary;
    std::vector<ProfileSegment> profile;
};

/// Committed elevation change after noise rejection.
struct ElevationTotals {
    double gain_m;
    double loss_m;
    double longest_climb_m;
};

class GeometryEngine {
public:
    explicit GeometryEngine(GeometryConfig config = GeometryConfig{}) noexcept;

    [[nodiscard]] GeometryReport analyze(const NormalizedTrack& track) const;

    [[nodiscard]] GeometrySummary summarize(const NormalizedTrack& track) const;

    /// One ProfileSegment per consecutive point pair.
    [[nodiscard]] static std::vector<ProfileSegment>
    profile(const NormalizedTrack& track);

    /// Hysteresis-filtered gain/loss of an elevation series.
    [[nodiscard]] static ElevationTotals
    committed_elevation(std::span<const double> elevations,
                        double noise_threshold_m);

    /// Cumulative distance (metres) at every point; front() == 0.
    [[nodiscard]] static std::vector<double>
    cumulative_distance_m(const NormalizedTrack& track);

private:
    GeometryConfig config_;
};

}  // namespace trka::geometry
