/// @file src/predict/split_planner.cpp
/// @brief SplitPlanner: distribute a target time over waypoints by leg cost.

#include "trka/predictor.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace trka::predict {

namespace {

constexpr double START_TOLERANCE_KM  = 0.1;
constexpr double FINISH_TOLERANCE_KM = 0.5;

struct Leg {
    double cost   = 0.0;
    double km     = 0.0;
    double gain_m = 0.0;
    double loss_m = 0.0;
};

[[nodiscard]] double profile_length(std::span<const ProfileSegment> profile) noexcept {
    if (profile.empty()) return 0.0;
    return profile.back().start_km + profile.back().length_km;
}

/// Elevation at cumulative distance `km`, linear within a segment.
[[nodiscard]] double altitude_at(std::span<const ProfileSegment> profile, double km) noexcept {
    for (const auto& s : profile) {
        if (km <= s.start_km + s.length_km) {
            const double t = s.length_km > 0.0
                ? std::clamp((km - s.start_km) / s.length_km, 0.0, 1.0)
                : 1.0;
            return s.start_elevation_m + t * s.elevation_delta_m;
        }
    }
    const auto& last = profile.back();
    return last.start_elevation_m + last.elevation_delta_m;
}

/// Accumulate the share of every segment overlapping [from, to).
[[nodiscard]] Leg measure_leg(std::span<const ProfileSegment> profile,
                              double from, double to,
                              const PredictorConfig& config) noexcept {
    Leg leg;
    for (const auto& s : profile) {
        const double s_end = s.start_km + s.length_km;
        const double lo = std::max(from, s.start_km);
        const double hi = std::min(to, s_end);
        if (hi <= lo || s.length_km <= 0.0) continue;

        const double frac = (hi - lo) / s.length_km;
        leg.cost   += frac * segment_cost(s, 1.0, config);
        leg.km     += hi - lo;
        leg.gain_m += frac * std::max(0.0, s.elevation_delta_m);
        leg.loss_m += frac * std::max(0.0, -s.elevation_delta_m);
    }
    return leg;
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

SplitPlanner::SplitPlanner(PredictorConfig config)
    : config_(std::move(config)) {}

// ─── plan ─────────────────────────────────────────────────────────────────────

Outcome<SplitPlan>
SplitPlanner::plan(std::span<const ProfileSegment> profile,
                   Seconds target_time,
                   std::span<const Waypoint> waypoints,
                   double fatigue_factor) const {
    if (!std::isfinite(target_time.count()) || target_time.count() <= 0.0) {
        return make_error(ErrorKind::InvalidProfile,
                          fmt::format("target time must be positive, got {} s",
                                      target_time.count()));
    }
    if (!std::isfinite(fatigue_factor) || fatigue_factor <= 0.0) {
        return make_error(ErrorKind::InvalidProfile,
                          fmt::format("fatigue factor must be positive, got {}", fatigue_factor));
    }
    if (profile.empty()) {
        return make_error(ErrorKind::InsufficientData, "cannot plan splits on an empty profile");
    }

    const double total_km = profile_length(profile);

    std::vector<Waypoint> sorted(waypoints.begin(), waypoints.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Waypoint& a, const Waypoint& b) { return a.km < b.km; });

    std::vector<Waypoint> stops;
    if (sorted.empty() || std::abs(sorted.front().km) > START_TOLERANCE_KM) {
        stops.push_back(Waypoint{0.0, "Start"});
    }
    for (const auto& wp : sorted) {
        if (std::isfinite(wp.km) && wp.km >= 0.0 && wp.km <= total_km + FINISH_TOLERANCE_KM) {
            stops.push_back(wp);
        }
    }
    if (stops.size() < 2 || std::abs(stops.back().km - total_km) > FINISH_TOLERANCE_KM) {
        stops.push_back(Waypoint{total_km, "Finish"});
    }

    // Legs between consecutive stops; the first opens at 0, the last closes
    // at the end of the profile.
    std::vector<Leg> legs;
    legs.reserve(stops.size() - 1);
    for (std::size_t i = 1; i < stops.size(); ++i) {
        const double from = (i == 1) ? 0.0 : stops[i - 1].km;
        const double to   = (i + 1 == stops.size()) ? total_km : stops[i].km;
        legs.push_back(measure_leg(profile, from, to, config_));
    }

    double cost_total = 0.0;
    for (const auto& leg : legs) cost_total += leg.cost;
    if (cost_total <= 0.0) cost_total = 1.0;

    // Linear drift 1 → fatigue_factor over cost already covered.
    std::vector<double> weighted;
    weighted.reserve(legs.size());
    double weighted_total = 0.0;
    double progress_cost  = 0.0;
    for (const auto& leg : legs) {
        const double drift = 1.0 + (progress_cost / cost_total) * (fatigue_factor - 1.0);
        weighted.push_back(leg.cost * drift);
        weighted_total += weighted.back();
        progress_cost  += leg.cost;
    }

    SplitPlan result{
        .target_time    = target_time,
        .fatigue_factor = fatigue_factor,
        .splits         = {},
    };
    result.splits.reserve(stops.size());
    result.splits.push_back(PlannedSplit{
        .name            = stops.front().name,
        .km              = 0.0,
        .altitude_m      = profile.front().start_elevation_m,
        .segment_km      = 0.0,
        .segment_gain_m  = 0.0,
        .segment_loss_m  = 0.0,
        .segment_time    = Seconds{0.0},
        .cumulative_time = Seconds{0.0},
    });

    Seconds elapsed{0.0};
    for (std::size_t i = 0; i < legs.size(); ++i) {
        const double share = weighted_total > 0.0
            ? weighted[i] / weighted_total
            : 1.0 / static_cast<double>(legs.size());
        const Seconds leg_time = target_time * share;
        elapsed += leg_time;

        const Waypoint& stop = stops[i + 1];
        const double km = std::min(stop.km, total_km);
        result.splits.push_back(PlannedSplit{
            .name            = stop.name,
            .km              = km,
            .altitude_m      = altitude_at(profile, km),
            .segment_km      = legs[i].km,
            .segment_gain_m  = legs[i].gain_m,
            .segment_loss_m  = legs[i].loss_m,
            .segment_time    = leg_time,
            .cumulative_time = elapsed,
        });
    }
    return result;
}

// ─── plan_strategies ──────────────────────────────────────────────────────────

Outcome<StrategySet>
SplitPlanner::plan_strategies(std::span<const ProfileSegment> profile,
                              Seconds target_time,
                              std::span<const Waypoint> waypoints,
                              double fatigue_factor) const {
    auto main = plan(profile, target_time, waypoints, fatigue_factor);
    if (!main) return main.error();

    auto aggressive = plan(profile, target_time, waypoints, StrategySet::AGGRESSIVE_FATIGUE);
    if (!aggressive) return aggressive.error();

    auto even = plan(profile, target_time, waypoints, 1.0);
    if (!even) return even.error();

    return StrategySet{
        .main       = std::move(main).value(),
        .aggressive = std::move(aggressive).value(),
        .even       = std::move(even).value(),
    };
}

}  // namespace trka::predict
