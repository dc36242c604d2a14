#pragma once

/// @file include/trka/predictor.hpp
/// @brief Effort & pacing predictor and target-time split planner.
///
/// # Module: Effort & Pacing Predictor
///
/// ## Effort Distance
///   effort_km = distance_km + elevation_gain_m / climb_penalty_m
///
/// ## Pace
/// Each runner resolves to a PaceReference (flat speed in km-effort/h and a
/// technicity sensitivity):
///   - archetype only   → the configured HIKER / RUNNER / ELITE reference
///   - fitness_index    → piecewise-linear interpolation of fitness_curve
///   - neither          → all three archetypes are evaluated
/// and runs at
///   speed = flat_speed · (1 − sensitivity · technicity / 100) · fatigue(E)
/// floored at min_speed_kmeh, where fatigue(E) decays with the cumulative
/// effort E already covered.
///
/// ## Integration
/// Time is integrated segment by segment over the elevation profile. Each
/// segment costs
///   length_km + climb_m / climb_penalty_m     (×steep_penalty if |slope| > steep_slope_pct)
/// with climbs rescaled so their total matches the committed elevation gain.
/// Checkpoint splits fall every checkpoint_interval_km plus the finish.
///
/// ## Failure
/// InvalidProfile when a fitness_index lies outside
/// [min_fitness_index, max_fitness_index] (catches unit confusion such as a
/// race time passed instead of an index).
///
/// # Module: Split Planner
/// Distributes a caller-chosen target time over waypoints in proportion to
/// each leg's cost, with a linear drift from 1 to `fatigue_factor` along the
/// course (a factor > 1 front-loads the pace).

#include "trka/config.hpp"
#include "trka/errors.hpp"
#include "trka/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace trka::predict {

// ─── Shared ───────────────────────────────────────────────────────────────────

/// Effort-km cost of one profile segment. `climb_scale` rescales the raw
/// positive elevation delta (1.0 = raw).
[[nodiscard]] double segment_cost(const ProfileSegment& seg,
                                  double climb_scale,
                                  const PredictorConfig& config) noexcept;

/// km-effort, IBP-like index and ITRA points of a summary.
[[nodiscard]] EffortSummary effort_summary(const GeometrySummary& summary,
                                           double climb_penalty_m) noexcept;

// ─── PacePredictor ────────────────────────────────────────────────────────────

class PacePredictor {
public:
    explicit PacePredictor(PredictorConfig config = PredictorConfig{});

    /// One PredictionResult per requested profile. An empty `runners` span
    /// evaluates HIKER, RUNNER and ELITE. The first invalid profile fails the
    /// whole call.
    [[nodiscard]] Outcome<std::vector<PredictionResult>>
    predict(const GeometrySummary& summary,
            const TechnicityProfile& technicity,
            std::span<const ProfileSegment> profile,
            std::span<const RunnerProfile> runners = {}) const noexcept;

    /// Predict for a profile that names an archetype and/or a fitness index.
    [[nodiscard]] Outcome<PredictionResult>
    predict_one(const GeometrySummary& summary,
                const TechnicityProfile& technicity,
                std::span<const ProfileSegment> profile,
                const RunnerProfile& runner) const noexcept;

    /// Resolve a runner to its pace reference; validates the fitness index.
    [[nodiscard]] Outcome<PaceReference> resolve(const RunnerProfile& runner) const noexcept;

    [[nodiscard]] PaceReference reference_for(Archetype a) const noexcept;

    /// Interpolate the fitness curve, clamped to its first and last knots.
    [[nodiscard]] PaceReference interpolate(double fitness_index) const noexcept;

    /// Speed multiplier after `effort_done_km` of effort, in (0, 1].
    [[nodiscard]] double fatigue_factor(double effort_done_km) const noexcept;

    [[nodiscard]] double effort_km(const GeometrySummary& summary) const noexcept;

    /// Expand an empty list or open-ended profiles into the three archetypes.
    [[nodiscard]] static std::vector<RunnerProfile>
    expand(std::span<const RunnerProfile> runners);

private:
    PredictorConfig config_;
};

// ─── SplitPlanner ─────────────────────────────────────────────────────────────

struct Waypoint {
    double      km;
    std::string name;
};

struct PlannedSplit {
    std::string name;
    double      km;
    double      altitude_m;
    double      segment_km;
    double      segment_gain_m;
    double      segment_loss_m;
    Seconds     segment_time;
    Seconds     cumulative_time;
};

struct SplitPlan {
    Seconds                   target_time;
    double                    fatigue_factor;
    std::vector<PlannedSplit> splits;  ///< Start row first, finish row last

    [[nodiscard]] std::string to_string() const;
};

/// Main plan plus the two reference strategies.
struct StrategySet {
    SplitPlan main;
    SplitPlan aggressive;  ///< Fast start: drift 1 → AGGRESSIVE_FATIGUE
    SplitPlan even;        ///< No drift

    static constexpr double AGGRESSIVE_FATIGUE = 1.25;
};

class SplitPlanner {
public:
    explicit SplitPlanner(PredictorConfig config = PredictorConfig{});

    [[nodiscard]] Outcome<SplitPlan>
    plan(std::span<const ProfileSegment> profile,
         Seconds target_time,
         std::span<const Waypoint> waypoints,
         double fatigue_factor = 1.0) const;

    [[nodiscard]] Outcome<StrategySet>
    plan_strategies(std::span<const ProfileSegment> profile,
                    Seconds target_time,
                    std::span<const Waypoint> waypoints,
                    double fatigue_factor = 1.0) const;

private:
    PredictorConfig config_;
};

}  // namespace trka::predict
