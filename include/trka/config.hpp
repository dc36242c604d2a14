#pragma once

/// @file include/trka/config.hpp
/// @brief Immutable configuration values for each pipeline stage.
///
/// Configuration is loaded once (defaults, or `ConfigLoader::load_json`) and
/// passed by value into each component. Components never read global state,
/// so analyses on different threads can share one AnalyzerConfig freely.

#include "trka/constants.hpp"

#include <cstddef>
#include <vector>

namespace trka {

// ─── Stage Configs ────────────────────────────────────────────────────────────

struct NormalizerConfig {
    double min_elevation_m = constants::MIN_ELEVATION_M;
    double max_elevation_m = constants::MAX_ELEVATION_M;
};

struct GeometryConfig {
    /// Elevation swings smaller than this are rejected as noise.
    double noise_threshold_m = constants::ELEVATION_NOISE_THRESHOLD_M;
};

struct TopologyConfig {
    double      loop_closure_fraction    = constants::LOOP_CLOSURE_FRACTION;
    double      closure_floor_m          = constants::CLOSURE_FLOOR_M;
    double      overlap_distance_m       = constants::OVERLAP_DISTANCE_M;
    double      overlap_majority         = constants::OVERLAP_MAJORITY;
    double      out_and_back_min_overlap = constants::OUT_AND_BACK_MIN_OVERLAP;
    std::size_t max_overlap_samples      = constants::MAX_OVERLAP_SAMPLES;
    double      sample_spacing_m         = constants::OVERLAP_SAMPLE_SPACING_M;
};

/// Weight and saturation reference for one technicity term.
/// The term contributes weight · (1 − exp(−x / reference)).
struct TechnicityTerm {
    double weight;
    double reference;
};

struct TechnicityConfig {
    TechnicityTerm max_slope      {0.35, 25.0};    ///< %, max |slope|
    TechnicityTerm uphill_slope   {0.25, 12.0};    ///< %, avg uphill slope
    TechnicityTerm altitude_range {0.20, 1200.0};  ///< m, max − min
    TechnicityTerm slope_spread   {0.20, 12.0};    ///< %, stddev of segment slopes

    double high_mountain_altitude_m = constants::HIGH_MOUNTAIN_ALTITUDE_M;
    double mid_mountain_altitude_m  = constants::MID_MOUNTAIN_ALTITUDE_M;
    double skyrunning_min_slope_pct = constants::SKYRUNNING_MIN_SLOPE_PCT;
    double treeline_altitude_m      = constants::TREELINE_ALTITUDE_M;
    double forest_min_altitude_m    = constants::FOREST_MIN_ALTITUDE_M;
    double coastal_max_altitude_m   = constants::COASTAL_MAX_ALTITUDE_M;
    double urban_max_altitude_m     = constants::URBAN_MAX_ALTITUDE_M;
    double vertical_gain_per_km_m   = constants::VERTICAL_GAIN_PER_KM_M;
};

/// Flat speed and technical-terrain sensitivity of one reference runner.
struct PaceReference {
    double flat_speed_kmeh;        ///< km-effort per hour on easy terrain
    double technicity_sensitivity; ///< Fractional slowdown at technicity 100
};

/// One knot of the fitness-index → pace curve.
struct FitnessKnot {
    double        fitness_index;
    PaceReference pace;
};

struct PredictorConfig {
    double climb_penalty_m        = constants::CLIMB_PENALTY_M;
    double checkpoint_interval_km = constants::CHECKPOINT_INTERVAL_KM;

    PaceReference hiker  {4.5, 0.45};
    PaceReference runner {9.0, 0.30};
    PaceReference elite  {13.0, 0.15};

    /// Strictly increasing in fitness_index. Interpolated linearly, clamped at
    /// both ends.
    std::vector<FitnessKnot> fitness_curve{
        {200.0,  {3.0,  0.50}},
        {400.0,  {5.6,  0.40}},
        {500.0,  {8.0,  0.32}},
        {650.0,  {11.6, 0.24}},
        {800.0,  {15.2, 0.15}},
        {1000.0, {20.0, 0.10}},
    };
    double min_fitness_index = constants::MIN_FITNESS_INDEX;
    double max_fitness_index = constants::MAX_FITNESS_INDEX;

    /// Local cost multiplier on segments steeper than steep_slope_pct.
    double steep_slope_pct = 20.0;
    double steep_penalty   = 1.2;

    /// Fatigue: −decay_rate_per_step speed per decay_step_km effort-km beyond
    /// decay_start_km, capped at decay_max_total.
    double decay_start_km      = 40.0;
    double decay_step_km       = 20.0;
    double decay_rate_per_step = 0.05;
    double decay_max_total     = 0.40;

    double min_speed_kmeh = constants::MIN_SPEED_KMEH;

    double endurance_multiplier = 0.85;
    double push_multiplier      = 1.15;
};

// ─── Aggregate ────────────────────────────────────────────────────────────────

struct AnalyzerConfig {
    NormalizerConfig normalizer{};
    GeometryConfig   geometry{};
    TopologyConfig   topology{};
    TechnicityConfig technicity{};
    PredictorConfig  predictor{};
};

}  // namespace trka
