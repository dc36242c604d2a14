#pragma once

#include <cstddef>

/// @file include/trka/constants.hpp
/// @brief Physical constants and default thresholds for the track analytics core.
///
/// Every tunable value below is only a *default*: components read their
/// thresholds from the config structs in `trka/config.hpp`, which are seeded
/// from these constants.

namespace trka::constants {

// ─── Earth Model ──────────────────────────────────────────────────────────────

/// Mean Earth radius (IUGG) in kilometres. Used by the haversine distance.
static constexpr double EARTH_RADIUS_KM = 6371.0088;

static constexpr double EARTH_RADIUS_M = EARTH_RADIUS_KM * 1000.0;

static constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

// ─── Point Validation ─────────────────────────────────────────────────────────

static constexpr double MAX_ABS_LATITUDE  = 90.0;
static constexpr double MAX_ABS_LONGITUDE = 180.0;

/// Plausible elevation window. Anything outside is treated as a corrupt sample
/// (e.g. feet/metres confusion or a barometer glitch).
static constexpr double MIN_ELEVATION_M = -500.0;
static constexpr double MAX_ELEVATION_M = 9000.0;

/// Minimum number of distinct points for a usable track.
static constexpr std::size_t MIN_TRACK_POINTS = 2;

// ─── Geometry ─────────────────────────────────────────────────────────────────

/// Elevation swings below this amplitude are rejected as GPS/barometric jitter.
static constexpr double ELEVATION_NOISE_THRESHOLD_M = 2.0;

/// Total distance is reported with this many decimals (km → metre resolution).
static constexpr int DISTANCE_DECIMALS = 3;

// ─── Topology ─────────────────────────────────────────────────────────────────

/// Closure ≤ this fraction of the total distance → start and end coincide.
static constexpr double LOOP_CLOSURE_FRACTION = 0.05;

/// Absolute closure tolerance for very short tracks.
static constexpr double CLOSURE_FLOOR_M = 50.0;

/// A sample lies "on" the return path when it is within this distance.
static constexpr double OVERLAP_DISTANCE_M = 100.0;

static constexpr double OVERLAP_MAJORITY = 0.5;

/// Overlap ratio above which out-and-back beats loop when both are plausible.
static constexpr double OUT_AND_BACK_MIN_OVERLAP = 0.6;

/// Upper bound on outbound samples, independent of track length.
static constexpr std::size_t MAX_OVERLAP_SAMPLES = 200;

/// Preferred spacing between outbound samples.
static constexpr double OVERLAP_SAMPLE_SPACING_M = 25.0;

// ─── Technicity ───────────────────────────────────────────────────────────────

static constexpr double HIGH_MOUNTAIN_ALTITUDE_M = 2000.0;
static constexpr double MID_MOUNTAIN_ALTITUDE_M  = 1000.0;
static constexpr double SKYRUNNING_MIN_SLOPE_PCT = 30.0;
static constexpr double TREELINE_ALTITUDE_M      = 1800.0;
static constexpr double FOREST_MIN_ALTITUDE_M    = 300.0;
static constexpr double COASTAL_MAX_ALTITUDE_M   = 50.0;
static constexpr double URBAN_MAX_ALTITUDE_M     = 400.0;
static constexpr double VERTICAL_GAIN_PER_KM_M   = 150.0;

// ─── Effort & Pacing ──────────────────────────────────────────────────────────

/// Metres of climbing equivalent to one flat kilometre (km-effort convention).
static constexpr double CLIMB_PENALTY_M = 100.0;

/// Default spacing of checkpoint splits.
static constexpr double CHECKPOINT_INTERVAL_KM = 5.0;

/// Finest checkpoint spacing accepted from configuration.
static constexpr double MIN_CHECKPOINT_INTERVAL_KM = 0.1;

/// Plausible range of an ITRA-like performance index.
static constexpr double MIN_FITNESS_INDEX = 100.0;
static constexpr double MAX_FITNESS_INDEX = 1000.0;

/// Absolute speed floor after every penalty (km-effort per hour).
static constexpr double MIN_SPEED_KMEH = 2.5;

static constexpr double SECONDS_PER_HOUR = 3600.0;

} // namespace trka::constants
