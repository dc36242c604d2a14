/// @file src/core/report.cpp
/// @brief Enum names, duration formatting and the human-readable reports.

#include "trka/errors.hpp"
#include "trka/predictor.hpp"
#include "trka/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace trka {

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::InsufficientData: return "INSUFFICIENT_DATA";
        case ErrorKind::TemporalOrder:    return "TEMPORAL_ORDER";
        case ErrorKind::InvalidProfile:   return "INVALID_PROFILE";
        case ErrorKind::MalformedPoint:   return "MALFORMED_POINT";
    }
    return "UNKNOWN";
}

const char* to_string(RouteType t) noexcept {
    switch (t) {
        case RouteType::Loop:         return "LOOP";
        case RouteType::OutAndBack:   return "OUT_AND_BACK";
        case RouteType::PointToPoint: return "POINT_TO_POINT";
    }
    return "UNKNOWN";
}

const char* to_string(EnvironmentTag t) noexcept {
    switch (t) {
        case EnvironmentTag::HighMountain: return "HIGH_MOUNTAIN";
        case EnvironmentTag::MidMountain:  return "MID_MOUNTAIN";
        case EnvironmentTag::Forest:       return "FOREST";
        case EnvironmentTag::Coastal:      return "COASTAL";
        case EnvironmentTag::Urban:        return "URBAN";
        case EnvironmentTag::Vertical:     return "VERTICAL";
        case EnvironmentTag::Skyrunning:   return "SKYRUNNING";
    }
    return "UNKNOWN";
}

const char* to_string(MudIndex m) noexcept {
    switch (m) {
        case MudIndex::Unknown:  return "UNKNOWN";
        case MudIndex::Low:      return "LOW";
        case MudIndex::Moderate: return "MODERATE";
        case MudIndex::High:     return "HIGH";
    }
    return "UNKNOWN";
}

const char* to_string(Exposure e) noexcept {
    switch (e) {
        case Exposure::Unknown:   return "UNKNOWN";
        case Exposure::Sheltered: return "SHELTERED";
        case Exposure::Moderate:  return "MODERATE";
        case Exposure::Exposed:   return "EXPOSED";
    }
    return "UNKNOWN";
}

const char* to_string(TechnicityLevel l) noexcept {
    switch (l) {
        case TechnicityLevel::Smooth:            return "SMOOTH";
        case TechnicityLevel::SlightlyTechnical: return "SLIGHTLY_TECHNICAL";
        case TechnicityLevel::Technical:         return "TECHNICAL";
        case TechnicityLevel::VeryTechnical:     return "VERY_TECHNICAL";
        case TechnicityLevel::Aerial:            return "AERIAL";
    }
    return "UNKNOWN";
}

const char* to_string(Archetype a) noexcept {
    switch (a) {
        case Archetype::Hiker:  return "HIKER";
        case Archetype::Runner: return "RUNNER";
        case Archetype::Elite:  return "ELITE";
    }
    return "UNKNOWN";
}

// ─── format_duration ──────────────────────────────────────────────────────────

std::string format_duration(Seconds d) {
    const double s = std::isfinite(d.count()) ? std::max(0.0, d.count()) : 0.0;
    const auto total_min = static_cast<long long>(s / 60.0);
    return fmt::format("{}h{:02d}", total_min / 60, static_cast<int>(total_min % 60));
}

// ─── AnalysisError ────────────────────────────────────────────────────────────

std::string AnalysisError::to_string() const {
    if (point_index) {
        return fmt::format("{} at point {}: {}", trka::to_string(kind), *point_index, message);
    }
    return fmt::format("{}: {}", trka::to_string(kind), message);
}

// ─── AnalysisResult ───────────────────────────────────────────────────────────

std::string AnalysisResult::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "┌──────────────────────────────────────────────────────────┐\n"
        "│                    Track Analysis                        │\n"
        "├────────────────────────────┬─────────────────────────────┤\n"
        "│ Distance                   │ {:>12.3f} km             │\n"
        "│ Elevation gain / loss      │ {:>8.0f} m / {:>6.0f} m        │\n"
        "│ Altitude min / avg / max   │ {:>6.0f} / {:>6.0f} / {:>6.0f} m  │\n"
        "│ Max slope                  │ {:>12.1f} %              │\n"
        "│ Avg uphill slope           │ {:>12.1f} %              │\n"
        "│ Longest climb              │ {:>12.0f} m              │\n"
        "├────────────────────────────┼─────────────────────────────┤\n"
        "│ Route type                 │ {:<27} │\n"
        "│ Closure / overlap          │ {:>8.0f} m / {:>5.1f} %        │\n"
        "│ Technicity                 │ {:>5.1f} {:<21} │\n"
        "│ Mud / exposure             │ {:<11} {:<15} │\n"
        "│ Effort                     │ {:>6.1f} km-e  IBP {:>4}  ITRA {} │\n"
        "└────────────────────────────┴─────────────────────────────┘\n",
        geometry.total_distance_km,
        geometry.elevation_gain_m, geometry.elevation_loss_m,
        geometry.min_altitude_m, geometry.avg_altitude_m, geometry.max_altitude_m,
        geometry.max_slope_pct,
        geometry.avg_uphill_slope_pct,
        geometry.longest_climb_m,
        trka::to_string(route_type),
        topology.closure_distance_m, 100.0 * topology.overlap_ratio,
        technicity.technicity_score, trka::to_string(technicity.level),
        trka::to_string(technicity.mud_index), trka::to_string(technicity.exposure),
        effort.km_effort, effort.ibp_index, effort.itra_points);

    if (!geometry.elevation_available) {
        fmt::format_to(it, "  (no elevation data: climbing figures are zero)\n");
    }

    if (!technicity.environment_tags.empty()) {
        fmt::format_to(it, "  Tags:");
        for (auto tag : technicity.environment_tags) {
            fmt::format_to(it, " {}", trka::to_string(tag));
        }
        fmt::format_to(it, "\n");
    }

    fmt::format_to(it, "  Profile              Endurance      Race      Push\n");
    for (const auto& p : predictions) {
        const std::string label = p.fitness_index
            ? fmt::format("index {:.0f}", *p.fitness_index)
            : std::string(p.archetype ? trka::to_string(*p.archetype) : "?");
        fmt::format_to(it, "  {:<18} {:>11} {:>9} {:>9}\n",
                       label,
                       format_duration(p.band.endurance),
                       format_duration(p.band.race),
                       format_duration(p.band.push));
    }

    if (recorded) {
        fmt::format_to(it, "  Recorded: {}  ({:.2f} km-e/h)\n",
                       format_duration(recorded->elapsed), recorded->effort_speed_kmeh);
    }
    return out;
}

// ─── SplitPlan ────────────────────────────────────────────────────────────────

std::string predict::SplitPlan::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "══════════════════════════════════════════════════════════════════════\n"
        "  Split plan: target {}  fatigue ×{:.2f}\n"
        "══════════════════════════════════════════════════════════════════════\n"
        "  {:<18} {:>7} {:>6} {:>7} {:>6} {:>6} {:>7} {:>8}\n"
        "──────────────────────────────────────────────────────────────────────\n",
        format_duration(target_time), fatigue_factor,
        "Waypoint", "km", "alt", "leg km", "D+", "D-", "leg", "total");

    for (const auto& s : splits) {
        fmt::format_to(it, "  {:<18} {:>7.1f} {:>6.0f} {:>7.1f} {:>6.0f} {:>6.0f} {:>7} {:>8}\n",
                       s.name, s.km, s.altitude_m, s.segment_km,
                       s.segment_gain_m, s.segment_loss_m,
                       format_duration(s.segment_time),
                       format_duration(s.cumulative_time));
    }
    fmt::format_to(it,
        "══════════════════════════════════════════════════════════════════════\n");
    return out;
}

}  // namespace trka
