/// @file src/technicity/technicity_scorer.cpp
/// @brief TechnicityScorer: weighted saturating score, tags, advisory ordinals.

#include "trka/technicity.hpp"

#include <algorithm>
#include <cmath>

namespace trka::technicity {

namespace {

/// weight · (1 − e^(−x/ref)); 0 for non-positive or non-finite input.
[[nodiscard]] double term(const TechnicityTerm& t, double x) noexcept {
    if (!std::isfinite(x) || x <= 0.0 || t.reference <= 0.0) return 0.0;
    return t.weight * (1.0 - std::exp(-x / t.reference));
}

[[nodiscard]] bool usable(const GeometrySummary& s) noexcept {
    return s.elevation_available
        && std::isfinite(s.max_altitude_m)
        && std::isfinite(s.min_altitude_m)
        && std::isfinite(s.avg_altitude_m)
        && std::isfinite(s.max_slope_pct)
        && std::isfinite(s.avg_uphill_slope_pct);
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

TechnicityScorer::TechnicityScorer(TechnicityConfig config) noexcept
    : config_(config) {}

// ─── slope_spread ─────────────────────────────────────────────────────────────

double TechnicityScorer::slope_spread(std::span<const ProfileSegment> profile) noexcept {
    double w_sum = 0.0;
    double mean  = 0.0;
    for (const auto& s : profile) {
        if (!s.slope_pct || s.length_km <= 0.0) continue;
        w_sum += s.length_km;
        mean  += s.length_km * *s.slope_pct;
    }
    if (w_sum <= 0.0) return 0.0;
    mean /= w_sum;

    double var = 0.0;
    for (const auto& s : profile) {
        if (!s.slope_pct || s.length_km <= 0.0) continue;
        const double d = *s.slope_pct - mean;
        var += s.length_km * d * d;
    }
    return std::sqrt(var / w_sum);
}

// ─── technicity_score ─────────────────────────────────────────────────────────

double TechnicityScorer::technicity_score(const GeometrySummary& summary,
                                          double slope_spread_pct) const noexcept {
    const double range = summary.max_altitude_m - summary.min_altitude_m;
    const double raw = term(config_.max_slope,      summary.max_slope_pct)
                     + term(config_.uphill_slope,   summary.avg_uphill_slope_pct)
                     + term(config_.altitude_range, range)
                     + term(config_.slope_spread,   slope_spread_pct);
    return std::clamp(100.0 * raw, 0.0, 100.0);
}

// ─── environment_tags ─────────────────────────────────────────────────────────

std::set<EnvironmentTag>
TechnicityScorer::environment_tags(const GeometrySummary& s) const {
    std::set<EnvironmentTag> tags;
    if (!usable(s)) return tags;

    if (s.max_altitude_m > config_.high_mountain_altitude_m) {
        tags.insert(EnvironmentTag::HighMountain);
        if (s.max_slope_pct > config_.skyrunning_min_slope_pct) {
            tags.insert(EnvironmentTag::Skyrunning);
        }
    }
    if (s.max_altitude_m > config_.mid_mountain_altitude_m) {
        tags.insert(EnvironmentTag::MidMountain);
    }
    if (s.avg_altitude_m >= config_.forest_min_altitude_m &&
        s.avg_altitude_m <= config_.treeline_altitude_m) {
        tags.insert(EnvironmentTag::Forest);
    }
    if (s.min_altitude_m <= config_.coastal_max_altitude_m) {
        tags.insert(EnvironmentTag::Coastal);
    }
    // Towns sit low and their streets are gentle.
    if (s.min_altitude_m < config_.urban_max_altitude_m &&
        s.avg_uphill_slope_pct < 3.0 &&
        s.max_slope_pct < 8.0) {
        tags.insert(EnvironmentTag::Urban);
    }
    if (s.total_distance_km > 0.0 &&
        s.elevation_gain_m / s.total_distance_km > config_.vertical_gain_per_km_m) {
        tags.insert(EnvironmentTag::Vertical);
    }
    return tags;
}

// ─── mud_index ────────────────────────────────────────────────────────────────

MudIndex TechnicityScorer::mud_index(const GeometrySummary& s) const noexcept {
    if (!usable(s)) return MudIndex::Unknown;

    // Steep ground drains; gentle forest floors hold water.
    if (s.max_slope_pct >= 35.0) return MudIndex::Low;
    if (s.avg_altitude_m >= config_.forest_min_altitude_m &&
        s.avg_altitude_m <= config_.treeline_altitude_m &&
        s.avg_uphill_slope_pct < 6.0) {
        return MudIndex::High;
    }
    if (s.avg_altitude_m < config_.treeline_altitude_m) return MudIndex::Moderate;
    return MudIndex::Low;
}

// ─── exposure ─────────────────────────────────────────────────────────────────

Exposure TechnicityScorer::exposure(const GeometrySummary& s) const noexcept {
    if (!usable(s)) return Exposure::Unknown;

    if (s.max_altitude_m > config_.high_mountain_altitude_m || s.max_slope_pct > 40.0) {
        return Exposure::Exposed;
    }
    if (s.max_altitude_m > config_.treeline_altitude_m ||
        s.avg_altitude_m < config_.forest_min_altitude_m) {
        return Exposure::Moderate;
    }
    return Exposure::Sheltered;
}

// ─── level_for ────────────────────────────────────────────────────────────────

TechnicityLevel TechnicityScorer::level_for(double score) noexcept {
    if (score < 20.0) return TechnicityLevel::Smooth;
    if (score < 40.0) return TechnicityLevel::SlightlyTechnical;
    if (score < 60.0) return TechnicityLevel::Technical;
    if (score < 80.0) return TechnicityLevel::VeryTechnical;
    return TechnicityLevel::Aerial;
}

// ─── score ────────────────────────────────────────────────────────────────────

TechnicityProfile
TechnicityScorer::score(const GeometrySummary& summary,
                        std::span<const ProfileSegment> profile) const {
    const double spread = slope_spread(profile);
    const double value  = technicity_score(summary, spread);

    return TechnicityProfile{
        .technicity_score = value,
        .level            = level_for(value),
        .environment_tags = environment_tags(summary),
        .mud_index        = mud_index(summary),
        .exposure         = exposure(summary),
    };
}

}  // namespace trka::technicity
