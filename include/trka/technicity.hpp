#pragma once

/// @file include/trka/technicity.hpp
/// @brief TechnicityScorer: rule-based difficulty score and terrain tags.
///
/// # Module: Technicity & Terrain Scorer
///
/// ## Score
///   score = 100 · Σᵢ wᵢ · (1 − exp(−xᵢ / refᵢ)),   clamped to [0, 100]
///
/// with the four terms
///   x₁ = max_slope_pct
///   x₂ = avg_uphill_slope_pct
///   x₃ = max_altitude_m − min_altitude_m
///   x₄ = distance-weighted standard deviation of segment slopes
///
/// Every term is strictly increasing in its input, so a steeper, more
/// irregular or higher-ranging track scores strictly higher, all else equal.
/// Without a profile the slope-spread term is 0.
///
/// ## Tags and Ordinals
/// Environment tags are non-exclusive. Altitude tags only test thresholds
/// that raising max_altitude_m can never un-meet. Mud index and exposure are
/// advisory heuristics; when elevation data is missing or inputs are
/// non-finite they degrade to Unknown and the tag set is empty.
///
/// ## Guarantees
/// - Deterministic, stateless, never fails

#include "trka/config.hpp"
#include "trka/types.hpp"

#include <set>
#include <span>

namespace trka::technicity {

class TechnicityScorer {
public:
    explicit TechnicityScorer(TechnicityConfig config = TechnicityConfig{}) noexcept;

    [[nodiscard]] TechnicityProfile
    score(const GeometrySummary& summary,
          std::span<const ProfileSegment> profile = {}) const;

    /// Numeric score only.
    [[nodiscard]] double
    technicity_score(const GeometrySummary& summary,
                     double slope_spread_pct) const noexcept;

    /// Distance-weighted standard deviation of segment slopes (percent).
    [[nodiscard]] static double
    slope_spread(std::span<const ProfileSegment> profile) noexcept;

    [[nodiscard]] std::set<EnvironmentTag>
    environment_tags(const GeometrySummary& summary) const;

    [[nodiscard]] MudIndex mud_index(const GeometrySummary& summary) const noexcept;
    [[nodiscard]] Exposure exposure(const GeometrySummary& summary) const noexcept;

    [[nodiscard]] static TechnicityLevel level_for(double score) noexcept;

private:
    TechnicityConfig config_;
};

}  // namespace trka::technicity
