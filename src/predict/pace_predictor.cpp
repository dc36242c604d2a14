/// @file src/predict/pace_predictor.cpp
/// @brief PacePredictor: effort distance, pace resolution, slope-aware splits.

#include "trka/predictor.hpp"
#include "trka/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace trka::predict {

// ─── segment_cost ─────────────────────────────────────────────────────────────

double segment_cost(const ProfileSegment& seg,
                    double climb_scale,
                    const PredictorConfig& config) noexcept {
    const double climb = std::max(0.0, seg.elevation_delta_m) * climb_scale;
    double cost = seg.length_km;
    if (config.climb_penalty_m > 0.0) {
        cost += climb / config.climb_penalty_m;
    }
    if (seg.slope_pct && std::abs(*seg.slope_pct) > config.steep_slope_pct) {
        cost *= config.steep_penalty;
    }
    return cost;
}

// ─── effort_summary ───────────────────────────────────────────────────────────

EffortSummary effort_summary(const GeometrySummary& summary,
                             double climb_penalty_m) noexcept {
    const double penalty = climb_penalty_m > 0.0 ? climb_penalty_m : constants::CLIMB_PENALTY_M;
    const double km_effort =
        std::round((summary.total_distance_km + summary.elevation_gain_m / penalty) * 10.0) / 10.0;

    // Steep courses earn a 10 % bonus on the effort index.
    double ibp = km_effort;
    if (summary.avg_uphill_slope_pct > 10.0) {
        ibp *= 1.1;
    }

    int itra = 0;
    if (km_effort >= 25.0)  itra = 1;
    if (km_effort >= 40.0)  itra = 2;
    if (km_effort >= 65.0)  itra = 3;
    if (km_effort >= 90.0)  itra = 4;
    if (km_effort >= 140.0) itra = 5;
    if (km_effort >= 190.0) itra = 6;

    return EffortSummary{
        .km_effort   = km_effort,
        .ibp_index   = static_cast<int>(ibp),
        .itra_points = itra,
    };
}

// ─── Constructor ──────────────────────────────────────────────────────────────

PacePredictor::PacePredictor(PredictorConfig config)
    : config_(std::move(config)) {}

// ─── reference_for / interpolate ──────────────────────────────────────────────

PaceReference PacePredictor::reference_for(Archetype a) const noexcept {
    switch (a) {
        case Archetype::Hiker:  return config_.hiker;
        case Archetype::Runner: return config_.runner;
        case Archetype::Elite:  return config_.elite;
    }
    return config_.runner;
}

PaceReference PacePredictor::interpolate(double fitness_index) const noexcept {
    const auto& curve = config_.fitness_curve;
    if (curve.empty()) return config_.runner;
    if (fitness_index <= curve.front().fitness_index) return curve.front().pace;
    if (fitness_index >= curve.back().fitness_index)  return curve.back().pace;

    for (std::size_t i = 1; i < curve.size(); ++i) {
        const FitnessKnot& hi = curve[i];
        if (fitness_index > hi.fitness_index) continue;
        const FitnessKnot& lo = curve[i - 1];
        const double span = hi.fitness_index - lo.fitness_index;
        const double t = span > 0.0 ? (fitness_index - lo.fitness_index) / span : 1.0;
        return PaceReference{
            .flat_speed_kmeh        = lo.pace.flat_speed_kmeh
                + t * (hi.pace.flat_speed_kmeh - lo.pace.flat_speed_kmeh),
            .technicity_sensitivity = lo.pace.technicity_sensitivity
                + t * (hi.pace.technicity_sensitivity - lo.pace.technicity_sensitivity),
        };
    }
    return curve.back().pace;
}

// ─── resolve ──────────────────────────────────────────────────────────────────

Outcome<PaceReference> PacePredictor::resolve(const RunnerProfile& runner) const noexcept {
    if (runner.fitness_index) {
        const double idx = *runner.fitness_index;
        if (!std::isfinite(idx) ||
            idx < config_.min_fitness_index ||
            idx > config_.max_fitness_index) {
            return make_error(ErrorKind::InvalidProfile,
                              fmt::format("fitness index {} outside plausible range [{}, {}]",
                                          idx, config_.min_fitness_index,
                                          config_.max_fitness_index));
        }
        return interpolate(idx);
    }
    if (runner.archetype) {
        return reference_for(*runner.archetype);
    }
    return make_error(ErrorKind::InvalidProfile,
                      "runner profile names neither an archetype nor a fitness index");
}

// ─── fatigue_factor / effort_km ───────────────────────────────────────────────

double PacePredictor::fatigue_factor(double effort_done_km) const noexcept {
    if (effort_done_km <= config_.decay_start_km || config_.decay_step_km <= 0.0) {
        return 1.0;
    }
    const double over  = effort_done_km - config_.decay_start_km;
    const double decay = std::min(over / config_.decay_step_km * config_.decay_rate_per_step,
                                  config_.decay_max_total);
    return 1.0 - decay;
}

double PacePredictor::effort_km(const GeometrySummary& summary) const noexcept {
    if (config_.climb_penalty_m <= 0.0) return summary.total_distance_km;
    return summary.total_distance_km + summary.elevation_gain_m / config_.climb_penalty_m;
}

// ─── expand ───────────────────────────────────────────────────────────────────

std::vector<RunnerProfile> PacePredictor::expand(std::span<const RunnerProfile> runners) {
    static constexpr Archetype ALL[] = {Archetype::Hiker, Archetype::Runner, Archetype::Elite};

    std::vector<RunnerProfile> out;
    if (runners.empty()) {
        for (Archetype a : ALL) out.push_back(RunnerProfile{std::nullopt, a});
        return out;
    }
    for (const auto& r : runners) {
        if (!r.fitness_index && !r.archetype) {
            for (Archetype a : ALL) out.push_back(RunnerProfile{std::nullopt, a});
        } else {
            out.push_back(r);
        }
    }
    return out;
}

// ─── predict_one ──────────────────────────────────────────────────────────────

Outcome<PredictionResult>
PacePredictor::predict_one(const GeometrySummary& summary,
                           const TechnicityProfile& technicity,
                           std::span<const ProfileSegment> profile,
                           const RunnerProfile& runner) const noexcept {
    auto pace = resolve(runner);
    if (!pace) {
        return pace.error();
    }

    const double tech = std::clamp(technicity.technicity_score, 0.0, 100.0);
    const double base_speed = pace->flat_speed_kmeh
        * std::max(0.0, 1.0 - pace->technicity_sensitivity * tech / 100.0);

    // Rescale raw climbs so their total equals the committed gain.
    double raw_climb = 0.0;
    for (const auto& s : profile) raw_climb += std::max(0.0, s.elevation_delta_m);
    const double climb_scale = raw_climb > 0.0 ? summary.elevation_gain_m / raw_climb : 0.0;

    // A missing profile degrades to one segment spanning the whole track.
    std::vector<ProfileSegment> fallback;
    if (profile.empty()) {
        fallback.push_back(ProfileSegment{
            .start_km          = 0.0,
            .length_km         = summary.total_distance_km,
            .start_elevation_m = 0.0,
            .elevation_delta_m = 0.0,
            .slope_pct         = std::nullopt,
        });
        profile = fallback;
    }

    double profile_km = 0.0;
    for (const auto& s : profile) profile_km += s.length_km;

    // Interval checkpoints stop short of the reported finish distance.
    const double finish_km = summary.total_distance_km > 0.0
        ? std::min(profile_km, summary.total_distance_km)
        : profile_km;

    std::vector<Checkpoint> splits;
    const double interval = config_.checkpoint_interval_km > 0.0
        ? std::max(config_.checkpoint_interval_km, constants::MIN_CHECKPOINT_INTERVAL_KM)
        : 0.0;
    double next_cp = interval > 0.0 ? interval : profile_km + 1.0;

    double effort_done = 0.0;
    double hours       = 0.0;

    for (const auto& seg : profile) {
        double cost = segment_cost(seg, climb_scale, config_);
        if (profile.data() == fallback.data()) {
            cost += summary.elevation_gain_m / std::max(config_.climb_penalty_m, 1e-9);
        }

        // Fatigue is evaluated mid-segment.
        const double speed = std::max(config_.min_speed_kmeh,
                                      base_speed * fatigue_factor(effort_done + 0.5 * cost));
        const double seg_hours = cost / speed;
        const double seg_end   = seg.start_km + seg.length_km;

        while (next_cp < seg_end && next_cp < finish_km - 1e-9) {
            const double frac = seg.length_km > 0.0
                ? (next_cp - seg.start_km) / seg.length_km
                : 1.0;
            splits.push_back(Checkpoint{
                .distance_km     = next_cp,
                .cumulative_time = Seconds{(hours + seg_hours * frac) * constants::SECONDS_PER_HOUR},
            });
            next_cp += interval;
        }

        hours       += seg_hours;
        effort_done += cost;
    }

    const Seconds total{hours * constants::SECONDS_PER_HOUR};
    splits.push_back(Checkpoint{
        .distance_km     = summary.total_distance_km,
        .cumulative_time = total,
    });

    return PredictionResult{
        .archetype           = runner.archetype,
        .fitness_index       = runner.fitness_index,
        .flat_speed_kmeh     = pace->flat_speed_kmeh,
        .effort_km           = effort_km(summary),
        .total_time_estimate = total,
        .checkpoint_splits   = std::move(splits),
        .band = IntensityBand{
            .endurance = total / config_.endurance_multiplier,
            .race      = total,
            .push      = total / config_.push_multiplier,
        },
    };
}

// ─── predict ──────────────────────────────────────────────────────────────────

Outcome<std::vector<PredictionResult>>
PacePredictor::predict(const GeometrySummary& summary,
                       const TechnicityProfile& technicity,
                       std::span<const ProfileSegment> profile,
                       std::span<const RunnerProfile> runners) const noexcept {
    const auto expanded = expand(runners);

    std::vector<PredictionResult> results;
    results.reserve(expanded.size());
    for (const auto& r : expanded) {
        auto one = predict_one(summary, technicity, profile, r);
        if (!one) {
            return one.error();
        }
        results.push_back(std::move(one).value());
    }
    return results;
}

}  // namespace trka::predict
