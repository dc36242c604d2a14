/// @file src/core/analyzer.cpp
/// @brief Analyzer: pipeline orchestration.

#include "trka/analyzer.hpp"
#include "trka/constants.hpp"

namespace trka::core {

// ─── Constructor ──────────────────────────────────────────────────────────────

Analyzer::Analyzer(AnalyzerConfig config)
    : config_(std::move(config))
    , normalizer_(config_.normalizer)
    , geometry_(config_.geometry)
    , topology_(config_.topology)
    , technicity_(config_.technicity)
    , predictor_(config_.predictor)
{}

// ─── recorded_timing ──────────────────────────────────────────────────────────

std::optional<RecordedTiming>
Analyzer::recorded_timing(const NormalizedTrack& track, double effort_km) noexcept {
    std::optional<double> first;
    std::optional<double> last;
    for (const auto& p : track.points()) {
        if (!p.timestamp) continue;
        if (!first) first = p.timestamp;
        last = p.timestamp;
    }
    if (!first || !last || *last <= *first) {
        return std::nullopt;
    }

    const Seconds elapsed{*last - *first};
    const double hours = elapsed.count() / constants::SECONDS_PER_HOUR;
    return RecordedTiming{
        .elapsed           = elapsed,
        .effort_speed_kmeh = effort_km / hours,
    };
}

// ─── analyze ──────────────────────────────────────────────────────────────────

Outcome<AnalysisResult>
Analyzer::analyze(std::span<const TrackPoint> raw_points,
                  std::span<const RunnerProfile> runners,
                  AnalysisOptions options) const noexcept {
    // ── Step 1: Validate and clean ────────────────────────────────────────────
    auto track = normalizer_.normalize(raw_points, options.use_recorded_timing);
    if (!track) {
        return track.error();
    }

    // ── Step 2: Distance, elevation and slope descriptors ─────────────────────
    auto geo = geometry_.analyze(*track);

    // ── Step 3: Route shape ───────────────────────────────────────────────────
    auto topo = topology_.inspect(*track, geo.summary);

    // ── Step 4: Difficulty and terrain ────────────────────────────────────────
    auto tech = technicity_.score(geo.summary, geo.profile);

    // ── Step 5: Effort indices ────────────────────────────────────────────────
    const auto effort = predict::effort_summary(geo.summary, config_.predictor.climb_penalty_m);

    // ── Step 6: Finish-time predictions ───────────────────────────────────────
    auto predictions = predictor_.predict(geo.summary, tech, geo.profile, runners);
    if (!predictions) {
        return predictions.error();
    }

    std::optional<RecordedTiming> recorded;
    if (options.use_recorded_timing) {
        recorded = recorded_timing(*track, predictor_.effort_km(geo.summary));
    }

    const auto& first = track->front();
    const auto& last  = track->back();

    return AnalysisResult{
        .geometry    = geo.summary,
        .route_type  = topo.route_type,
        .topology    = topo,
        .technicity  = std::move(tech),
        .effort      = effort,
        .predictions = std::move(predictions).value(),
        .recorded    = recorded,
        .start       = Coordinate{first.latitude, first.longitude},
        .end         = Coordinate{last.latitude, last.longitude},
    };
}

}  // namespace trka::core
