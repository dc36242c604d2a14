#pragma once

/// @file include/trka/analyzer.hpp
/// @brief Analyzer: the track analytics pipeline as one call.
///
/// # Module: Analyzer
///
/// ## Responsibility
/// Orchestrate the full pipeline:
///   raw TrackPoints → PointNormalizer → GeometryEngine →
///   TopologyClassifier → TechnicityScorer → effort indices →
///   PacePredictor → AnalysisResult
///
/// ## Usage
/// ```cpp
/// core::Analyzer analyzer;
/// auto loaded = core::TrackLoader::load_csv("run.csv");
/// if (loaded) {
///     auto result = analyzer.analyze(loaded->points);
///     if (result) fmt::print("{}\n", result->to_string());
///     else        fmt::print(stderr, "{}\n", result.error().to_string());
/// }
/// ```
///
/// ## Guarantees
/// - All-or-nothing: any stage failure discards the partial result
/// - Thread-safe: `analyze` is const and touches no shared state
/// - Never throws

#include "trka/config.hpp"
#include "trka/errors.hpp"
#include "trka/geometry.hpp"
#include "trka/normalizer.hpp"
#include "trka/predictor.hpp"
#include "trka/technicity.hpp"
#include "trka/topology.hpp"
#include "trka/types.hpp"

#include <optional>
#include <span>

namespace trka::core {

/// Per-request switches.
struct AnalysisOptions {
    /// Treat timestamps as load-bearing: a regression becomes a
    /// TemporalOrder error and the recorded pace is reported.
    bool use_recorded_timing = false;
};

class Analyzer {
public:
    explicit Analyzer(AnalyzerConfig config = AnalyzerConfig{});

    [[nodiscard]] Outcome<AnalysisResult>
    analyze(std::span<const TrackPoint> raw_points,
            std::span<const RunnerProfile> runners = {},
            AnalysisOptions options = {}) const noexcept;

    /// Elapsed time and effort-speed from a recording. nullopt when fewer
    /// than two points carry timestamps or no time elapsed.
    [[nodiscard]] static std::optional<RecordedTiming>
    recorded_timing(const NormalizedTrack& track, double effort_km) noexcept;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    AnalyzerConfig                  config_;
    normalize::PointNormalizer      normalizer_;
    geometry::GeometryEngine        geometry_;
    topology::TopologyClassifier    topology_;
    technicity::TechnicityScorer    technicity_;
    predict::PacePredictor          predictor_;
};

}  // namespace trka::core
