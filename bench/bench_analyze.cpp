/**
 * @file  bench/bench_analyze.cpp
 * @brief Google Benchmark suite for the track analytics pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize            validation, de-duplication, gap filling
 *   BM_CommittedElevation   hysteresis filter on a noisy series
 *   BM_Topology             overlap sampling against the return half
 *   BM_Analyze              full pipeline, three archetypes
 *
 * Build (CMake):
 *   cmake --build build --target bench_analyze
 *   ./build/bench_analyze --benchmark_format=json
 *
 * Throughput units: items/second (track points processed).
 */

#include "benchmark/benchmark.h"

#include "trka/analyzer.hpp"
#include "trka/constants.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Out-and-back mountain track of N points: 20 m steps, a 1000 m climb with
/// barometric jitter, every 7th elevation missing.
static std::vector<trka::TrackPoint> make_track(std::size_t n) {
    constexpr double m_per_deg = trka::constants::EARTH_RADIUS_M * trka::constants::DEG_TO_RAD;
    std::vector<trka::TrackPoint> pts;
    pts.reserve(n);
    const std::size_t half = n / 2;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t k = i <= half ? i : n - 1 - i;
        const double progress = static_cast<double>(k) / static_cast<double>(half > 0 ? half : 1);
        const double north_m  = 20.0 * static_cast<double>(k);
        const double east_m   = 15.0 * std::sin(static_cast<double>(k) * 0.01) + (i > half ? 8.0 : 0.0);
        std::optional<double> ele;
        if (i % 7 != 3) {
            ele = 900.0 + 1000.0 * progress + 1.5 * std::sin(static_cast<double>(i) * 1.7);
        }
        pts.push_back(trka::TrackPoint{
            .latitude  = 45.9 + north_m / m_per_deg,
            .longitude = 6.8 + east_m / (m_per_deg * std::cos(45.9 * trka::constants::DEG_TO_RAD)),
            .elevation = ele,
            .timestamp = static_cast<double>(i) * 5.0,
        });
    }
    return pts;
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto pts = make_track(static_cast<std::size_t>(state.range(0)));
    const trka::normalize::PointNormalizer normalizer;
    for (auto _ : state) {
        auto track = normalizer.normalize(pts);
        benchmark::DoNotOptimize(track);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

static void BM_CommittedElevation(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<double> ele(n);
    for (std::size_t i = 0; i < n; ++i) {
        ele[i] = 0.05 * static_cast<double>(i) + 3.0 * std::sin(static_cast<double>(i) * 0.9);
    }
    for (auto _ : state) {
        auto t = trka::geometry::GeometryEngine::committed_elevation(ele, 2.0);
        benchmark::DoNotOptimize(t);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_CommittedElevation)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Topology(benchmark::State& state) {
    const auto pts = make_track(static_cast<std::size_t>(state.range(0)));
    const auto track = trka::normalize::PointNormalizer{}.normalize(pts);
    if (!track) {
        state.SkipWithError("fixture track failed to normalize");
        return;
    }
    const auto summary = trka::geometry::GeometryEngine{}.summarize(*track);
    const trka::topology::TopologyClassifier classifier;
    for (auto _ : state) {
        auto report = classifier.inspect(*track, summary);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Topology)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Analyze(benchmark::State& state) {
    const auto pts = make_track(static_cast<std::size_t>(state.range(0)));
    const trka::core::Analyzer analyzer;
    for (auto _ : state) {
        auto result = analyzer.analyze(pts);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    state.counters["Mpoints_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(state.range(0)) / 1e6,
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Analyze)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
