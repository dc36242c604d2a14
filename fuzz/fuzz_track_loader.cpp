/**
 * @file  fuzz_track_loader.cpp
 * @brief libFuzzer target for CSV parsing followed by the full Analyzer
 *
 * Build:
 *   cmake -DTRKA_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_track_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_track_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If analysis succeeds:
 *      a. distance, gain and loss are finite and non-negative
 *      b. technicity score ∈ [0, 100]
 *      c. three predictions, ordered HIKER ≥ RUNNER ≥ ELITE
 *   3. If analysis fails, the error kind is one of the documented kinds.
 *
 * Fuzzer strategy:
 *   Input is parsed as CSV text. TrackLoader must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "1e308" tokens
 *     • Missing / extra columns, trailing commas, CR line endings
 *     • Half-formed ISO timestamps
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "trka/analyzer.hpp"
#include "trka/track_loader.hpp"

using namespace trka;
using namespace trka::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto loaded = TrackLoader::parse_csv_string(input);

    static const Analyzer analyzer;
    const auto result = analyzer.analyze(loaded.points, {},
                                         AnalysisOptions{.use_recorded_timing = (size % 2) == 0});

    if (result.has_value()) {
        // Invariant 2a
        assert(std::isfinite(result->geometry.total_distance_km));
        assert(result->geometry.total_distance_km >= 0.0);
        assert(result->geometry.elevation_gain_m >= 0.0);
        assert(result->geometry.elevation_loss_m >= 0.0);

        // Invariant 2b
        assert(result->technicity.technicity_score >= 0.0);
        assert(result->technicity.technicity_score <= 100.0);

        // Invariant 2c
        assert(result->predictions.size() == 3);
        assert(result->predictions[0].total_time_estimate >= result->predictions[1].total_time_estimate);
        assert(result->predictions[1].total_time_estimate >= result->predictions[2].total_time_estimate);

        // Rendering must not throw on any successful result
        const std::string text = result->to_string();
        assert(!text.empty());
    } else {
        // Invariant 3
        const auto kind = result.error().kind;
        assert(kind == ErrorKind::InsufficientData || kind == ErrorKind::TemporalOrder ||
               kind == ErrorKind::MalformedPoint   || kind == ErrorKind::InvalidProfile);
        (void)kind;
    }

    return 0;
}
