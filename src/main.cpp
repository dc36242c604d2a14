/// @file src/main.cpp
/// @brief trka CLI entry point.
///
/// Usage:
///   trka --analyze <csv_file> [options]         Analyze a recorded track
///   trka --plan <csv_file> <minutes> [km ...]   Plan splits for a target time
///   trka --help                                 Print usage

#include "trka/analyzer.hpp"
#include "trka/config_loader.hpp"
#include "trka/geometry.hpp"
#include "trka/normalizer.hpp"
#include "trka/predictor.hpp"
#include "trka/track_loader.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  trka --analyze <csv_file> [options]         Analyze a recorded track\n"
        "  trka --plan <csv_file> <minutes> [km ...]   Plan splits for a target time\n"
        "  trka --help                                 Show this help\n"
        "\n"
        "Options:\n"
        "  --config <json>        Override defaults from a JSON file (both modes)\n"
        "  --index <N>            Predict for a fitness index (repeatable)\n"
        "  --archetype <NAME>     HIKER, RUNNER or ELITE (repeatable)\n"
        "  --timing               Treat timestamps as load-bearing\n"
        "  --fatigue <F>          Pace drift for --plan (default 1.0)\n"
        "\n"
        "CSV format (header required):\n"
        "  latitude,longitude[,elevation[,timestamp]]\n"
    );
}

std::optional<double> parse_double(const std::string& s) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<trka::Archetype> parse_archetype(const std::string& s) {
    if (s == "HIKER"  || s == "hiker")  return trka::Archetype::Hiker;
    if (s == "RUNNER" || s == "runner") return trka::Archetype::Runner;
    if (s == "ELITE"  || s == "elite")  return trka::Archetype::Elite;
    return std::nullopt;
}

/// Load the track, reporting failures. nullopt → caller exits 1.
std::optional<std::vector<trka::TrackPoint>> load_track(const std::string& filepath) {
    auto loaded = trka::core::TrackLoader::load_csv(filepath);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (loaded->skipped_rows > 0) {
        fmt::print(stderr, "Warning: skipped {} malformed rows\n", loaded->skipped_rows);
    }
    fmt::print("Loaded {} points from '{}'\n", loaded->points.size(), filepath);
    return std::move(loaded->points);
}

/// Run the full analysis pipeline. Returns 0 on success, 1 on error.
int run_analyze(int argc, char* argv[]) {
    const std::string filepath(argv[2]);
    trka::AnalyzerConfig config;
    std::vector<trka::RunnerProfile> runners;
    trka::core::AnalysisOptions options;

    for (int i = 3; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--timing") {
            options.use_recorded_timing = true;
        } else if (arg == "--config" && has_value) {
            const std::string path(argv[++i]);
            auto loaded = trka::core::ConfigLoader::load_json(path);
            if (!loaded) {
                fmt::print(stderr, "Error: cannot load config '{}'\n", path);
                return 1;
            }
            config = std::move(*loaded);
        } else if (arg == "--index" && has_value) {
            auto idx = parse_double(argv[++i]);
            if (!idx) {
                fmt::print(stderr, "Error: --index expects a number, got '{}'\n", argv[i]);
                return 1;
            }
            runners.push_back(trka::RunnerProfile{*idx, std::nullopt});
        } else if (arg == "--archetype" && has_value) {
            auto a = parse_archetype(argv[++i]);
            if (!a) {
                fmt::print(stderr, "Error: unknown archetype '{}'\n", argv[i]);
                return 1;
            }
            runners.push_back(trka::RunnerProfile{std::nullopt, *a});
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    auto points = load_track(filepath);
    if (!points) {
        return 1;
    }

    trka::core::Analyzer analyzer(config);
    auto result = analyzer.analyze(*points, runners, options);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error().to_string());
        return 1;
    }

    fmt::print("{}\n", result->to_string());
    return 0;
}

/// Plan target-time splits. Returns 0 on success, 1 on error.
int run_plan(int argc, char* argv[]) {
    const std::string filepath(argv[2]);
    auto minutes = parse_double(argv[3]);
    if (!minutes) {
        fmt::print(stderr, "Error: target time must be a number of minutes, got '{}'\n", argv[3]);
        return 1;
    }

    trka::AnalyzerConfig config;
    double fatigue = 1.0;
    std::vector<trka::predict::Waypoint> waypoints;
    for (int i = 4; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            const std::string path(argv[++i]);
            auto loaded = trka::core::ConfigLoader::load_json(path);
            if (!loaded) {
                fmt::print(stderr, "Error: cannot load config '{}'\n", path);
                return 1;
            }
            config = std::move(*loaded);
            continue;
        }
        if (arg == "--fatigue" && i + 1 < argc) {
            auto f = parse_double(argv[++i]);
            if (!f) {
                fmt::print(stderr, "Error: --fatigue expects a number, got '{}'\n", argv[i]);
                return 1;
            }
            fatigue = *f;
            continue;
        }
        auto km = parse_double(arg);
        if (!km) {
            fmt::print(stderr, "Error: waypoint must be a distance in km, got '{}'\n", arg);
            return 1;
        }
        waypoints.push_back(trka::predict::Waypoint{*km, fmt::format("km {:.1f}", *km)});
    }

    auto points = load_track(filepath);
    if (!points) {
        return 1;
    }

    trka::normalize::PointNormalizer normalizer(config.normalizer);
    auto track = normalizer.normalize(*points);
    if (!track) {
        fmt::print(stderr, "Error: {}\n", track.error().to_string());
        return 1;
    }

    const auto profile = trka::geometry::GeometryEngine::profile(*track);
    trka::predict::SplitPlanner planner(config.predictor);
    auto plans = planner.plan_strategies(profile, trka::Seconds{*minutes * 60.0},
                                         waypoints, fatigue);
    if (!plans) {
        fmt::print(stderr, "Error: {}\n", plans.error().to_string());
        return 1;
    }

    fmt::print("{}\n", plans->main.to_string());
    fmt::print("Aggressive start (fatigue ×{:.2f}):\n{}\n",
               trka::predict::StrategySet::AGGRESSIVE_FATIGUE, plans->aggressive.to_string());
    fmt::print("Even pacing:\n{}\n", plans->even.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--analyze") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --analyze requires a CSV file path\n");
            print_usage();
            return 1;
        }
        return run_analyze(argc, argv);
    }

    if (mode == "--plan") {
        if (argc < 4) {
            fmt::print(stderr, "Error: --plan requires a CSV file path and a target time\n");
            print_usage();
            return 1;
        }
        return run_plan(argc, argv);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
