/// @file src/core/config_loader.cpp
/// @brief ConfigLoader: nlohmann::json overlay and sanity checks.

#include "trka/config_loader.hpp"
#include "trka/constants.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <iterator>

namespace trka::core {

namespace {

using nlohmann::json;

template <typename T>
void read(const json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

void read_pace(const json& j, const char* key, PaceReference& pace) {
    if (!j.contains(key)) return;
    const json& p = j.at(key);
    read(p, "flat_speed_kmeh", pace.flat_speed_kmeh);
    read(p, "technicity_sensitivity", pace.technicity_sensitivity);
}

void read_term(const json& j, const char* key, TechnicityTerm& term) {
    if (!j.contains(key)) return;
    const json& t = j.at(key);
    read(t, "weight", term.weight);
    read(t, "reference", term.reference);
}

[[nodiscard]] bool positive(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

}  // namespace

// ─── ConfigLoader::from_json ──────────────────────────────────────────────────

AnalyzerConfig ConfigLoader::from_json(const json& j, AnalyzerConfig cfg) {
    if (j.contains("normalizer")) {
        const json& n = j.at("normalizer");
        read(n, "min_elevation_m", cfg.normalizer.min_elevation_m);
        read(n, "max_elevation_m", cfg.normalizer.max_elevation_m);
    }

    if (j.contains("geometry")) {
        read(j.at("geometry"), "noise_threshold_m", cfg.geometry.noise_threshold_m);
    }

    if (j.contains("topology")) {
        const json& t = j.at("topology");
        read(t, "loop_closure_fraction",    cfg.topology.loop_closure_fraction);
        read(t, "closure_floor_m",          cfg.topology.closure_floor_m);
        read(t, "overlap_distance_m",       cfg.topology.overlap_distance_m);
        read(t, "overlap_majority",         cfg.topology.overlap_majority);
        read(t, "out_and_back_min_overlap", cfg.topology.out_and_back_min_overlap);
        read(t, "max_overlap_samples",      cfg.topology.max_overlap_samples);
        read(t, "sample_spacing_m",         cfg.topology.sample_spacing_m);
    }

    if (j.contains("technicity")) {
        const json& t = j.at("technicity");
        read_term(t, "max_slope",      cfg.technicity.max_slope);
        read_term(t, "uphill_slope",   cfg.technicity.uphill_slope);
        read_term(t, "altitude_range", cfg.technicity.altitude_range);
        read_term(t, "slope_spread",   cfg.technicity.slope_spread);
        read(t, "high_mountain_altitude_m", cfg.technicity.high_mountain_altitude_m);
        read(t, "mid_mountain_altitude_m",  cfg.technicity.mid_mountain_altitude_m);
        read(t, "skyrunning_min_slope_pct", cfg.technicity.skyrunning_min_slope_pct);
        read(t, "treeline_altitude_m",      cfg.technicity.treeline_altitude_m);
        read(t, "forest_min_altitude_m",    cfg.technicity.forest_min_altitude_m);
        read(t, "coastal_max_altitude_m",   cfg.technicity.coastal_max_altitude_m);
        read(t, "urban_max_altitude_m",     cfg.technicity.urban_max_altitude_m);
        read(t, "vertical_gain_per_km_m",   cfg.technicity.vertical_gain_per_km_m);
    }

    if (j.contains("predictor")) {
        const json& p = j.at("predictor");
        read(p, "climb_penalty_m",        cfg.predictor.climb_penalty_m);
        read(p, "checkpoint_interval_km", cfg.predictor.checkpoint_interval_km);
        read_pace(p, "hiker",  cfg.predictor.hiker);
        read_pace(p, "runner", cfg.predictor.runner);
        read_pace(p, "elite",  cfg.predictor.elite);

        // A curve replaces the default curve wholesale.
        if (p.contains("fitness_curve")) {
            std::vector<FitnessKnot> curve;
            for (const json& k : p.at("fitness_curve")) {
                curve.push_back(FitnessKnot{
                    .fitness_index = k.at("fitness_index").get<double>(),
                    .pace = PaceReference{
                        .flat_speed_kmeh        = k.at("flat_speed_kmeh").get<double>(),
                        .technicity_sensitivity = k.at("technicity_sensitivity").get<double>(),
                    },
                });
            }
            cfg.predictor.fitness_curve = std::move(curve);
        }

        read(p, "min_fitness_index",    cfg.predictor.min_fitness_index);
        read(p, "max_fitness_index",    cfg.predictor.max_fitness_index);
        read(p, "steep_slope_pct",      cfg.predictor.steep_slope_pct);
        read(p, "steep_penalty",        cfg.predictor.steep_penalty);
        read(p, "decay_start_km",       cfg.predictor.decay_start_km);
        read(p, "decay_step_km",        cfg.predictor.decay_step_km);
        read(p, "decay_rate_per_step",  cfg.predictor.decay_rate_per_step);
        read(p, "decay_max_total",      cfg.predictor.decay_max_total);
        read(p, "min_speed_kmeh",       cfg.predictor.min_speed_kmeh);
        read(p, "endurance_multiplier", cfg.predictor.endurance_multiplier);
        read(p, "push_multiplier",      cfg.predictor.push_multiplier);
    }
    return cfg;
}

// ─── ConfigLoader::validate ───────────────────────────────────────────────────

std::optional<std::string> ConfigLoader::validate(const AnalyzerConfig& c) {
    if (!(c.normalizer.min_elevation_m < c.normalizer.max_elevation_m)) {
        return "normalizer.min_elevation_m must be below max_elevation_m";
    }
    if (!std::isfinite(c.geometry.noise_threshold_m) || c.geometry.noise_threshold_m < 0.0) {
        return "geometry.noise_threshold_m must be a non-negative number";
    }

    const auto& t = c.topology;
    if (!positive(t.loop_closure_fraction) || !positive(t.closure_floor_m) ||
        !positive(t.overlap_distance_m)    || !positive(t.sample_spacing_m)) {
        return "topology thresholds must be positive";
    }
    if (t.max_overlap_samples == 0) {
        return "topology.max_overlap_samples must be at least 1";
    }
    if (t.overlap_majority < 0.0 || t.overlap_majority > 1.0 ||
        t.out_and_back_min_overlap < 0.0 || t.out_and_back_min_overlap > 1.0) {
        return "topology overlap ratios must lie in [0, 1]";
    }

    const auto& s = c.technicity;
    for (const TechnicityTerm* term : {&s.max_slope, &s.uphill_slope,
                                       &s.altitude_range, &s.slope_spread}) {
        if (!std::isfinite(term->weight) || term->weight < 0.0 || !positive(term->reference)) {
            return "technicity terms need a non-negative weight and a positive reference";
        }
    }
    const double weight_sum = s.max_slope.weight + s.uphill_slope.weight
                            + s.altitude_range.weight + s.slope_spread.weight;
    if (!positive(weight_sum)) {
        return "technicity weights must sum to a positive value";
    }

    const auto& p = c.predictor;
    if (!positive(p.climb_penalty_m)) {
        return "predictor.climb_penalty_m must be positive";
    }
    if (!std::isfinite(p.checkpoint_interval_km) ||
        p.checkpoint_interval_km < constants::MIN_CHECKPOINT_INTERVAL_KM) {
        return fmt::format("predictor.checkpoint_interval_km must be at least {} km",
                           constants::MIN_CHECKPOINT_INTERVAL_KM);
    }
    for (const PaceReference* pace : {&p.hiker, &p.runner, &p.elite}) {
        if (!positive(pace->flat_speed_kmeh)) {
            return "archetype flat speeds must be positive";
        }
    }
    if (p.fitness_curve.empty()) {
        return "predictor.fitness_curve must have at least one knot";
    }
    for (std::size_t i = 0; i < p.fitness_curve.size(); ++i) {
        if (!positive(p.fitness_curve[i].pace.flat_speed_kmeh)) {
            return fmt::format("fitness_curve[{}] flat speed must be positive", i);
        }
        if (i > 0 && !(p.fitness_curve[i].fitness_index > p.fitness_curve[i - 1].fitness_index)) {
            return fmt::format("fitness_curve must be strictly increasing (knot {})", i);
        }
    }
    if (!(p.min_fitness_index < p.max_fitness_index)) {
        return "predictor.min_fitness_index must be below max_fitness_index";
    }
    if (!positive(p.min_speed_kmeh) || !positive(p.steep_penalty) ||
        !positive(p.endurance_multiplier) || !positive(p.push_multiplier)) {
        return "predictor speeds and multipliers must be positive";
    }
    if (p.decay_max_total < 0.0 || p.decay_max_total >= 1.0) {
        return "predictor.decay_max_total must lie in [0, 1)";
    }
    return std::nullopt;
}

// ─── ConfigLoader::parse_json_string ──────────────────────────────────────────

std::optional<AnalyzerConfig>
ConfigLoader::parse_json_string(const std::string& content) noexcept {
    try {
        const json j = json::parse(content);
        if (!j.is_object()) {
            return std::nullopt;
        }
        AnalyzerConfig cfg = from_json(j);
        if (validate(cfg)) {
            return std::nullopt;
        }
        return cfg;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── ConfigLoader::load_json ──────────────────────────────────────────────────

std::optional<AnalyzerConfig> ConfigLoader::load_json(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string contents((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return parse_json_string(contents);
}

}  // namespace trka::core
