#pragma once

/// @file include/trka/config_loader.hpp
/// @brief JSON configuration overlay for AnalyzerConfig.
///
/// The document's top-level keys are `normalizer`, `geometry`, `topology`,
/// `technicity` and `predictor`; each holds the fields of the matching config
/// struct under the same names. Any key may be omitted: it keeps its default.
///
/// ```json
/// { "geometry":  { "noise_threshold_m": 3.0 },
///   "predictor": { "runner": { "flat_speed_kmeh": 9.5 } } }
/// ```

#include "trka/config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace trka::core {

class ConfigLoader {
public:
    /// Read and validate a JSON file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened, is not valid JSON, has a
    ///   field of the wrong type, or fails `validate`
    [[nodiscard]] static std::optional<AnalyzerConfig>
    load_json(const std::string& filepath) noexcept;

    /// Same as `load_json` for an in-memory document.
    [[nodiscard]] static std::optional<AnalyzerConfig>
    parse_json_string(const std::string& content) noexcept;

    /// Overlay `j` onto `base`. Throws nlohmann::json::exception on type
    /// mismatches.
    [[nodiscard]] static AnalyzerConfig
    from_json(const nlohmann::json& j, AnalyzerConfig base = AnalyzerConfig{});

    /// First problem found, or nullopt when the config is usable.
    [[nodiscard]] static std::optional<std::string>
    validate(const AnalyzerConfig& config);
};

}  // namespace trka::core
