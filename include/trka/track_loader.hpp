#pragma once

/// @file include/trka/track_loader.hpp
/// @brief CSV reader turning recorded tracks into raw TrackPoints.
///
/// # Format
/// ```
/// latitude,longitude,elevation,timestamp
/// 45.8326,6.8652,1035.2,2024-06-01T06:00:00Z
/// 45.8329,6.8660,,1717221605
/// ```
/// - First non-blank, non-comment line is a header and is skipped
/// - Lines starting with `#` and blank lines are ignored
/// - `elevation` and `timestamp` columns are optional and may be empty
/// - Timestamps are Unix epoch seconds or ISO-8601 UTC
///   (`YYYY-MM-DDTHH:MM:SS[.fff][Z]`)
///
/// Range checks are left to PointNormalizer so that an out-of-range point
/// surfaces as a MalformedPoint error with its index; only rows that do not
/// parse at all are skipped.

#include "trka/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trka::core {

struct LoadedTrack {
    std::vector<TrackPoint> points;
    std::size_t             skipped_rows = 0;  ///< Rows that failed to parse
};

class TrackLoader {
public:
    /// Load a track from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Points in file order, skipping unparseable rows
    [[nodiscard]] static std::optional<LoadedTrack>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a CSV-formatted string (same format as `load_csv`).
    [[nodiscard]] static LoadedTrack
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse an epoch-seconds or ISO-8601 UTC timestamp.
    [[nodiscard]] static std::optional<double>
    parse_timestamp(std::string_view text) noexcept;

private:
    [[nodiscard]] static std::optional<TrackPoint>
    parse_row(const std::string& line) noexcept;
};

}  // namespace trka::core
