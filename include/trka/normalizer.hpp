#pragma once

/// @file include/trka/normalizer.hpp
/// @brief PointNormalizer: turns a raw GPS point sequence into a NormalizedTrack.
///
/// # Module: Point Normalizer
///
/// ## Responsibility
/// Validate, de-duplicate and gap-fill raw points so every downstream stage
/// can assume a clean track.
///
/// ## Steps
///   1. Reject malformed points (coordinates or elevation out of range,
///      non-finite values) → MalformedPoint, naming the point index.
///   2. Collapse consecutive points with identical coordinates into the first
///      occurrence. A later duplicate may donate a missing elevation.
///   3. Fewer than two points left → InsufficientData.
///   4. Fill missing elevations: interior gaps are interpolated linearly by
///      cumulative horizontal distance; leading and trailing gaps copy the
///      nearest known value. No elevation at all → every elevation is 0 and
///      the track reports `elevation_available() == false`.
///   5. Timestamps: never reordered. A regression fails with TemporalOrder
///      when `timestamps_load_bearing` is set; otherwise timestamps are
///      dropped so the output still satisfies the non-decreasing invariant.
///
/// ## Guarantees
/// - Stateless; safe to share across threads
/// - Never throws

#include "trka/config.hpp"
#include "trka/errors.hpp"
#include "trka/types.hpp"

#include <optional>
#include <span>

namespace trka::normalize {

class PointNormalizer {
public:
    explicit PointNormalizer(NormalizerConfig config = NormalizerConfig{}) noexcept;

    /// Normalize a raw point sequence.
    ///
    /// # Arguments
    /// * `raw`                     : ordered raw points (traversal order)
    /// * `timestamps_load_bearing` : true when a caller will consume timing,
    ///                               making timestamp regressions fatal
    [[nodiscard]] Outcome<NormalizedTrack>
    normalize(std::span<const TrackPoint> raw,
              bool timestamps_load_bearing = false) const noexcept;

    /// Check a single raw point. Returns the failure, or nullopt when valid.
    [[nodiscard]] std::optional<AnalysisError>
    validate(const TrackPoint& p, std::size_t index) const noexcept;

private:
    NormalizerConfig config_;
};

}  // namespace trka::normalize
