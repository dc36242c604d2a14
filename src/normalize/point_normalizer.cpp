/// @file src/normalize/point_normalizer.cpp
/// @brief PointNormalizer: validation, de-duplication, elevation fill.
///
/// Each normalize() call:
///   1. Validates every raw point (first failure wins)
///   2. Collapses consecutive coordinate duplicates
///   3. Fills elevation gaps (interior: distance-linear; edges: clamp)
///   4. Checks or drops timestamps depending on whether they are load-bearing

#include "trka/normalizer.hpp"
#include "trka/constants.hpp"
#include "trka/geo_math.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace trka {

bool NormalizedTrack::has_timestamps() const noexcept {
    for (const auto& p : points_) {
        if (p.timestamp.has_value()) return true;
    }
    return false;
}

}  // namespace trka

namespace trka::normalize {

namespace {

/// Working copy of a point while elevations are still optional.
struct PendingPoint {
    double latitude;
    double longitude;
    std::optional<double> elevation;
    std::optional<double> timestamp;
    std::size_t raw_index;
};

[[nodiscard]] bool same_coordinates(const PendingPoint& a,
                                    const TrackPoint& b) noexcept {
    return a.latitude == b.latitude && a.longitude == b.longitude;
}

/// Fill elevation gaps in place. Returns false when no point had elevation.
bool fill_elevations(std::vector<PendingPoint>& pts) noexcept {
    const std::size_t n = pts.size();

    // Cumulative horizontal distance, used as the interpolation axis.
    std::vector<double> cum(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        cum[i] = cum[i - 1] + geometry::GeoMath::distance_m(pts[i - 1], pts[i]);
    }

    std::optional<std::size_t> prev_known;
    for (std::size_t i = 0; i < n; ++i) {
        if (!pts[i].elevation) continue;

        if (!prev_known) {
            // Leading gap: clamp to the first known value.
            for (std::size_t j = 0; j < i; ++j) {
                pts[j].elevation = pts[i].elevation;
            }
        } else if (i - *prev_known > 1) {
            const std::size_t a = *prev_known;
            const double ea   = *pts[a].elevation;
            const double eb   = *pts[i].elevation;
            const double span = cum[i] - cum[a];
            for (std::size_t j = a + 1; j < i; ++j) {
                const double t = (span > 0.0)
                    ? (cum[j] - cum[a]) / span
                    : static_cast<double>(j - a) / static_cast<double>(i - a);
                pts[j].elevation = ea + (eb - ea) * t;
            }
        }
        prev_known = i;
    }

    if (!prev_known) {
        for (auto& p : pts) p.elevation = 0.0;
        return false;
    }

    // Trailing gap: clamp to the last known value.
    for (std::size_t j = *prev_known + 1; j < n; ++j) {
        pts[j].elevation = pts[*prev_known].elevation;
    }
    return true;
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

PointNormalizer::PointNormalizer(NormalizerConfig config) noexcept
    : config_(config) {}

// ─── validate ─────────────────────────────────────────────────────────────────

std::optional<AnalysisError>
PointNormalizer::validate(const TrackPoint& p, std::size_t index) const noexcept {
    if (!std::isfinite(p.latitude) ||
        std::abs(p.latitude) > constants::MAX_ABS_LATITUDE) {
        return make_error(ErrorKind::MalformedPoint,
                          fmt::format("latitude {} out of range at point {}", p.latitude, index),
                          index);
    }
    if (!std::isfinite(p.longitude) ||
        std::abs(p.longitude) > constants::MAX_ABS_LONGITUDE) {
        return make_error(ErrorKind::MalformedPoint,
                          fmt::format("longitude {} out of range at point {}", p.longitude, index),
                          index);
    }
    if (p.elevation) {
        const double e = *p.elevation;
        if (!std::isfinite(e) || e < config_.min_elevation_m || e > config_.max_elevation_m) {
            return make_error(ErrorKind::MalformedPoint,
                              fmt::format("elevation {} out of range at point {}", e, index),
                              index);
        }
    }
    if (p.timestamp && !std::isfinite(*p.timestamp)) {
        return make_error(ErrorKind::MalformedPoint,
                          fmt::format("non-finite timestamp at point {}", index),
                          index);
    }
    return std::nullopt;
}

// ─── normalize ────────────────────────────────────────────────────────────────

Outcome<NormalizedTrack>
PointNormalizer::normalize(std::span<const TrackPoint> raw,
                           bool timestamps_load_bearing) const noexcept {
    if (raw.empty()) {
        return make_error(ErrorKind::InsufficientData, "track has no points");
    }

    // ── Step 1 + 2: validate and collapse consecutive duplicates ─────────────
    std::vector<PendingPoint> pts;
    pts.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size(); ++i) {
        const TrackPoint& p = raw[i];
        if (auto err = validate(p, i)) {
            return *err;
        }

        if (!pts.empty() && same_coordinates(pts.back(), p)) {
            // Keep the first occurrence; only adopt a missing elevation.
            if (!pts.back().elevation && p.elevation) {
                pts.back().elevation = p.elevation;
            }
            continue;
        }
        pts.push_back(PendingPoint{
            .latitude  = p.latitude,
            .longitude = p.longitude,
            .elevation = p.elevation,
            .timestamp = p.timestamp,
            .raw_index = i,
        });
    }

    // ── Step 3: enough distinct points? ──────────────────────────────────────
    if (pts.size() < constants::MIN_TRACK_POINTS) {
        return make_error(ErrorKind::InsufficientData,
                          fmt::format("need at least {} distinct points, got {}",
                                      constants::MIN_TRACK_POINTS, pts.size()));
    }

    // ── Step 4: elevation gaps ────────────────────────────────────────────────
    const bool elevation_available = fill_elevations(pts);

    // ── Step 5: timestamp order ───────────────────────────────────────────────
    bool timestamps_ordered = true;
    std::optional<double> last_ts;
    std::size_t regression_at = 0;
    for (std::size_t i = 0; i < pts.size(); ++i) {
        if (!pts[i].timestamp) continue;
        if (last_ts && *pts[i].timestamp < *last_ts) {
            timestamps_ordered = false;
            regression_at = pts[i].raw_index;
            break;
        }
        last_ts = pts[i].timestamp;
    }

    if (!timestamps_ordered) {
        if (timestamps_load_bearing) {
            return make_error(ErrorKind::TemporalOrder,
                              fmt::format("timestamp regression at point {}", regression_at),
                              regression_at);
        }
        for (auto& p : pts) p.timestamp.reset();
    }

    std::vector<NormalizedPoint> out;
    out.reserve(pts.size());
    for (const auto& p : pts) {
        out.push_back(NormalizedPoint{
            .latitude  = p.latitude,
            .longitude = p.longitude,
            .elevation = *p.elevation,
            .timestamp = p.timestamp,
        });
    }

    return NormalizedTrack(std::move(out), elevation_available);
}

}  // namespace trka::normalize
