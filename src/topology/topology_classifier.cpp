/// @file src/topology/topology_classifier.cpp
/// @brief TopologyClassifier: closure test and capped self-overlap search.

#include "trka/topology.hpp"
#include "trka/geo_math.hpp"
#include "trka/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace trka::topology {

using geometry::GeoMath;
using geometry::PlanarPoint;

namespace {

[[nodiscard]] double median_of(std::vector<double> v) {
    if (v.empty()) return std::numeric_limits<double>::infinity();
    const std::size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double upper = v[mid];
    if (v.size() % 2 == 1) return upper;
    const double lower = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

/// Point at cumulative distance `s` along the projected polyline.
/// `seg` is advanced monotonically so a forward sweep stays linear.
[[nodiscard]] PlanarPoint point_at(const std::vector<PlanarPoint>& xy,
                                   const std::vector<double>& cum,
                                   double s,
                                   std::size_t& seg) noexcept {
    while (seg + 2 < cum.size() && cum[seg + 1] < s) ++seg;
    const double len = cum[seg + 1] - cum[seg];
    const double t   = (len > 0.0) ? std::clamp((s - cum[seg]) / len, 0.0, 1.0) : 0.0;
    return xy[seg] + t * (xy[seg + 1] - xy[seg]);
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

TopologyClassifier::TopologyClassifier(TopologyConfig config) noexcept
    : config_(config) {}

// ─── measure_overlap ──────────────────────────────────────────────────────────

OverlapStats TopologyClassifier::measure_overlap(const NormalizedTrack& track) const {
    const auto pts = track.points();
    const auto cum = geometry::GeometryEngine::cumulative_distance_m(track);
    const double total = cum.back();

    OverlapStats stats{
        .ratio               = 0.0,
        .median_distance_m   = std::numeric_limits<double>::infinity(),
        .nearest_distances_m = {},
    };
    if (total <= 0.0 || config_.max_overlap_samples == 0) {
        return stats;
    }

    // Project once onto a tangent plane anchored at the start.
    const Coordinate origin{pts.front().latitude, pts.front().longitude};
    std::vector<PlanarPoint> xy;
    xy.reserve(pts.size());
    for (const auto& p : pts) {
        xy.push_back(GeoMath::project(origin, p.latitude, p.longitude));
    }

    const double half = total / 2.0;

    // Return half: the interpolated midpoint followed by every later vertex.
    std::size_t mid_seg = 0;
    std::vector<PlanarPoint> ret;
    ret.push_back(point_at(xy, cum, half, mid_seg));
    for (std::size_t i = mid_seg + 1; i < xy.size(); ++i) {
        ret.push_back(xy[i]);
    }

    // Outbound samples at regular spacing, capped.
    const double spacing = std::max(config_.sample_spacing_m, 1e-6);
    const std::size_t wanted =
        static_cast<std::size_t>(std::ceil(half / spacing));
    const std::size_t n_samples =
        std::clamp<std::size_t>(wanted, 1, config_.max_overlap_samples);
    const double step = half / static_cast<double>(n_samples);

    stats.nearest_distances_m.reserve(n_samples);
    std::size_t within = 0;
    std::size_t seg = 0;

    for (std::size_t k = 0; k < n_samples; ++k) {
        const double s = (static_cast<double>(k) + 0.5) * step;
        const PlanarPoint p = point_at(xy, cum, s, seg);

        double best = std::numeric_limits<double>::infinity();
        if (ret.size() == 1) {
            best = (p - ret.front()).norm();
        }
        for (std::size_t j = 0; j + 1 < ret.size(); ++j) {
            best = std::min(best, GeoMath::point_segment_distance(p, ret[j], ret[j + 1]));
        }

        stats.nearest_distances_m.push_back(best);
        if (best <= config_.overlap_distance_m) ++within;
    }

    stats.ratio = static_cast<double>(within) / static_cast<double>(n_samples);
    stats.median_distance_m = median_of(stats.nearest_distances_m);
    return stats;
}

// ─── inspect ──────────────────────────────────────────────────────────────────

TopologyReport
TopologyClassifier::inspect(const NormalizedTrack& track,
                            const GeometrySummary& summary) const {
    const double closure = GeoMath::distance_m(track.front(), track.back());
    const double total_m = summary.total_distance_km * 1000.0;
    const double tolerance = std::max(config_.loop_closure_fraction * total_m,
                                      config_.closure_floor_m);

    TopologyReport report{
        .route_type                = RouteType::PointToPoint,
        .closure_distance_m        = closure,
        .overlap_ratio             = 0.0,
        .median_overlap_distance_m = 0.0,
        .samples                   = 0,
    };

    if (closure > tolerance) {
        return report;
    }

    // Start and end coincide: loop unless the path retraces itself.
    const auto overlap = measure_overlap(track);
    report.overlap_ratio             = overlap.ratio;
    report.median_overlap_distance_m = overlap.median_distance_m;
    report.samples                   = overlap.nearest_distances_m.size();

    const bool retraces = overlap.median_distance_m < config_.overlap_distance_m
                       && overlap.ratio > config_.overlap_majority;
    if (retraces && overlap.ratio > config_.out_and_back_min_overlap) {
        report.route_type = RouteType::OutAndBack;
    } else {
        report.route_type = RouteType::Loop;
    }
    return report;
}

// ─── classify ─────────────────────────────────────────────────────────────────

RouteType TopologyClassifier::classify(const NormalizedTrack& track,
                                       const GeometrySummary& summary) const {
    return inspect(track, summary).route_type;
}

}  // namespace trka::topology
