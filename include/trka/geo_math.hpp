#pragma once

/// @file include/trka/geo_math.hpp
/// @brief Spherical-Earth distance helpers and a local planar projection.
///
/// Distances use the haversine formula on a sphere of mean radius
/// 6371.0088 km, which is accurate to well below a metre over the segment
/// lengths of a GPS recording.
///
/// For nearest-point queries the track is projected onto a local
/// equirectangular tangent plane (metres, east/north) around a reference
/// coordinate. Within a few kilometres of the reference the distortion is
/// negligible compared with GPS noise.

#include "trka/types.hpp"

#include <Eigen/Dense>

namespace trka::geometry {

/// East/north offset in metres on a local tangent plane.
using PlanarPoint = Eigen::Vector2d;

class GeoMath {
public:
    /// Great-circle distance in metres between two coordinates (degrees).
    [[nodiscard]] static double
    haversine_m(double lat1, double lon1, double lat2, double lon2) noexcept;

    template <typename A, typename B>
    [[nodiscard]] static double distance_m(const A& a, const B& b) noexcept {
        return haversine_m(a.latitude, a.longitude, b.latitude, b.longitude);
    }

    /// Project (lat, lon) onto the tangent plane centred on `origin`.
    [[nodiscard]] static PlanarPoint
    project(const Coordinate& origin, double lat, double lon) noexcept;

    /// Shortest planar distance from `p` to the segment [a, b].
    /// Degenerates to |p − a| when a == b.
    [[nodiscard]] static double
    point_segment_distance(const PlanarPoint& p,
                           const PlanarPoint& a,
                           const PlanarPoint& b) noexcept;

    /// Linear interpolation between two coordinates at fraction t ∈ [0, 1].
    [[nodiscard]] static Coordinate
    interpolate(const Coordinate& a, const Coordinate& b, double t) noexcept;
};

}  // namespace trka::geometry
