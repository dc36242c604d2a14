/// @file src/geometry/geo_math.cpp
/// @brief Haversine distance and local tangent-plane projection.

#include "trka/geo_math.hpp"
#include "trka/constants.hpp"

#include <algorithm>
#include <cmath>

namespace trka::geometry {

// ─── haversine_m ──────────────────────────────────────────────────────────────

double GeoMath::haversine_m(double lat1, double lon1,
                            double lat2, double lon2) noexcept {
    const double phi1 = lat1 * constants::DEG_TO_RAD;
    const double phi2 = lat2 * constants::DEG_TO_RAD;
    const double dphi = (lat2 - lat1) * constants::DEG_TO_RAD;
    const double dlam = (lon2 - lon1) * constants::DEG_TO_RAD;

    const double s_phi = std::sin(dphi / 2.0);
    const double s_lam = std::sin(dlam / 2.0);
    double h = s_phi * s_phi + std::cos(phi1) * std::cos(phi2) * s_lam * s_lam;
    // Rounding can push h marginally above 1 for antipodal points.
    h = std::clamp(h, 0.0, 1.0);

    return 2.0 * constants::EARTH_RADIUS_M * std::asin(std::sqrt(h));
}

// ─── project ──────────────────────────────────────────────────────────────────

PlanarPoint GeoMath::project(const Coordinate& origin,
                             double lat, double lon) noexcept {
    const double cos_lat0 = std::cos(origin.latitude * constants::DEG_TO_RAD);

    // Wrap the longitude difference into [-180, 180) so tracks crossing the
    // antimeridian stay contiguous.
    double dlon = lon - origin.longitude;
    if (dlon >= 180.0)  dlon -= 360.0;
    if (dlon < -180.0)  dlon += 360.0;

    const double east  = dlon * constants::DEG_TO_RAD * constants::EARTH_RADIUS_M * cos_lat0;
    const double north = (lat - origin.latitude) * constants::DEG_TO_RAD * constants::EARTH_RADIUS_M;
    return PlanarPoint{east, north};
}

// ─── point_segment_distance ───────────────────────────────────────────────────

double GeoMath::point_segment_distance(const PlanarPoint& p,
                                       const PlanarPoint& a,
                                       const PlanarPoint& b) noexcept {
    const PlanarPoint ab = b - a;
    const double len_sq  = ab.squaredNorm();
    if (len_sq <= 0.0) {
        return (p - a).norm();
    }
    const double t = std::clamp((p - a).dot(ab) / len_sq, 0.0, 1.0);
    return (p - (a + t * ab)).norm();
}

// ─── interpolate ──────────────────────────────────────────────────────────────

Coordinate GeoMath::interpolate(const Coordinate& a,
                                const Coordinate& b,
                                double t) noexcept {
    return Coordinate{
        .latitude  = a.latitude  + (b.latitude  - a.latitude)  * t,
        .longitude = a.longitude + (b.longitude - a.longitude) * t,
    };
}

}  // namespace trka::geometry
