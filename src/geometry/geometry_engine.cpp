/// @file src/geometry/geometry_engine.cpp
/// @brief GeometryEngine: profile, summary and hysteresis elevation filter.

#include "trka/geometry.hpp"
#include "trka/constants.hpp"
#include "trka/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace trka::geometry {

namespace {

constexpr std::size_t NONE = std::numeric_limits<std::size_t>::max();

[[nodiscard]] double round_to(double value, int decimals) noexcept {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

/// Collapse an elevation series to its turning points: the first value, every
/// strict local extremum, and the last value. Plateaus collapse to one point.
[[nodiscard]] std::vector<double> turning_points(std::span<const double> e) {
    std::vector<double> v;
    if (e.empty()) return v;
    v.push_back(e.front());

    for (std::size_t i = 1; i < e.size(); ++i) {
        const double x = e[i];
        if (x == v.back()) continue;
        if (v.size() >= 2) {
            const bool was_rising = v.back() > v[v.size() - 2];
            const bool rising     = x > v.back();
            if (was_rising == rising) {
                // Same direction: extend the current run.
                v.back() = x;
                continue;
            }
        }
        v.push_back(x);
    }
    return v;
}

/// Doubly-linked list of turning points with an ordered index of swing
/// amplitudes. Retiring the smallest swing first keeps the result identical
/// for a series and its reverse.
class SwingFilter {
public:
    explicit SwingFilter(std::vector<double> values)
        : v_(std::move(values)),
          prev_(v_.size(), NONE),
          next_(v_.size(), NONE),
          amp_(v_.size(), 0.0) {
        for (std::size_t i = 0; i < v_.size(); ++i) {
            if (i > 0)             prev_[i] = i - 1;
            if (i + 1 < v_.size()) next_[i] = i + 1;
        }
        for (std::size_t i = 0; i + 1 < v_.size(); ++i) {
            insert_leg(i);
        }
    }

    /// Retire every swing smaller than `threshold`.
    void apply(double threshold) {
        while (!legs_.empty()) {
            const auto [amp, left] = *legs_.begin();
            if (amp >= threshold) break;

            const std::size_t right = next_[left];
            const bool left_is_start = prev_[left] == NONE;
            const bool right_is_end  = next_[right] == NONE;

            if (left_is_start && right_is_end) {
                break;  // a single move remains; endpoints are never removed
            }

            if (!left_is_start && !right_is_end) {
                // Interior wiggle: drop both turning points.
                const std::size_t p = prev_[left];
                const std::size_t n = next_[right];
                erase_leg(p);
                erase_leg(left);
                erase_leg(right);
                link(p, n);
                insert_leg(p);
            } else if (left_is_start) {
                // Small first move: fold its interior end into the next move.
                const std::size_t n = next_[right];
                erase_leg(left);
                erase_leg(right);
                link(left, n);
                insert_leg(left);
            } else {
                // Small last move: fold its interior start into the previous move.
                const std::size_t p = prev_[left];
                erase_leg(p);
                erase_leg(left);
                link(p, right);
                insert_leg(p);
            }
        }
    }

    [[nodiscard]] ElevationTotals totals() const noexcept {
        ElevationTotals t{0.0, 0.0, 0.0};
        if (v_.empty()) return t;

        double run = 0.0;
        for (std::size_t i = 0; next_[i] != NONE; i = next_[i]) {
            const double d = v_[next_[i]] - v_[i];
            if (d > 0.0) {
                t.gain_m += d;
                run += d;
                t.longest_climb_m = std::max(t.longest_climb_m, run);
            } else if (d < 0.0) {
                t.loss_m -= d;
                run = 0.0;
            }
        }
        return t;
    }

private:
    void insert_leg(std::size_t left) {
        amp_[left] = std::abs(v_[next_[left]] - v_[left]);
        legs_.emplace(amp_[left], left);
    }
    void erase_leg(std::size_t left) {
        legs_.erase({amp_[left], left});
    }
    void link(std::size_t a, std::size_t b) noexcept {
        next_[a] = b;
        prev_[b] = a;
    }

    std::vector<double>                         v_;
    std::vector<std::size_t>                    prev_;
    std::vector<std::size_t>                    next_;
    std::vector<double>                         amp_;
    std::set<std::pair<double, std::size_t>>    legs_;
};

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

GeometryEngine::GeometryEngine(GeometryConfig config) noexcept
    : config_(config) {}

// ─── cumulative_distance_m ────────────────────────────────────────────────────

std::vector<double>
GeometryEngine::cumulative_distance_m(const NormalizedTrack& track) {
    const auto pts = track.points();
    std::vector<double> cum(pts.size(), 0.0);
    for (std::size_t i = 1; i < pts.size(); ++i) {
        cum[i] = cum[i - 1] + GeoMath::distance_m(pts[i - 1], pts[i]);
    }
    return cum;
}

// ─── profile ──────────────────────────────────────────────────────────────────

std::vector<ProfileSegment>
GeometryEngine::profile(const NormalizedTrack& track) {
    const auto pts = track.points();
    std::vector<ProfileSegment> segs;
    segs.reserve(pts.size() - 1);

    double cum_km = 0.0;
    for (std::size_t i = 1; i < pts.size(); ++i) {
        const double d_m   = GeoMath::distance_m(pts[i - 1], pts[i]);
        const double delta = pts[i].elevation - pts[i - 1].elevation;

        std::optional<double> slope;
        if (d_m > 0.0) {
            slope = delta / d_m * 100.0;
        }

        segs.push_back(ProfileSegment{
            .start_km          = cum_km,
            .length_km         = d_m / 1000.0,
            .start_elevation_m = pts[i - 1].elevation,
            .elevation_delta_m = delta,
            .slope_pct         = slope,
        });
        cum_km += d_m / 1000.0;
    }
    return segs;
}

// ─── committed_elevation ──────────────────────────────────────────────────────

ElevationTotals
GeometryEngine::committed_elevation(std::span<const double> elevations,
                                    double noise_threshold_m) {
    SwingFilter filter(turning_points(elevations));
    if (noise_threshold_m > 0.0) {
        filter.apply(noise_threshold_m);
    }
    return filter.totals();
}

// ─── analyze / summarize ──────────────────────────────────────────────────────

GeometryReport GeometryEngine::analyze(const NormalizedTrack& track) const {
    auto segs = profile(track);
    const auto pts = track.points();

    // ── Distance ──────────────────────────────────────────────────────────────
    double total_km = 0.0;
    for (const auto& s : segs) total_km += s.length_km;

    // ── Altitude extrema ──────────────────────────────────────────────────────
    std::vector<double> elevations;
    elevations.reserve(pts.size());
    double max_alt = pts.front().elevation;
    double min_alt = pts.front().elevation;
    double sum_alt = 0.0;
    for (const auto& p : pts) {
        elevations.push_back(p.elevation);
        max_alt = std::max(max_alt, p.elevation);
        min_alt = std::min(min_alt, p.elevation);
        sum_alt += p.elevation;
    }

    // ── Slopes ────────────────────────────────────────────────────────────────
    double max_slope   = 0.0;
    double uphill_gain = 0.0;
    double uphill_km   = 0.0;
    for (const auto& s : segs) {
        if (!s.slope_pct) continue;
        max_slope = std::max(max_slope, std::abs(*s.slope_pct));
        if (s.elevation_delta_m > 0.0) {
            uphill_gain += s.elevation_delta_m;
            uphill_km   += s.length_km;
        }
    }
    const double avg_uphill = (uphill_km > 0.0)
        ? uphill_gain / (uphill_km * 1000.0) * 100.0
        : 0.0;

    // ── Committed gain / loss ─────────────────────────────────────────────────
    const auto committed = committed_elevation(elevations, config_.noise_threshold_m);

    GeometrySummary summary{
        .total_distance_km    = round_to(total_km, constants::DISTANCE_DECIMALS),
        .elevation_gain_m     = committed.gain_m,
        .elevation_loss_m     = committed.loss_m,
        .max_altitude_m       = max_alt,
        .min_altitude_m       = min_alt,
        .avg_altitude_m       = sum_alt / static_cast<double>(pts.size()),
        .max_slope_pct        = max_slope,
        .avg_uphill_slope_pct = avg_uphill,
        .longest_climb_m      = committed.longest_climb_m,
        .elevation_available  = track.elevation_available(),
    };

    return GeometryReport{
        .summary = summary,
        .profile = std::move(segs),
    };
}

GeometrySummary GeometryEngine::summarize(const NormalizedTrack& track) const {
    return analyze(track).summary;
}

}  // namespace trka::geometry
