/**
 * @file  prop_technicity_monotonic.cpp
 * @brief Property: technicity is bounded and strictly increasing in each input
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_technicity_monotonic
 *
 * Properties:
 *   0 ≤ score ≤ 100
 *   raising max slope, uphill slope or altitude range raises the score
 *   raising max altitude never removes MID_MOUNTAIN / HIGH_MOUNTAIN
 */

#include <rapidcheck.h>

#include <cmath>

#include "trka/technicity.hpp"

using namespace trka;
using namespace trka::technicity;

namespace {

GeometrySummary random_summary() {
    const double min_alt = *rc::gen::inRange(0, 3000);
    const double range   = *rc::gen::inRange(0, 3000);
    return GeometrySummary{
        .total_distance_km    = 1.0 + *rc::gen::inRange(0, 200),
        .elevation_gain_m     = static_cast<double>(*rc::gen::inRange(0, 8000)),
        .elevation_loss_m     = static_cast<double>(*rc::gen::inRange(0, 8000)),
        .max_altitude_m       = min_alt + range,
        .min_altitude_m       = min_alt,
        .avg_altitude_m       = min_alt + 0.5 * range,
        .max_slope_pct        = static_cast<double>(*rc::gen::inRange(0, 120)),
        .avg_uphill_slope_pct = static_cast<double>(*rc::gen::inRange(0, 40)),
        .longest_climb_m      = 0.0,
        .elevation_available  = true,
    };
}

}  // namespace

int main() {
    // ── Property 1: bounded ─────────────────────────────────────────────────
    rc::check(
        "technicity: score in [0, 100]",
        []() {
            const auto s = random_summary();
            const double spread = *rc::gen::inRange(0, 80);
            const double v = TechnicityScorer{}.technicity_score(s, spread);
            RC_ASSERT(v >= 0.0);
            RC_ASSERT(v <= 100.0);
        }
    );

    // ── Property 2: strictly increasing in each input ───────────────────────
    rc::check(
        "technicity: strictly increasing in max slope, uphill slope, range",
        []() {
            const TechnicityScorer scorer;
            const auto s = random_summary();
            const double bump = 1.0 + *rc::gen::inRange(0, 20);
            const double base = scorer.technicity_score(s, 0.0);

            auto steeper = s;
            steeper.max_slope_pct += bump;
            RC_ASSERT(scorer.technicity_score(steeper, 0.0) > base);

            auto climbier = s;
            climbier.avg_uphill_slope_pct += bump;
            RC_ASSERT(scorer.technicity_score(climbier, 0.0) > base);

            auto higher = s;
            higher.max_altitude_m += 10.0 * bump;
            RC_ASSERT(scorer.technicity_score(higher, 0.0) > base);

            RC_ASSERT(scorer.technicity_score(s, bump) > base);
        }
    );

    // ── Property 3: altitude tags are monotonic in max altitude ─────────────
    rc::check(
        "technicity: raising max altitude never removes altitude tags",
        []() {
            const TechnicityScorer scorer;
            const auto s = random_summary();
            auto higher = s;
            higher.max_altitude_m += *rc::gen::inRange(1, 2000);

            const auto lo = scorer.environment_tags(s);
            const auto hi = scorer.environment_tags(higher);
            for (auto tag : {EnvironmentTag::MidMountain, EnvironmentTag::HighMountain}) {
                if (lo.count(tag)) {
                    RC_ASSERT(hi.count(tag) == 1u);
                }
            }
        }
    );

    return 0;
}
