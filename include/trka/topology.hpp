#pragma once

/// @file include/trka/topology.hpp
/// @brief TopologyClassifier: loop, out-and-back or point-to-point.
///
/// # Module: Route Topology Classifier
///
/// ## Rules
///   closure = great-circle distance between the first and last point
///
///   closure > max(loop_closure_fraction · total, closure_floor_m)
///       → PointToPoint
///
///   otherwise the outbound half of the path (by distance) is sampled at
///   regular intervals, and each sample is matched to the nearest point of
///   the return half:
///       overlap_ratio = share of samples within overlap_distance_m
///       median        = median nearest distance
///
///   median < overlap_distance_m  and  overlap_ratio > overlap_majority
///   and  overlap_ratio > out_and_back_min_overlap
///       → OutAndBack
///   else
///       → Loop
///
/// ## Cost Bound
/// At most `max_overlap_samples` outbound samples are taken, whatever the
/// track length, so the search is O(max_overlap_samples · n).
///
/// ## Guarantees
/// - Deterministic, stateless, never throws

#include "trka/config.hpp"
#include "trka/types.hpp"

#include <vector>

namespace trka::topology {

/// Raw overlap measurements between the outbound and return halves.
struct OverlapStats {
    double              ratio;
    double              median_distance_m;
    std::vector<double> nearest_distances_m;  ///< One per outbound sample
};

class TopologyClassifier {
public:
    explicit TopologyClassifier(TopologyConfig config = TopologyConfig{}) noexcept;

    [[nodiscard]] RouteType
    classify(const NormalizedTrack& track, const GeometrySummary& summary) const;

    /// Classification together with the measurements behind it.
    [[nodiscard]] TopologyReport
    inspect(const NormalizedTrack& track, const GeometrySummary& summary) const;

    /// Sample the outbound half and measure its distance to the return half.
    [[nodiscard]] OverlapStats measure_overlap(const NormalizedTrack& track) const;

private:
    TopologyConfig config_;
};

}  // namespace trka::topology
