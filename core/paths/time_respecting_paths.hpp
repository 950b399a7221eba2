#pragma once

#include "paths/path_oracle.hpp"

#include <cstdint>
#include <map>

namespace dconf {

// ─── TemporalPathOracle ────────────────────────────────────────
// Time-respecting reachability over a snapshot.
//
// A path is a sequence of hops (x_i → x_{i+1} at t_i) where every hop
// uses an edge active at integer step t_i and t_1 < t_2 < ... < t_k,
// all within [t_from, t_to]. For a path:
//   length   = k
//   duration = t_k - t_1
//   reach    = t_k
// Each policy ranks paths (see PathPolicy) and reports the hop count of
// the best one, ties broken towards fewer hops.

class TemporalPathOracle : public PathOracle {
public:
    PairDistances distances(const Graph& snapshot,
                            int64_t t_from, int64_t t_to) const override;

    /// Distances from one source to every node it reaches.
    std::map<NodeId, PolicyDistances> distancesFrom(const Graph& snapshot, NodeId source,
                                                    int64_t t_from, int64_t t_to) const;
};

} // namespace dconf
