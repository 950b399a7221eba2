#pragma once

#include "graph/graph.hpp"
#include "paths/path_oracle.hpp"

#include <map>
#include <unordered_map>
#include <vector>

namespace dconf {

/// Target → distance, for one source and one policy.
using SourceDistances = std::unordered_map<NodeId, int>;

/// Source → its distances.
using DistanceMap = std::unordered_map<NodeId, SourceDistances>;

/// Distance → nodes at that distance, ascending by distance.
using Shells = std::map<int, std::vector<NodeId>>;

// ─── DistanceShellBuilder ──────────────────────────────────────
// Groups the nodes a source reaches into shells of equal distance.

class DistanceShellBuilder {
public:
    /// Project oracle output onto one policy, keyed by source.
    /// Throws UpstreamDataError for pairs naming nodes outside the snapshot.
    static DistanceMap project(const PairDistances& pairs, PathPolicy policy,
                               const Graph& snapshot);

    /// Distance-0 entries (the source itself) are skipped. Nodes inside a
    /// shell are sorted by id. Throws UpstreamDataError on a negative distance.
    static Shells build(NodeId source, const SourceDistances& distances);

    /// Largest shell key, 0 when nothing is reachable.
    static int maxDistance(const Shells& shells) {
        return shells.empty() ? 0 : shells.rbegin()->first;
    }
};

} // namespace dconf
