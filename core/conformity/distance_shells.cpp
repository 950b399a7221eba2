#include "conformity/distance_shells.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace dconf {

DistanceMap DistanceShellBuilder::project(const PairDistances& pairs, PathPolicy policy,
                                          const Graph& snapshot) {
    DistanceMap out;
    for (const auto& [pair, distances] : pairs) {
        const auto& [u, v] = pair;
        if (!snapshot.hasNode(u) || !snapshot.hasNode(v)) {
            throw UpstreamDataError("Distance for pair (" + std::to_string(u) + ", " +
                                    std::to_string(v) + ") outside the snapshot");
        }
        out[u][v] = distances.get(policy);
    }
    return out;
}

Shells DistanceShellBuilder::build(NodeId source, const SourceDistances& distances) {
    Shells shells;
    for (const auto& [node, dist] : distances) {
        if (dist < 0) {
            throw UpstreamDataError("Negative distance " + std::to_string(dist) + " from " +
                                    std::to_string(source) + " to " + std::to_string(node));
        }
        if (dist == 0 || node == source) continue;
        shells[dist].push_back(node);
    }
    for (auto& [_, nodes] : shells) {
        std::sort(nodes.begin(), nodes.end());
    }
    return shells;
}

} // namespace dconf
