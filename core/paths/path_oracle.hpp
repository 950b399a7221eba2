#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace dconf {

/// Ranking used to pick the representative time-respecting path
/// between two nodes.
enum class PathPolicy {
    SHORTEST,           // fewest hops
    FASTEST,            // smallest duration
    FOREMOST,           // earliest arrival
    FASTEST_SHORTEST,   // fewest hops, then smallest duration
    SHORTEST_FASTEST    // smallest duration, then fewest hops
};

/// Parses "shortest", "fastest", "foremost", "fastest_shortest" or
/// "shortest_fastest". Throws InvalidArgument on anything else.
PathPolicy pathPolicyFromString(const std::string& name);
std::string toString(PathPolicy policy);

/// Hop distance of the representative path under every policy.
struct PolicyDistances {
    int shortest = 0;
    int fastest = 0;
    int foremost = 0;
    int fastest_shortest = 0;
    int shortest_fastest = 0;

    int get(PathPolicy policy) const;
};

using NodePair = std::pair<NodeId, NodeId>;

/// Ordered (source, target) → distances. Only reachable pairs appear.
using PairDistances = std::map<NodePair, PolicyDistances>;

/// Answers "which nodes can reach which, and how far" over a snapshot.
class PathOracle {
public:
    virtual ~PathOracle() = default;

    /// Distances for every ordered pair connected by a time-respecting
    /// path inside the closed range [t_from, t_to].
    virtual PairDistances distances(const Graph& snapshot,
                                    int64_t t_from, int64_t t_to) const = 0;
};

} // namespace dconf
