#pragma once

#include "graph/node.hpp"

#include <cstdint>

namespace dconf {

/// An undirected interaction between two nodes.
/// Active on the half-open interval [t_from, t_to).
struct Edge {
    uint64_t id = 0;
    NodeId source = 0;
    NodeId target = 0;
    int64_t t_from = 0;
    int64_t t_to = 1;

    Edge() = default;
    Edge(uint64_t id, NodeId source, NodeId target, int64_t t_from, int64_t t_to)
        : id(id), source(source), target(target), t_from(t_from), t_to(t_to) {}

    bool activeAt(int64_t t) const { return t_from <= t && t < t_to; }

    /// True if the interval intersects the closed range [from, to].
    bool overlaps(int64_t from, int64_t to) const { return t_from <= to && t_to > from; }

    /// The endpoint opposite to `node`.
    NodeId other(NodeId node) const { return node == source ? target : source; }
};

} // namespace dconf
