#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dconf {

// ─── Graph ─────────────────────────────────────────────────────
// A static view of a dynamic network over a bounded time range.
// Undirected multigraph: the same pair may be linked by several
// edges, one per activity interval. Adjacency is kept as node_id →
// set of incident edge ids for O(1) access.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──
    NodeId addNode(NodeId id, std::unordered_map<std::string, std::string> labels = {});
    bool hasNode(NodeId id) const { return nodes_.count(id) > 0; }
    Node* getNode(NodeId id);
    const Node* getNode(NodeId id) const;
    std::vector<NodeId> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    uint64_t addEdge(NodeId source, NodeId target, int64_t t_from, int64_t t_to);
    const Edge* getEdge(uint64_t id) const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    std::vector<uint64_t> getIncidentEdges(NodeId node_id) const;
    std::vector<NodeId> getNeighborNodes(NodeId node_id) const;
    size_t degree(NodeId node_id) const { return getNeighborNodes(node_id).size(); }

    // ── Iteration ──
    void forEachEdge(std::function<void(const Edge&)> fn) const;

private:
    uint64_t next_edge_id_ = 1;

    std::unordered_map<NodeId, Node> nodes_;
    std::unordered_map<uint64_t, Edge> edges_;

    // node_id → ids of the edges touching it
    std::unordered_map<NodeId, std::unordered_set<uint64_t>> incident_;
};

} // namespace dconf
