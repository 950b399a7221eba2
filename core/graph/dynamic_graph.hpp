#pragma once

#include "graph/graph.hpp"
#include "graph/graph_snapshot.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dconf {

// ─── DynamicGraph ──────────────────────────────────────────────
// In-memory undirected interaction network. Nodes carry
// time-invariant labels; every interaction carries its own activity
// interval [t_from, t_to). Repeated interactions between the same pair
// are kept as separate intervals.

class DynamicGraph : public SnapshotProvider, public TemporalIndex {
public:
    DynamicGraph() = default;

    // ── Node operations ──
    NodeId addNode(NodeId id, std::unordered_map<std::string, std::string> labels = {});
    bool hasNode(NodeId id) const { return nodes_.count(id) > 0; }
    Node* getNode(NodeId id);
    const Node* getNode(NodeId id) const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Interactions ──
    // Endpoints not yet known are added without labels.

    /// Interaction lasting the single time step `t`.
    uint64_t addInteraction(NodeId u, NodeId v, int64_t t);

    /// Interaction active on [t_from, t_to). Requires t_to > t_from.
    uint64_t addInteraction(NodeId u, NodeId v, int64_t t_from, int64_t t_to);

    size_t interactionCount() const { return interactions_.size(); }

    // ── Snapshot / temporal index ──
    Graph timeSlice(int64_t t_from, int64_t t_to) const override;
    std::vector<int64_t> temporalSnapshotIds() const override;

private:
    uint64_t next_interaction_id_ = 1;
    std::unordered_map<NodeId, Node> nodes_;
    std::vector<Edge> interactions_;
};

} // namespace dconf
