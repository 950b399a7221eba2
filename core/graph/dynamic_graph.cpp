#include "graph/dynamic_graph.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace dconf {

// ─── Node operations ───────────────────────────────────────────

NodeId DynamicGraph::addNode(NodeId id, std::unordered_map<std::string, std::string> labels) {
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        // Re-adding an endpoint created by addInteraction fills in its labels.
        for (auto& [name, value] : labels) {
            it->second.labels[name] = std::move(value);
        }
        return id;
    }
    nodes_.emplace(id, Node(id, std::move(labels)));
    return id;
}

Node* DynamicGraph::getNode(NodeId id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node* DynamicGraph::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

// ─── Interactions ──────────────────────────────────────────────

uint64_t DynamicGraph::addInteraction(NodeId u, NodeId v, int64_t t) {
    return addInteraction(u, v, t, t + 1);
}

uint64_t DynamicGraph::addInteraction(NodeId u, NodeId v, int64_t t_from, int64_t t_to) {
    if (u == v)
        throw InvalidArgument("Self interaction on node " + std::to_string(u));
    if (t_to <= t_from)
        throw InvalidArgument("Interaction end must follow its start: [" +
                              std::to_string(t_from) + ", " + std::to_string(t_to) + ")");

    if (!nodes_.count(u)) nodes_.emplace(u, Node(u));
    if (!nodes_.count(v)) nodes_.emplace(v, Node(v));

    uint64_t id = next_interaction_id_++;
    interactions_.emplace_back(id, u, v, t_from, t_to);
    return id;
}

// ─── Snapshot / temporal index ─────────────────────────────────

Graph DynamicGraph::timeSlice(int64_t t_from, int64_t t_to) const {
    if (t_to < t_from) {
        throw InvalidArgument("Slice end " + std::to_string(t_to) +
                              " precedes its start " + std::to_string(t_from));
    }

    Graph slice;
    for (const Edge& e : interactions_) {
        if (!e.overlaps(t_from, t_to)) continue;

        for (NodeId endpoint : {e.source, e.target}) {
            if (!slice.hasNode(endpoint)) {
                slice.addNode(endpoint, nodes_.at(endpoint).labels);
            }
        }
        // Clip to the closed range, i.e. to [t_from, t_to + 1).
        slice.addEdge(e.source, e.target,
                      std::max(e.t_from, t_from),
                      std::min(e.t_to, t_to + 1));
    }
    return slice;
}

std::vector<int64_t> DynamicGraph::temporalSnapshotIds() const {
    std::vector<int64_t> ids;
    ids.reserve(interactions_.size() * 2);
    for (const Edge& e : interactions_) {
        ids.push_back(e.t_from);
        ids.push_back(e.t_to - 1);  // last step the interaction is active
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

} // namespace dconf
