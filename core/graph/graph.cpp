#include "graph/graph.hpp"
#include "common/errors.hpp"

#include <unordered_set>

namespace dconf {

// ─── Node operations ───────────────────────────────────────────

NodeId Graph::addNode(NodeId id, std::unordered_map<std::string, std::string> labels) {
    if (nodes_.count(id)) {
        throw InvalidArgument("Node ID already exists: " + std::to_string(id));
    }
    nodes_.emplace(id, Node(id, std::move(labels)));
    incident_[id];  // ensure entry exists
    return id;
}

Node* Graph::getNode(NodeId id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node* Graph::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<NodeId> Graph::getNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

// ─── Edge operations ───────────────────────────────────────────

uint64_t Graph::addEdge(NodeId source, NodeId target, int64_t t_from, int64_t t_to) {
    if (!nodes_.count(source))
        throw InvalidArgument("Source node not found: " + std::to_string(source));
    if (!nodes_.count(target))
        throw InvalidArgument("Target node not found: " + std::to_string(target));
    if (t_to <= t_from)
        throw InvalidArgument("Empty activity interval [" + std::to_string(t_from) +
                              ", " + std::to_string(t_to) + ")");

    uint64_t id = next_edge_id_++;
    edges_.emplace(id, Edge(id, source, target, t_from, t_to));
    incident_[source].insert(id);
    incident_[target].insert(id);
    return id;
}

const Edge* Graph::getEdge(uint64_t id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<uint64_t> Graph::getIncidentEdges(NodeId node_id) const {
    auto it = incident_.find(node_id);
    if (it == incident_.end()) return {};
    return std::vector<uint64_t>(it->second.begin(), it->second.end());
}

std::vector<NodeId> Graph::getNeighborNodes(NodeId node_id) const {
    std::unordered_set<NodeId> neighbors;
    for (auto eid : getIncidentEdges(node_id)) {
        const Edge* e = getEdge(eid);
        if (e) neighbors.insert(e->other(node_id));
    }
    return std::vector<NodeId>(neighbors.begin(), neighbors.end());
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachEdge(std::function<void(const Edge&)> fn) const {
    for (const auto& [_, edge] : edges_) {
        fn(edge);
    }
}

} // namespace dconf
