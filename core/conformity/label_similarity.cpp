#include "conformity/label_similarity.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <cstdlib>

namespace dconf {

LabelSimilarityScorer::LabelSimilarityScorer(const Graph& snapshot, const Hierarchies& hierarchies)
    : snapshot_(snapshot), hierarchies_(hierarchies) {}

double LabelSimilarityScorer::score(NodeId source, const std::vector<NodeId>& shell,
                                    const Profile& profile) const {
    double s = 1.0;
    for (const auto& label : profile) {
        s *= labelScore(source, shell, label);
    }
    return s;
}

double LabelSimilarityScorer::labelScore(NodeId source, const std::vector<NodeId>& shell,
                                         const std::string& label) const {
    if (shell.empty()) {
        throw PreconditionViolation("Empty shell for node " + std::to_string(source));
    }

    const std::string& a_u = labelOf(source, label);
    double total = 0.0;
    for (NodeId v : shell) {
        total += agreement(label, a_u, labelOf(v, label)) * homogeneity(v, label);
    }
    return total / static_cast<double>(shell.size());
}

double LabelSimilarityScorer::agreement(const std::string& label,
                                        const std::string& a, const std::string& b) const {
    if (a == b) return 1.0;

    auto h = hierarchies_.find(label);
    if (h == hierarchies_.end()) return -1.0;

    const Hierarchy& ranks = h->second;
    if (ranks.size() < 2) {
        throw InvalidArgument("Hierarchy for label '" + label + "' needs at least two ranks");
    }
    auto ra = ranks.find(a);
    auto rb = ranks.find(b);
    if (ra == ranks.end() || rb == ranks.end()) {
        const std::string& missing = (ra == ranks.end()) ? a : b;
        throw InvalidArgument("Hierarchy for label '" + label + "' has no rank for '" +
                              missing + "'");
    }
    return -std::abs(ra->second - rb->second) / static_cast<double>(ranks.size() - 1);
}

double LabelSimilarityScorer::homogeneity(NodeId node, const std::string& label) const {
    std::vector<NodeId> neighbors = snapshot_.getNeighborNodes(node);
    if (neighbors.empty()) return 1.0;

    const std::string& own = labelOf(node, label);
    size_t same = 0;
    for (NodeId x : neighbors) {
        if (labelOf(x, label) == own) same++;
    }
    if (same == 0) return 1.0;
    return static_cast<double>(same) / static_cast<double>(neighbors.size());
}

const std::string& LabelSimilarityScorer::labelOf(NodeId node, const std::string& label) const {
    const Node* n = snapshot_.getNode(node);
    if (!n) {
        throw UpstreamDataError("Node not in snapshot: " + std::to_string(node));
    }
    auto it = n->labels.find(label);
    if (it == n->labels.end()) {
        throw UpstreamDataError("Node " + std::to_string(node) + " has no label '" + label + "'");
    }
    return it->second;
}

} // namespace dconf
