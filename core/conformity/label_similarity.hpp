#pragma once

#include "conformity/conformity_types.hpp"
#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace dconf {

// ─── LabelSimilarityScorer ─────────────────────────────────────
// Similarity between a source node and one reachability shell.
//
// For a single label the score is the shell average of
//     sgn(v) * f(v)
// where sgn(v) is the agreement of v's value with the source's
// (1 on equality, graded through the label hierarchy otherwise, -1 for
// flat labels) and f(v) the share of v's neighbours holding v's own
// value. A profile multiplies the per-label scores.
//
// f(v) == 0 is read as 1: a node with no like-minded neighbour is not
// penalized for it, and neither is a node with no neighbour at all.

class LabelSimilarityScorer {
public:
    LabelSimilarityScorer(const Graph& snapshot, const Hierarchies& hierarchies);

    /// Product over the profile's labels of labelScore().
    /// Throws PreconditionViolation on an empty shell.
    double score(NodeId source, const std::vector<NodeId>& shell,
                 const Profile& profile) const;

    /// Shell average of sgn(v) * f(v) for one label.
    double labelScore(NodeId source, const std::vector<NodeId>& shell,
                      const std::string& label) const;

    /// sgn: 1 if equal, -|rank(a) - rank(b)| / (|H| - 1) with a hierarchy,
    /// -1 otherwise.
    double agreement(const std::string& label,
                     const std::string& a, const std::string& b) const;

    /// f: fraction of the node's neighbours sharing its value, 0 mapped to 1.
    double homogeneity(NodeId node, const std::string& label) const;

private:
    const std::string& labelOf(NodeId node, const std::string& label) const;

    const Graph& snapshot_;
    const Hierarchies& hierarchies_;
};

} // namespace dconf
