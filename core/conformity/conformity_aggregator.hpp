#pragma once

#include "conformity/conformity_types.hpp"
#include "conformity/distance_shells.hpp"
#include "conformity/label_similarity.hpp"

#include <vector>

namespace dconf {

// ─── NodeAccumulator ───────────────────────────────────────────
// Scores of a single node, indexed [alpha][profile] in the order the
// aggregator was given them. Each node owns its accumulator, so nodes can
// be processed concurrently and merged afterwards.

struct NodeAccumulator {
    NodeId node = 0;
    int max_distance = 0;  // deepest shell seen, 0 = nothing reachable
    std::vector<std::vector<double>> values;

    NodeAccumulator() = default;
    NodeAccumulator(NodeId node, size_t num_alphas, size_t num_profiles)
        : node(node), values(num_alphas, std::vector<double>(num_profiles, 0.0)) {}
};

// ─── ConformityAggregator ──────────────────────────────────────
// Sums sim(shell, profile) / d^alpha over the shells of a node.
// A pure sum: shells may be added in any order.

class ConformityAggregator {
public:
    ConformityAggregator(const LabelSimilarityScorer& scorer,
                         const std::vector<Profile>& profiles,
                         const std::vector<double>& alphas);

    /// Fresh accumulator for `source` with every shell added.
    NodeAccumulator accumulate(NodeId source, const Shells& shells) const;

    /// Add the contribution of the shell at `distance` (> 0).
    void addShell(NodeAccumulator& acc, int distance, const std::vector<NodeId>& shell) const;

    NodeAccumulator makeAccumulator(NodeId source) const {
        return NodeAccumulator(source, alphas_.size(), profiles_.size());
    }

private:
    const LabelSimilarityScorer& scorer_;
    const std::vector<Profile>& profiles_;
    const std::vector<double>& alphas_;
};

// ─── Normalizer ────────────────────────────────────────────────
// Divides by sum_{k=1..max_distance} k^-alpha, the value the accumulator
// would hold if every shell scored 1.

class Normalizer {
public:
    /// sum_{k=1..max_distance} k^-alpha; 0 when max_distance < 1.
    static double divisor(double alpha, int max_distance);

    /// Normalize in place. Accumulators with max_distance == 0 are left at 0.
    static void normalize(NodeAccumulator& acc, const std::vector<double>& alphas);
};

} // namespace dconf
