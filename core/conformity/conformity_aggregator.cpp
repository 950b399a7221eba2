#include "conformity/conformity_aggregator.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace dconf {

// ─── ConformityAggregator ──────────────────────────────────────

ConformityAggregator::ConformityAggregator(const LabelSimilarityScorer& scorer,
                                           const std::vector<Profile>& profiles,
                                           const std::vector<double>& alphas)
    : scorer_(scorer), profiles_(profiles), alphas_(alphas) {}

NodeAccumulator ConformityAggregator::accumulate(NodeId source, const Shells& shells) const {
    NodeAccumulator acc = makeAccumulator(source);
    for (const auto& [distance, shell] : shells) {
        addShell(acc, distance, shell);
    }
    return acc;
}

void ConformityAggregator::addShell(NodeAccumulator& acc, int distance,
                                    const std::vector<NodeId>& shell) const {
    if (distance <= 0) {
        throw PreconditionViolation("Shell distance must be positive, got " +
                                    std::to_string(distance));
    }

    for (size_t p = 0; p < profiles_.size(); ++p) {
        double sim = scorer_.score(acc.node, shell, profiles_[p]);
        for (size_t a = 0; a < alphas_.size(); ++a) {
            acc.values[a][p] += sim / std::pow(static_cast<double>(distance), alphas_[a]);
        }
    }
    acc.max_distance = std::max(acc.max_distance, distance);
}

// ─── Normalizer ────────────────────────────────────────────────

double Normalizer::divisor(double alpha, int max_distance) {
    double norm = 0.0;
    for (int k = 1; k <= max_distance; ++k) {
        norm += std::pow(static_cast<double>(k), -alpha);
    }
    return norm;
}

void Normalizer::normalize(NodeAccumulator& acc, const std::vector<double>& alphas) {
    if (acc.max_distance < 1) return;

    for (size_t a = 0; a < alphas.size() && a < acc.values.size(); ++a) {
        double norm = divisor(alphas[a], acc.max_distance);
        for (double& v : acc.values[a]) {
            v /= norm;
        }
    }
}

} // namespace dconf
