#include "conformity/delta_conformity.hpp"
#include "conformity/conformity_aggregator.hpp"
#include "conformity/distance_shells.hpp"
#include "conformity/label_similarity.hpp"
#include "common/debug_log.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <exception>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace dconf {

namespace {

int workerCount(int requested) {
#ifdef _OPENMP
    return requested > 0 ? requested : omp_get_max_threads();
#else
    (void)requested;
    return 1;
#endif
}

ConformityResult mergeAccumulators(const std::vector<NodeAccumulator>& accumulators,
                                   const std::vector<Profile>& profiles,
                                   const std::vector<double>& alphas) {
    ConformityResult res;
    for (size_t a = 0; a < alphas.size(); ++a) {
        ProfileScores& by_profile = res[alphaKey(alphas[a])];
        for (size_t p = 0; p < profiles.size(); ++p) {
            NodeScores& scores = by_profile[profileKey(profiles[p])];
            scores.reserve(accumulators.size());
            for (const auto& acc : accumulators) {
                scores[acc.node] = acc.values[a][p];
            }
        }
    }
    return res;
}

} // namespace

ConformityResult scoreSnapshot(const Graph& snapshot,
                               const PairDistances& pairs,
                               const ConformityConfig& config) {
    validateConfig(config);

    const std::vector<Profile> profiles = buildProfiles(config.labels, config.profile_size);
    const DistanceMap distances = DistanceShellBuilder::project(pairs, config.path_policy, snapshot);

    std::vector<NodeId> nodes = snapshot.getNodeIds();
    std::sort(nodes.begin(), nodes.end());

    LabelSimilarityScorer scorer(snapshot, config.hierarchies);
    ConformityAggregator aggregator(scorer, profiles, config.alphas);

    // One accumulator per node; workers never share one.
    std::vector<NodeAccumulator> accumulators(nodes.size());
    std::exception_ptr failure;
    const long n = static_cast<long>(nodes.size());
    const int threads = workerCount(config.num_threads);

    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long i = 0; i < n; ++i) {
        try {
            const NodeId u = nodes[static_cast<size_t>(i)];
            auto it = distances.find(u);
            if (it == distances.end()) {
                accumulators[static_cast<size_t>(i)] = aggregator.makeAccumulator(u);
                continue;
            }
            NodeAccumulator acc = aggregator.accumulate(u, DistanceShellBuilder::build(u, it->second));
            Normalizer::normalize(acc, config.alphas);
            accumulators[static_cast<size_t>(i)] = std::move(acc);
        } catch (...) {
            // Rethrown on the calling thread after the join.
            #pragma omp critical(dconf_worker_failure)
            {
                if (!failure) failure = std::current_exception();
            }
        }
    }
    if (failure) std::rethrow_exception(failure);

    return mergeAccumulators(accumulators, profiles, config.alphas);
}

ConformityResult deltaConformity(const SnapshotProvider& graph,
                                 const PathOracle& oracle,
                                 int64_t window_start,
                                 int64_t delta,
                                 const ConformityConfig& config) {
    validateConfig(config);
    if (delta < 0) {
        throw InvalidArgument("delta must be non-negative, got " + std::to_string(delta));
    }

    const int64_t window_end = window_start + delta;
    Graph snapshot = graph.timeSlice(window_start, window_end);
    PairDistances pairs = oracle.distances(snapshot, window_start, window_end);

    DCONF_DEBUG_LOG("window [%lld, %lld]: %zu nodes, %zu reachable pairs, policy %s",
                    static_cast<long long>(window_start), static_cast<long long>(window_end),
                    snapshot.nodeCount(), pairs.size(), toString(config.path_policy).c_str());

    return scoreSnapshot(snapshot, pairs, config);
}

ConformityResult deltaConformity(const SnapshotProvider& graph,
                                 const PathOracle& oracle,
                                 int64_t window_start,
                                 int64_t delta,
                                 const std::vector<double>& alphas,
                                 const std::vector<std::string>& labels,
                                 size_t profile_size,
                                 const Hierarchies& hierarchies,
                                 PathPolicy path_policy) {
    ConformityConfig config;
    config.alphas = alphas;
    config.labels = labels;
    config.profile_size = profile_size;
    config.hierarchies = hierarchies;
    config.path_policy = path_policy;
    return deltaConformity(graph, oracle, window_start, delta, config);
}

} // namespace dconf
