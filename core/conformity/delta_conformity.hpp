#pragma once

#include "conformity/conformity_types.hpp"
#include "graph/graph_snapshot.hpp"
#include "paths/path_oracle.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dconf {

/// Delta-conformity of every node of the snapshot [window_start,
/// window_start + delta].
///
/// Arguments are validated before the graph is touched (InvalidArgument).
/// The result holds every snapshot node under every (alpha, profile) key;
/// nodes that reach nobody inside the window score exactly 0.
ConformityResult deltaConformity(const SnapshotProvider& graph,
                                 const PathOracle& oracle,
                                 int64_t window_start,
                                 int64_t delta,
                                 const ConformityConfig& config);

ConformityResult deltaConformity(const SnapshotProvider& graph,
                                 const PathOracle& oracle,
                                 int64_t window_start,
                                 int64_t delta,
                                 const std::vector<double>& alphas,
                                 const std::vector<std::string>& labels,
                                 size_t profile_size = 1,
                                 const Hierarchies& hierarchies = {},
                                 PathPolicy path_policy = PathPolicy::SHORTEST);

/// Scores an already materialized snapshot from precomputed pair
/// distances. This is the part of deltaConformity() after the snapshot
/// and oracle calls.
ConformityResult scoreSnapshot(const Graph& snapshot,
                               const PairDistances& pairs,
                               const ConformityConfig& config);

} // namespace dconf
