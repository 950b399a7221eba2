#pragma once

#include "conformity/conformity_types.hpp"
#include "graph/graph_snapshot.hpp"
#include "paths/path_oracle.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dconf {

/// Delta-conformity over sliding windows.
///
/// For every temporal id t of `index`, in order, with t + delta strictly
/// below the last id, scores the window [t, t + delta] and appends
/// (t + delta, score) to each node's series. Windows are independent.
/// When no window fits, every series is empty; this is not an error.
///
/// `max_windows` and `max_seconds` stop the run early. They are checked
/// after each window, so the first window always completes.
ConformityTrend slidingDeltaConformity(const SnapshotProvider& graph,
                                       const TemporalIndex& index,
                                       const PathOracle& oracle,
                                       const SlidingConfig& config);

ConformityTrend slidingDeltaConformity(const SnapshotProvider& graph,
                                       const TemporalIndex& index,
                                       const PathOracle& oracle,
                                       int64_t delta,
                                       const std::vector<double>& alphas,
                                       const std::vector<std::string>& labels,
                                       size_t profile_size = 1,
                                       const Hierarchies& hierarchies = {},
                                       PathPolicy path_policy = PathPolicy::SHORTEST);

/// Window starts slidingDeltaConformity() would evaluate for `ids`.
std::vector<int64_t> windowStarts(const std::vector<int64_t>& ids, int64_t delta);

} // namespace dconf
