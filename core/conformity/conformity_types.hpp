#pragma once

#include "graph/node.hpp"
#include "paths/path_oracle.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace dconf {

/// One or more labels evaluated jointly.
using Profile = std::vector<std::string>;

/// Categorical value → ordinal rank, for graded disagreement.
using Hierarchy = std::unordered_map<std::string, int>;

/// Label name → hierarchy. Labels without an entry are flat.
using Hierarchies = std::unordered_map<std::string, Hierarchy>;

// ─── Results ───────────────────────────────────────────────────
// Keys are strings so that results read the same way regardless of
// how the alpha was produced: alphaKey(1.0) == "1", alphaKey(1.2) == "1.2".

using NodeScores = std::unordered_map<NodeId, double>;
using ProfileScores = std::map<std::string, NodeScores>;   // profile key → scores
using ConformityResult = std::map<std::string, ProfileScores>;  // alpha key → ...

struct TrendPoint {
    int64_t timestamp = 0;  // window end, t + delta
    double score = 0.0;
};

using NodeTrend = std::unordered_map<NodeId, std::vector<TrendPoint>>;
using ProfileTrends = std::map<std::string, NodeTrend>;

/// Per (alpha, profile, node) conformity time series.
struct ConformityTrend {
    std::map<std::string, ProfileTrends> series;  // alpha key → profile key → node → points
    size_t windows = 0;                           // windows evaluated

    /// Points for one key; empty when the key never received a value.
    const std::vector<TrendPoint>& at(const std::string& alpha_key,
                                      const std::string& profile_key,
                                      NodeId node) const;
};

// ─── Configuration ─────────────────────────────────────────────

struct ConformityConfig {
    std::vector<double> alphas;        // damping factors, > 0
    std::vector<std::string> labels;   // label dimensions to compare
    size_t profile_size = 1;           // largest label combination
    Hierarchies hierarchies;           // optional graded label orders
    PathPolicy path_policy = PathPolicy::SHORTEST;
    int num_threads = 0;               // 0 = runtime default
};

struct SlidingConfig {
    ConformityConfig conformity;
    int64_t delta = 1;           // window length
    size_t max_windows = 0;      // 0 = unbounded
    double max_seconds = 0.0;    // 0 = unbounded
};

// ─── Helpers ───────────────────────────────────────────────────

/// Throws InvalidArgument unless alphas and labels are non-empty,
/// every alpha is finite, positive and has its own alphaKey,
/// 1 <= profile_size <= |labels|
/// and every hierarchy has at least two ranks.
void validateConfig(const ConformityConfig& config);

/// All label combinations of sizes 1..profile_size, in combination order.
std::vector<Profile> buildProfiles(const std::vector<std::string>& labels, size_t profile_size);

/// Labels joined with '_'.
std::string profileKey(const Profile& profile);

/// Shortest decimal rendering of a damping factor.
std::string alphaKey(double alpha);

} // namespace dconf
