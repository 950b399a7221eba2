#include "conformity/sliding_conformity.hpp"
#include "conformity/delta_conformity.hpp"
#include "common/debug_log.hpp"
#include "common/errors.hpp"

#include <chrono>

namespace dconf {

namespace {

using Clock = std::chrono::steady_clock;

// True once either limit of `config` is reached. Zero limits never trip.
bool budgetSpent(const SlidingConfig& config, size_t windows, Clock::time_point started) {
    if (config.max_windows > 0 && windows >= config.max_windows) return true;
    if (config.max_seconds > 0.0) {
        std::chrono::duration<double> elapsed = Clock::now() - started;
        if (elapsed.count() >= config.max_seconds) return true;
    }
    return false;
}

} // namespace

std::vector<int64_t> windowStarts(const std::vector<int64_t>& ids, int64_t delta) {
    std::vector<int64_t> starts;
    if (ids.empty()) return starts;
    const int64_t last = ids.back();
    for (int64_t t : ids) {
        if (t + delta < last) starts.push_back(t);
    }
    return starts;
}

ConformityTrend slidingDeltaConformity(const SnapshotProvider& graph,
                                       const TemporalIndex& index,
                                       const PathOracle& oracle,
                                       const SlidingConfig& config) {
    validateConfig(config.conformity);
    if (config.delta < 0) {
        throw InvalidArgument("delta must be non-negative, got " + std::to_string(config.delta));
    }
    if (config.max_seconds < 0.0) {
        throw InvalidArgument("max_seconds must be non-negative");
    }

    ConformityTrend trend;
    for (double alpha : config.conformity.alphas) {
        auto& by_profile = trend.series[alphaKey(alpha)];
        for (const auto& profile : buildProfiles(config.conformity.labels,
                                                 config.conformity.profile_size)) {
            by_profile[profileKey(profile)];
        }
    }

    const std::vector<int64_t> starts = windowStarts(index.temporalSnapshotIds(), config.delta);
    DCONF_DEBUG_LOG("sliding delta=%lld: %zu candidate windows",
                    static_cast<long long>(config.delta), starts.size());

    const Clock::time_point started = Clock::now();

    // Limits are checked after each window, so a started window always
    // completes and at least one window runs.
    for (int64_t t : starts) {
        ConformityResult window = deltaConformity(graph, oracle, t, config.delta, config.conformity);
        const int64_t stamp = t + config.delta;
        for (const auto& [alpha, by_profile] : window) {
            for (const auto& [profile, scores] : by_profile) {
                NodeTrend& series = trend.series[alpha][profile];
                for (const auto& [node, score] : scores) {
                    series[node].push_back(TrendPoint{stamp, score});
                }
            }
        }
        trend.windows++;

        if (budgetSpent(config, trend.windows, started)) {
            DCONF_DEBUG_LOG("budget spent after %zu of %zu windows",
                            trend.windows, starts.size());
            break;
        }
    }
    return trend;
}

ConformityTrend slidingDeltaConformity(const SnapshotProvider& graph,
                                       const TemporalIndex& index,
                                       const PathOracle& oracle,
                                       int64_t delta,
                                       const std::vector<double>& alphas,
                                       const std::vector<std::string>& labels,
                                       size_t profile_size,
                                       const Hierarchies& hierarchies,
                                       PathPolicy path_policy) {
    SlidingConfig config;
    config.conformity.alphas = alphas;
    config.conformity.labels = labels;
    config.conformity.profile_size = profile_size;
    config.conformity.hierarchies = hierarchies;
    config.conformity.path_policy = path_policy;
    config.delta = delta;
    return slidingDeltaConformity(graph, index, oracle, config);
}

} // namespace dconf
