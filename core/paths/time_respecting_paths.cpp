#include "paths/time_respecting_paths.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dconf {

namespace {

using StepEdges = std::map<int64_t, std::vector<std::pair<NodeId, NodeId>>>;

// Every integer step in [t_from, t_to] with the node pairs active at it.
StepEdges activeEdgesByStep(const Graph& snapshot, int64_t t_from, int64_t t_to) {
    StepEdges steps;
    snapshot.forEachEdge([&](const Edge& e) {
        int64_t lo = std::max(e.t_from, t_from);
        int64_t hi = std::min(e.t_to - 1, t_to);
        for (int64_t t = lo; t <= hi; ++t) {
            steps[t].emplace_back(e.source, e.target);
        }
    });
    return steps;
}

// Best values seen so far for one target, over all departure steps.
struct ReachRecord {
    int min_hops = std::numeric_limits<int>::max();

    int64_t min_duration = std::numeric_limits<int64_t>::max();
    int hops_fastest = std::numeric_limits<int>::max();

    int64_t min_reach = std::numeric_limits<int64_t>::max();
    int hops_foremost = std::numeric_limits<int>::max();
};

void keepBest(int64_t value, int hops, int64_t& best_value, int& best_hops) {
    if (value < best_value) {
        best_value = value;
        best_hops = hops;
    } else if (value == best_value) {
        best_hops = std::min(best_hops, hops);
    }
}

// Best hop counts from `source` over a prebuilt step index.
std::map<NodeId, PolicyDistances> reachFrom(const StepEdges& steps, NodeId source) {
    std::unordered_map<NodeId, ReachRecord> records;

    for (auto departure = steps.begin(); departure != steps.end(); ++departure) {
        const int64_t t_departure = departure->first;
        bool leaves_source = false;
        for (const auto& [a, b] : departure->second) {
            if (a == source || b == source) {
                leaves_source = true;
                break;
            }
        }
        if (!leaves_source) continue;

        // Fewest hops to stand on a node, and the (step, hops) of its first arrival.
        std::unordered_map<NodeId, int> hops;
        std::unordered_map<NodeId, std::pair<int64_t, int>> first_reach;

        for (auto step = departure; step != steps.end(); ++step) {
            const int64_t t = step->first;
            std::unordered_map<NodeId, int> updates;

            auto relax = [&](NodeId from, NodeId to) {
                if (to == source) return;
                int base;
                if (from == source) {
                    if (t != t_departure) return;
                    base = 0;
                } else {
                    auto it = hops.find(from);
                    if (it == hops.end()) return;
                    base = it->second;
                }
                auto [slot, inserted] = updates.try_emplace(to, base + 1);
                if (!inserted) slot->second = std::min(slot->second, base + 1);
            };

            // Relax against the state before this step: one hop per step.
            for (const auto& [a, b] : step->second) {
                relax(a, b);
                relax(b, a);
            }

            for (const auto& [node, h] : updates) {
                auto it = hops.find(node);
                if (it == hops.end()) {
                    hops.emplace(node, h);
                    first_reach.emplace(node, std::make_pair(t, h));
                } else if (h < it->second) {
                    it->second = h;
                }
            }
        }

        for (const auto& [node, h] : hops) {
            ReachRecord& rec = records[node];
            const auto& [t_reach, h_reach] = first_reach.at(node);
            rec.min_hops = std::min(rec.min_hops, h);
            keepBest(t_reach - t_departure, h_reach, rec.min_duration, rec.hops_fastest);
            keepBest(t_reach, h_reach, rec.min_reach, rec.hops_foremost);
        }
    }

    std::map<NodeId, PolicyDistances> result;
    for (const auto& [node, rec] : records) {
        PolicyDistances d;
        d.shortest = rec.min_hops;
        d.fastest = rec.hops_fastest;
        d.foremost = rec.hops_foremost;
        d.fastest_shortest = rec.min_hops;
        d.shortest_fastest = rec.hops_fastest;
        result.emplace(node, d);
    }
    return result;
}

} // namespace

std::map<NodeId, PolicyDistances> TemporalPathOracle::distancesFrom(
        const Graph& snapshot, NodeId source, int64_t t_from, int64_t t_to) const {
    if (!snapshot.hasNode(source)) {
        throw InvalidArgument("Source node not in snapshot: " + std::to_string(source));
    }
    return reachFrom(activeEdgesByStep(snapshot, t_from, t_to), source);
}

PairDistances TemporalPathOracle::distances(const Graph& snapshot,
                                            int64_t t_from, int64_t t_to) const {
    if (t_to < t_from) {
        throw InvalidArgument("Range end " + std::to_string(t_to) +
                              " precedes its start " + std::to_string(t_from));
    }

    const StepEdges steps = activeEdgesByStep(snapshot, t_from, t_to);

    PairDistances all;
    std::vector<NodeId> sources = snapshot.getNodeIds();
    std::sort(sources.begin(), sources.end());
    for (NodeId u : sources) {
        for (const auto& [v, d] : reachFrom(steps, u)) {
            all.emplace(NodePair{u, v}, d);
        }
    }
    return all;
}

} // namespace dconf
