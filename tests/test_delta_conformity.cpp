#include <gtest/gtest.h>
#include "conformity/delta_conformity.hpp"
#include "conformity/conformity_types.hpp"
#include "graph/dynamic_graph.hpp"
#include "paths/time_respecting_paths.hpp"
#include "common/errors.hpp"

using namespace dconf;

namespace {

const NodeId A = 1, B = 2, C = 3, D = 4;

// Four nodes on one component over [1, 10); C alone disagrees.
DynamicGraph makeExampleGraph() {
    DynamicGraph dg;
    dg.addNode(A, {{"labels", "SI"}});
    dg.addNode(B, {{"labels", "SI"}});
    dg.addNode(C, {{"labels", "NO"}});
    dg.addNode(D, {{"labels", "SI"}});
    dg.addInteraction(A, B, 1, 4);
    dg.addInteraction(B, D, 2, 5);
    dg.addInteraction(A, C, 4, 8);
    dg.addInteraction(B, D, 2, 4);
    dg.addInteraction(B, C, 6, 10);
    dg.addInteraction(B, D, 2, 4);
    dg.addInteraction(A, B, 7, 9);
    return dg;
}

// Counts snapshot requests so tests can check nothing was touched.
class CountingProvider : public SnapshotProvider {
public:
    explicit CountingProvider(const SnapshotProvider& inner) : inner_(inner) {}

    Graph timeSlice(int64_t t_from, int64_t t_to) const override {
        calls++;
        return inner_.timeSlice(t_from, t_to);
    }

    mutable int calls = 0;

private:
    const SnapshotProvider& inner_;
};

// Returns a fixed answer regardless of the snapshot.
class FixedOracle : public PathOracle {
public:
    explicit FixedOracle(PairDistances pairs) : pairs_(std::move(pairs)) {}

    PairDistances distances(const Graph&, int64_t, int64_t) const override {
        return pairs_;
    }

private:
    PairDistances pairs_;
};

PolicyDistances uniform(int d) {
    PolicyDistances p;
    p.shortest = p.fastest = p.foremost = p.fastest_shortest = p.shortest_fastest = d;
    return p;
}

} // namespace

// ─── Helpers ───────────────────────────────────────────────────

TEST(ConformityTypesTest, AlphaKeys) {
    EXPECT_EQ(alphaKey(1.0), "1");
    EXPECT_EQ(alphaKey(1.2), "1.2");
    EXPECT_EQ(alphaKey(0.1 + 0.2), "0.3");
    EXPECT_EQ(alphaKey(2.5), "2.5");
}

TEST(ConformityTypesTest, ProfilesAreCombinations) {
    auto profiles = buildProfiles({"a", "b", "c"}, 2);
    std::vector<std::string> keys;
    for (const auto& p : profiles) keys.push_back(profileKey(p));
    std::vector<std::string> expected = {"a", "b", "c", "a_b", "a_c", "b_c"};
    EXPECT_EQ(keys, expected);

    EXPECT_EQ(buildProfiles({"a", "b", "c"}, 3).size(), 7u);
    EXPECT_EQ(buildProfiles({"a"}, 1).size(), 1u);
}

TEST(ConformityTypesTest, ValidationErrors) {
    ConformityConfig ok;
    ok.alphas = {1.0};
    ok.labels = {"x"};
    EXPECT_NO_THROW(validateConfig(ok));

    ConformityConfig too_big = ok;
    too_big.profile_size = 2;
    EXPECT_THROW(validateConfig(too_big), InvalidArgument);

    ConformityConfig zero_size = ok;
    zero_size.profile_size = 0;
    EXPECT_THROW(validateConfig(zero_size), InvalidArgument);

    ConformityConfig no_alpha = ok;
    no_alpha.alphas.clear();
    EXPECT_THROW(validateConfig(no_alpha), InvalidArgument);

    ConformityConfig no_label = ok;
    no_label.labels.clear();
    EXPECT_THROW(validateConfig(no_label), InvalidArgument);

    ConformityConfig bad_alpha = ok;
    bad_alpha.alphas = {1.0, -0.5};
    EXPECT_THROW(validateConfig(bad_alpha), InvalidArgument);

    ConformityConfig repeated_alpha = ok;
    repeated_alpha.alphas = {1.0, 2.0, 1.0};
    EXPECT_THROW(validateConfig(repeated_alpha), InvalidArgument);

    // Distinct doubles that print the same key.
    ConformityConfig same_key = ok;
    same_key.alphas = {0.3, 0.1 + 0.2};
    ASSERT_NE(same_key.alphas[0], same_key.alphas[1]);
    EXPECT_THROW(validateConfig(same_key), InvalidArgument);

    ConformityConfig flat_hierarchy = ok;
    flat_hierarchy.hierarchies = {{"x", {{"only", 0}}}};
    EXPECT_THROW(validateConfig(flat_hierarchy), InvalidArgument);
}

// ─── deltaConformity ───────────────────────────────────────────

TEST(DeltaConformityTest, ExampleScenarioFastest) {
    DynamicGraph dg = makeExampleGraph();
    TemporalPathOracle oracle;

    ConformityResult res = deltaConformity(dg, oracle, 1, 5, {1.0}, {"labels"}, 1, {},
                                           PathPolicy::FASTEST);
    ASSERT_EQ(res.size(), 1u);
    ASSERT_TRUE(res.count("1"));
    ASSERT_TRUE(res.at("1").count("labels"));
    const NodeScores& scores = res.at("1").at("labels");
    ASSERT_EQ(scores.size(), 4u);

    EXPECT_NEAR(scores.at(A), 2.0 / 9.0, 1e-12);
    EXPECT_NEAR(scores.at(B), 1.0 / 6.0, 1e-12);
    EXPECT_NEAR(scores.at(C), -7.0 / 12.0, 1e-12);
    EXPECT_NEAR(scores.at(D), 13.0 / 36.0, 1e-12);

    for (const auto& [node, score] : scores) {
        EXPECT_GE(score, -1.0) << "node " << node;
        EXPECT_LE(score, 1.0) << "node " << node;
    }
}

TEST(DeltaConformityTest, EveryKeyForEveryNode) {
    DynamicGraph dg;
    dg.addNode(1, {{"opinion", "yes"}, {"age", "young"}});
    dg.addNode(2, {{"opinion", "no"},  {"age", "young"}});
    dg.addNode(3, {{"opinion", "yes"}, {"age", "old"}});
    dg.addInteraction(1, 2, 1);
    dg.addInteraction(2, 3, 2);
    TemporalPathOracle oracle;

    ConformityConfig config;
    config.alphas = {1.0, 1.5};
    config.labels = {"opinion", "age"};
    config.profile_size = 2;

    ConformityResult res = deltaConformity(dg, oracle, 0, 3, config);
    ASSERT_EQ(res.size(), 2u);
    for (const char* alpha : {"1", "1.5"}) {
        ASSERT_TRUE(res.count(alpha));
        const ProfileScores& by_profile = res.at(alpha);
        ASSERT_EQ(by_profile.size(), 3u);
        for (const char* profile : {"opinion", "age", "opinion_age"}) {
            ASSERT_TRUE(by_profile.count(profile)) << profile;
            EXPECT_EQ(by_profile.at(profile).size(), 3u);
        }
    }
}

TEST(DeltaConformityTest, UnreachableNodesScoreZero) {
    Graph snap;
    snap.addNode(1, {{"opinion", "yes"}});
    snap.addNode(2, {{"opinion", "yes"}});
    snap.addNode(3, {{"opinion", "no"}});
    snap.addEdge(1, 2, 0, 1);
    snap.addEdge(2, 3, 0, 1);

    // Only 1 reaches anyone.
    PairDistances pairs = {{{1, 2}, uniform(1)}, {{1, 3}, uniform(3)}};

    ConformityConfig config;
    config.alphas = {0.5, 1.0, 3.0};
    config.labels = {"opinion"};

    ConformityResult res = scoreSnapshot(snap, pairs, config);
    for (const auto& [alpha, by_profile] : res) {
        const NodeScores& scores = by_profile.at("opinion");
        EXPECT_EQ(scores.at(2), 0.0) << "alpha " << alpha;
        EXPECT_EQ(scores.at(3), 0.0) << "alpha " << alpha;
        EXPECT_NE(scores.at(1), 0.0) << "alpha " << alpha;
    }
}

TEST(DeltaConformityTest, InvalidArgumentsFailBeforeGraphAccess) {
    DynamicGraph dg = makeExampleGraph();
    CountingProvider provider(dg);
    TemporalPathOracle oracle;

    EXPECT_THROW(deltaConformity(provider, oracle, 1, 5, {1.0}, {"labels"}, 2),
                 InvalidArgument);
    EXPECT_THROW(deltaConformity(provider, oracle, 1, 5, {}, {"labels"}), InvalidArgument);
    EXPECT_THROW(deltaConformity(provider, oracle, 1, 5, {1.0}, {}), InvalidArgument);
    EXPECT_THROW(deltaConformity(provider, oracle, 1, -1, {1.0}, {"labels"}), InvalidArgument);
    EXPECT_THROW(deltaConformity(provider, oracle, 1, 5, {2.0, 2.0}, {"labels"}), InvalidArgument);
    EXPECT_EQ(provider.calls, 0);

    deltaConformity(provider, oracle, 1, 5, {1.0}, {"labels"});
    EXPECT_EQ(provider.calls, 1);
}

TEST(DeltaConformityTest, OracleDataOutsideSnapshotIsUpstreamError) {
    DynamicGraph dg = makeExampleGraph();
    PairDistances bogus = {{{A, 99}, uniform(1)}};
    FixedOracle oracle(bogus);
    EXPECT_THROW(deltaConformity(dg, oracle, 1, 5, {1.0}, {"labels"}), UpstreamDataError);
}

TEST(DeltaConformityTest, WorkerErrorsReachCaller) {
    DynamicGraph dg = makeExampleGraph();
    TemporalPathOracle oracle;

    ConformityConfig config;
    config.alphas = {1.0};
    config.labels = {"missing"};
    config.num_threads = 4;
    EXPECT_THROW(deltaConformity(dg, oracle, 1, 5, config), UpstreamDataError);
}

TEST(DeltaConformityTest, ThreadCountDoesNotChangeScores) {
    DynamicGraph dg;
    for (NodeId n = 1; n <= 12; ++n) {
        dg.addNode(n, {{"opinion", (n % 3 == 0) ? "no" : "yes"}});
    }
    for (NodeId n = 1; n < 12; ++n) {
        dg.addInteraction(n, n + 1, static_cast<int64_t>(n), static_cast<int64_t>(n) + 3);
        NodeId chord = ((n * 5) % 12) + 1;
        if (chord != n) dg.addInteraction(n, chord, static_cast<int64_t>(n % 4));
    }
    TemporalPathOracle oracle;

    ConformityConfig single;
    single.alphas = {1.0, 2.0};
    single.labels = {"opinion"};
    single.num_threads = 1;
    ConformityConfig multi = single;
    multi.num_threads = 4;

    ConformityResult a = deltaConformity(dg, oracle, 0, 8, single);
    ConformityResult b = deltaConformity(dg, oracle, 0, 8, multi);
    ASSERT_EQ(a.size(), b.size());
    for (const auto& [alpha, by_profile] : a) {
        for (const auto& [profile, scores] : by_profile) {
            const NodeScores& other = b.at(alpha).at(profile);
            ASSERT_EQ(scores.size(), other.size());
            for (const auto& [node, score] : scores) {
                EXPECT_DOUBLE_EQ(score, other.at(node));
            }
        }
    }
}

TEST(DeltaConformityTest, HierarchySoftensDisagreement) {
    DynamicGraph dg;
    dg.addNode(1, {{"level", "low"}});
    dg.addNode(2, {{"level", "mid"}});
    dg.addInteraction(1, 2, 1);
    TemporalPathOracle oracle;

    Hierarchies h = {{"level", {{"low", 0}, {"mid", 1}, {"high", 2}}}};
    ConformityResult flat = deltaConformity(dg, oracle, 0, 2, {1.0}, {"level"});
    ConformityResult graded = deltaConformity(dg, oracle, 0, 2, {1.0}, {"level"}, 1, h);

    // 1 sees 2 at distance 1, f(2) = 1 (no like-minded neighbour).
    EXPECT_DOUBLE_EQ(flat.at("1").at("level").at(1), -1.0);
    EXPECT_DOUBLE_EQ(graded.at("1").at("level").at(1), -0.5);
}
