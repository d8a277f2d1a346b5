#include <gtest/gtest.h>
#include "competix/community_detector.hpp"
#include "competix/errors.hpp"
#include "competix/leiden.hpp"
#include "competix/similarity_graph.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace competix;

namespace {

std::vector<std::string> make_ids(size_t n) {
    std::vector<std::string> ids;
    for (size_t i = 0; i < n; ++i) ids.push_back("n" + std::to_string(100 + i));
    return ids;
}

// Cliques of the given sizes with weight w_in, joined in a chain by one
// weak edge of weight w_out between consecutive cliques.
SimilarityGraph clique_chain(const std::vector<size_t>& sizes, float w_in, float w_out) {
    std::vector<ScoredPair> pairs;
    size_t base = 0;
    size_t prev_last = SIZE_MAX;
    for (size_t s : sizes) {
        for (size_t a = 0; a < s; ++a)
            for (size_t b = a + 1; b < s; ++b)
                pairs.push_back({static_cast<uint32_t>(base + a), static_cast<uint32_t>(base + b),
                                 w_in, 0.0f, w_in});
        if (prev_last != SIZE_MAX && w_out > 0.0f)
            pairs.push_back({static_cast<uint32_t>(prev_last), static_cast<uint32_t>(base),
                             w_out, 0.0f, w_out});
        prev_last = base + s - 1;
        base += s;
    }
    std::sort(pairs.begin(), pairs.end(), [](const ScoredPair& x, const ScoredPair& y) {
        return x.u != y.u ? x.u < y.u : x.v < y.v;
    });
    return assemble_graph(make_ids(base), pairs, 0.0);
}

// Q = sum_c [ in_c / 2m - resolution * (tot_c / 2m)^2 ]
double modularity_of(const SimilarityGraph& g, const std::vector<int32_t>& labels,
                     double resolution) {
    double m2 = 0.0;
    for (float w : g.weights) m2 += w;
    int32_t max_label = *std::max_element(labels.begin(), labels.end());
    std::vector<double> in(static_cast<size_t>(max_label + 1), 0.0);
    std::vector<double> tot(in.size(), 0.0);
    for (size_t i = 0; i < g.num_nodes(); ++i) {
        for (size_t e = g.row_ptr[i]; e < g.row_ptr[i + 1]; ++e) {
            tot[labels[i]] += g.weights[e];
            if (labels[g.cols[e]] == labels[i]) in[labels[i]] += g.weights[e];
        }
    }
    double q = 0.0;
    for (size_t c = 0; c < in.size(); ++c) {
        double t = tot[c] / m2;
        q += in[c] / m2 - resolution * t * t;
    }
    return q;
}

class FixedPartition : public ICommunityAlgorithm {
public:
    explicit FixedPartition(std::vector<int32_t> m) : m_(std::move(m)) {}
    Partition run(const SimilarityGraph&) const override {
        Partition p;
        p.membership = m_;
        return p;
    }
    std::string name() const override { return "fixed"; }

private:
    std::vector<int32_t> m_;
};

class FailingAlgorithm : public ICommunityAlgorithm {
public:
    Partition run(const SimilarityGraph&) const override {
        throw std::runtime_error("did not converge");
    }
    std::string name() const override { return "failing"; }
};

}  // namespace

TEST(CommunityDetector, SeparatesCliques) {
    auto g = clique_chain({6, 5, 4}, 0.9f, 0.1f);
    CommunityDetector det(ClusteringConfig{}, 42);
    auto a = det.detect(g);

    ASSERT_EQ(a.num_clusters(), 3u);
    EXPECT_EQ(a.algorithm, "igraph-leiden");
    EXPECT_EQ(a.clusters[0].members.size(), 6u);
    EXPECT_EQ(a.clusters[1].members.size(), 5u);
    EXPECT_EQ(a.clusters[2].members.size(), 4u);
    for (uint32_t i = 0; i < 6; ++i) EXPECT_EQ(a.labels[i], 0);
    for (uint32_t i = 6; i < 11; ++i) EXPECT_EQ(a.labels[i], 1);
    for (uint32_t i = 11; i < 15; ++i) EXPECT_EQ(a.labels[i], 2);
    EXPECT_GT(a.modularity, 0.5);
    // float weights summed in double on both sides
    EXPECT_NEAR(a.modularity, modularity_of(g, a.labels, 1.0), 1e-6);
    EXPECT_GE(a.iterations, 1u);
}

TEST(CommunityDetector, NoEdgesGivesSingletons) {
    auto g = assemble_graph(make_ids(7), {}, 0.5);
    CommunityDetector det(ClusteringConfig{}, 1);
    auto a = det.detect(g);
    ASSERT_EQ(a.num_clusters(), 7u);
    // All size 1, so ids follow the identifier order.
    for (size_t c = 0; c < 7; ++c) {
        ASSERT_EQ(a.clusters[c].members.size(), 1u);
        EXPECT_EQ(a.clusters[c].members[0], c);
        EXPECT_EQ(a.clusters[c].id, static_cast<int32_t>(c));
    }
    EXPECT_DOUBLE_EQ(a.modularity, 0.0);
}

TEST(CommunityDetector, PartitionIsComplete) {
    std::mt19937 rng(5);
    std::uniform_real_distribution<float> w(0.3f, 1.0f);
    std::vector<ScoredPair> pairs;
    const uint32_t n = 200;
    for (uint32_t u = 0; u < n; ++u)
        for (uint32_t v = u + 1; v < n; ++v)
            if ((u * 7 + v * 13) % 17 == 0) {
                float s = w(rng);
                pairs.push_back({u, v, s, 0.0f, s});
            }
    auto g = assemble_graph(make_ids(n), pairs, 0.0);
    CommunityDetector det(ClusteringConfig{}, 9);
    auto a = det.detect(g);

    ASSERT_EQ(a.labels.size(), n);
    std::vector<int> seen(n, 0);
    for (const auto& c : a.clusters) {
        EXPECT_TRUE(std::is_sorted(c.members.begin(), c.members.end()));
        for (uint32_t m : c.members) {
            seen[m]++;
            EXPECT_EQ(a.labels[m], c.id);
        }
    }
    for (uint32_t i = 0; i < n; ++i) EXPECT_EQ(seen[i], 1) << i;
    for (size_t c = 1; c < a.num_clusters(); ++c)
        EXPECT_GE(a.clusters[c - 1].members.size(), a.clusters[c].members.size());
}

TEST(CommunityDetector, DeterministicForSeed) {
    auto g = clique_chain({8, 8, 8, 8, 3, 3}, 0.7f, 0.4f);
    CommunityDetector a(ClusteringConfig{}, 123), b(ClusteringConfig{}, 123);
    auto ra = a.detect(g);
    auto rb = b.detect(g);
    EXPECT_EQ(ra.labels, rb.labels);
    EXPECT_DOUBLE_EQ(ra.modularity, rb.modularity);
}

TEST(CommunityDetector, DisconnectedComponentsNeverShareACluster) {
    // Two components; the fixed algorithm lumps them together.
    std::vector<ScoredPair> pairs = {
        {0, 1, 0.9f, 0.0f, 0.9f},
        {2, 3, 0.9f, 0.0f, 0.9f},
    };
    auto g = assemble_graph(make_ids(4), pairs, 0.0);
    ClusteringConfig cfg;
    auto lumped = CommunityDetector(cfg, 1, std::make_unique<FixedPartition>(
                                                std::vector<int32_t>{0, 0, 0, 0}))
                      .detect(g);
    EXPECT_EQ(lumped.num_clusters(), 1u);

    auto leiden = CommunityDetector(cfg, 1).detect(g);
    EXPECT_EQ(leiden.num_clusters(), 2u);
    EXPECT_EQ(leiden.labels[0], leiden.labels[1]);
    EXPECT_NE(leiden.labels[1], leiden.labels[2]);
}

TEST(CommunityDetector, CanonicalOrderingBreaksTiesByIdentifier) {
    std::vector<ScoredPair> pairs = {
        {0, 3, 0.9f, 0.0f, 0.9f},
        {1, 2, 0.9f, 0.0f, 0.9f},
    };
    auto g = assemble_graph({"zeta", "beta", "gamma", "alpha"}, pairs, 0.0);
    Partition p;
    p.membership = {5, 2, 2, 5};
    auto a = canonicalize(g, p);
    // {zeta, alpha} holds "alpha", the smallest identifier.
    EXPECT_EQ(a.labels, (std::vector<int32_t>{0, 1, 1, 0}));
    EXPECT_EQ(a.clusters[0].members, (std::vector<uint32_t>{0, 3}));
}

TEST(CommunityDetector, InvalidPartitionIsClusteringError) {
    auto g = assemble_graph(make_ids(3), {}, 0.0);
    ClusteringConfig cfg;
    EXPECT_THROW(CommunityDetector(cfg, 1, std::make_unique<FixedPartition>(
                                               std::vector<int32_t>{0, 1}))
                     .detect(g),
                 ClusteringError);
    EXPECT_THROW(CommunityDetector(cfg, 1, std::make_unique<FixedPartition>(
                                               std::vector<int32_t>{0, -1, 1}))
                     .detect(g),
                 ClusteringError);
    EXPECT_THROW(CommunityDetector(cfg, 1, std::make_unique<FailingAlgorithm>()).detect(g),
                 ClusteringError);
}

TEST(CommunityDetector, HigherResolutionGivesMoreClusters) {
    auto g = clique_chain({4, 4, 4, 4, 4, 4}, 0.8f, 0.6f);
    ClusteringConfig coarse, fine;
    coarse.resolution = 0.1;
    fine.resolution = 2.0;
    auto a = CommunityDetector(coarse, 3).detect(g);
    auto b = CommunityDetector(fine, 3).detect(g);
    EXPECT_LE(a.num_clusters(), b.num_clusters());

    ClusteringConfig bad;
    bad.resolution = 0.0;
    EXPECT_THROW(CommunityDetector(bad, 1), std::invalid_argument);
}

TEST(LeidenAlgorithm, SeedIsTheOnlySourceOfVariation) {
    auto g = clique_chain({5, 5, 5, 5, 5, 5, 5, 5}, 0.6f, 0.5f);
    LeidenAlgorithm first(ClusteringConfig{}, 77);
    auto a = first.run(g);
    // Another run in between must not disturb the next result.
    LeidenAlgorithm(ClusteringConfig{}, 78).run(g);
    auto b = first.run(g);
    EXPECT_EQ(a.membership, b.membership);
    EXPECT_DOUBLE_EQ(a.modularity, b.modularity);
    EXPECT_EQ(a.iterations, b.iterations);
}

TEST(LeidenAlgorithm, RejectsBadWeightsAndConfig) {
    std::vector<ScoredPair> pairs = {{0, 1, -0.5f, 0.0f, -0.5f}};
    auto g = assemble_graph(make_ids(2), pairs, -1.0);
    EXPECT_THROW(LeidenAlgorithm(ClusteringConfig{}, 1).run(g), std::invalid_argument);
    // The detector reports it as a clustering failure.
    EXPECT_THROW(CommunityDetector(ClusteringConfig{}, 1).detect(g), ClusteringError);

    ClusteringConfig bad;
    bad.beta = 0.0;
    EXPECT_THROW(LeidenAlgorithm(bad, 1), std::invalid_argument);
    bad = ClusteringConfig{};
    bad.max_iterations = 0;
    EXPECT_THROW(LeidenAlgorithm(bad, 1), std::invalid_argument);
}
