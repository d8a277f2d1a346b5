#include <gtest/gtest.h>
#include "competix/embedding_fuser.hpp"
#include "competix/errors.hpp"
#include "competix/flat_index.hpp"
#include "competix/hashing_embedder.hpp"
#include "competix/hnsw_index.hpp"
#include "competix/similarity_graph.hpp"
#include "competix/text_normalizer.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace competix;
using namespace competix::test_support;

namespace {

FusedEmbeddings random_embeddings(size_t n, size_t dim, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::vector<float>> rows(n, std::vector<float>(dim));
    for (auto& r : rows)
        for (auto& x : r) x = dist(rng);
    return make_embeddings(rows);
}

std::vector<std::vector<std::string>> random_tags(size_t n, unsigned seed) {
    const std::vector<std::string> pool = {"fintech", "payments", "saas", "retail", "logistics"};
    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    std::vector<std::vector<std::string>> tags(n);
    for (auto& t : tags) {
        t = {pool[pick(rng)], pool[pick(rng)]};
        std::sort(t.begin(), t.end());
        t.erase(std::unique(t.begin(), t.end()), t.end());
    }
    return tags;
}

// Every row's only neighbour is the next row, wrapping at the end.
class RingIndex : public INeighborIndex {
public:
    void build(const float*, size_t n, size_t) override { n_ = n; }
    void search(const float*, size_t nq, size_t k, int64_t* labels,
                float* sims) const override {
        // Queries are issued for every row in order.
        for (size_t q = 0; q < nq; ++q) {
            for (size_t j = 0; j < k; ++j) {
                labels[q * k + j] = -1;
                sims[q * k + j] = -1.0f;
            }
            labels[q * k] = static_cast<int64_t>((q + 1) % n_);
            sims[q * k] = 1.0f;
        }
    }
    size_t size() const override { return n_; }
    std::string name() const override { return "ring"; }

private:
    size_t n_ = 0;
};

class ThrowingIndex : public INeighborIndex {
public:
    explicit ThrowingIndex(bool typed) : typed_(typed) {}
    void build(const float*, size_t, size_t) override {
        if (typed_) throw IndexBuildError("out of index memory");
        throw std::runtime_error("device lost");
    }
    void search(const float*, size_t, size_t, int64_t*, float*) const override {
        ADD_FAILURE() << "search after a failed build";
    }
    size_t size() const override { return 0; }
    std::string name() const override { return "throwing"; }

private:
    bool typed_;
};

GraphConfig graph_config(size_t k, double tau) {
    GraphConfig cfg;
    cfg.k = k;
    cfg.tau = tau;
    return cfg;
}

}  // namespace

TEST(Jaccard, Basics) {
    EXPECT_DOUBLE_EQ(jaccard({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(jaccard({"a"}, {}), 0.0);
    EXPECT_DOUBLE_EQ(jaccard({"a", "b"}, {"a", "b"}), 1.0);
    EXPECT_DOUBLE_EQ(jaccard({"a", "b"}, {"b", "c"}), 1.0 / 3.0);
}

TEST(Percentile, LinearInterpolation) {
    std::vector<float> s = {4.0f, 1.0f, 3.0f, 2.0f};
    EXPECT_DOUBLE_EQ(percentile(s, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(s, 100.0), 4.0);
    EXPECT_DOUBLE_EQ(percentile(s, 50.0), 2.5);
    EXPECT_NEAR(percentile(s, 90.0), 3.7, 1e-6);
    EXPECT_DOUBLE_EQ(percentile({0.25f}, 73.0), 0.25);
    EXPECT_THROW(percentile({}, 50.0), std::invalid_argument);
}

TEST(AssembleGraph, SymmetricSortedCsr) {
    std::vector<ScoredPair> pairs = {
        {0, 1, 0.9f, 0.0f, 0.9f},
        {0, 3, 0.2f, 0.0f, 0.2f},
        {1, 2, 0.7f, 0.0f, 0.7f},
        {2, 3, 0.6f, 0.0f, 0.6f},
    };
    auto g = assemble_graph({"a", "b", "c", "d"}, pairs, 0.5);
    EXPECT_EQ(g.num_nodes(), 4u);
    EXPECT_EQ(g.num_edges(), 3u);
    EXPECT_FLOAT_EQ(g.weight(0, 1), 0.9f);
    EXPECT_FLOAT_EQ(g.weight(1, 0), 0.9f);
    EXPECT_FLOAT_EQ(g.weight(0, 3), 0.0f);
    EXPECT_FLOAT_EQ(g.weight(3, 2), 0.6f);
    EXPECT_EQ(g.degree(1), 2u);
    EXPECT_EQ(g.cols[g.row_ptr[1]], 0u);
    EXPECT_EQ(g.cols[g.row_ptr[1] + 1], 2u);
    EXPECT_DOUBLE_EQ(g.density(), 3.0 / 6.0);

    std::vector<ScoredPair> bad = {{2, 1, 0.9f, 0.0f, 0.9f}};
    EXPECT_THROW(assemble_graph({"a", "b", "c"}, bad, 0.5), std::invalid_argument);
}

TEST(SimilarityGraph, SymmetryAndScoreBounds) {
    auto emb = random_embeddings(300, 16, 11);
    auto companies = companies_for(emb, random_tags(300, 12));
    SimilarityGraphBuilder builder(graph_config(10, 0.2), 1);
    auto g = builder.build(emb, companies);

    ASSERT_EQ(g.num_nodes(), 300u);
    EXPECT_GT(g.num_edges(), 0u);
    EXPECT_EQ(g.index_name, "faiss-flat-ip");
    for (uint32_t u = 0; u < g.num_nodes(); ++u) {
        for (size_t e = g.row_ptr[u]; e < g.row_ptr[u + 1]; ++e) {
            uint32_t v = g.cols[e];
            ASSERT_NE(u, v);
            EXPECT_GE(g.weights[e], 0.0f);
            EXPECT_LE(g.weights[e], 1.0f);
            EXPECT_GE(g.weights[e], static_cast<float>(g.tau));
            EXPECT_EQ(g.weight(v, u), g.weights[e]);
            if (e > g.row_ptr[u]) EXPECT_LT(g.cols[e - 1], v);
        }
    }
}

TEST(SimilarityGraph, CandidatesBoundedByK) {
    auto emb = random_embeddings(120, 8, 3);
    auto companies = companies_for(emb);
    SimilarityGraphBuilder builder(graph_config(5, 0.0), 1);
    auto pairs = builder.candidate_pairs(emb, companies);
    // Each row contributes at most k pairs; shared pairs collapse.
    EXPECT_LE(pairs.size(), 120u * 5u);
    EXPECT_GE(pairs.size(), 120u * 5u / 2u);
    for (size_t i = 1; i < pairs.size(); ++i) {
        bool ordered = pairs[i - 1].u < pairs[i].u ||
                       (pairs[i - 1].u == pairs[i].u && pairs[i - 1].v < pairs[i].v);
        ASSERT_TRUE(ordered);
    }
}

TEST(SimilarityGraph, ThresholdMonotonicity) {
    auto emb = random_embeddings(200, 12, 5);
    auto companies = companies_for(emb, random_tags(200, 6));
    size_t prev = SIZE_MAX;
    for (double tau : {0.0, 0.1, 0.2, 0.3, 0.4, 0.5, 0.7, 0.9, 1.0}) {
        SimilarityGraphBuilder builder(graph_config(15, tau), 7);
        auto g = builder.build(emb, companies);
        EXPECT_LE(g.num_edges(), prev) << "tau=" << tau;
        prev = g.num_edges();
    }
}

TEST(SimilarityGraph, IdenticalTextScoresOne) {
    HashingEmbedder model(64);
    TextNormalizer norm;
    std::vector<Company> companies = {
        make_company("alpha", "Small Retailers", "Point-of-Sale Terminals Inc."),
        make_company("beta", "small retailers", "point-of-sale terminals"),
        make_company("gamma", "Hospitals", "Surgical Robots"),
    };
    EmbeddingFuser fuser(EmbeddingConfig{}, model);
    auto emb = fuser.fuse(companies, norm.normalize_all(companies));

    SimilarityGraphBuilder builder(graph_config(2, 0.55), 1);
    auto pairs = builder.candidate_pairs(emb, companies);
    bool found = false;
    for (const auto& p : pairs) {
        if (p.u == 0 && p.v == 1) {
            found = true;
            EXPECT_FLOAT_EQ(p.text, 1.0f);
            EXPECT_FLOAT_EQ(p.category, 0.0f);
            EXPECT_NEAR(p.score, 0.8f, 1e-6);
        }
    }
    EXPECT_TRUE(found);
    auto g = builder.build(emb, companies);
    EXPECT_GT(g.weight(0, 1), 0.0f);
}

TEST(SimilarityGraph, TauAboveMaximumYieldsNoEdges) {
    // Without tags the combined score cannot exceed text_weight (0.8).
    auto emb = random_embeddings(50, 8, 9);
    auto companies = companies_for(emb);
    SimilarityGraphBuilder builder(graph_config(10, 0.85), 1);
    auto g = builder.build(emb, companies);
    EXPECT_EQ(g.num_edges(), 0u);
    EXPECT_GT(g.candidate_pairs, 0u);
    EXPECT_EQ(g.num_nodes(), 50u);
}

TEST(SimilarityGraph, PercentileTauIsRecorded) {
    auto emb = random_embeddings(150, 10, 21);
    auto companies = companies_for(emb, random_tags(150, 22));
    GraphConfig cfg = graph_config(8, 0.55);
    cfg.tau_mode = TauMode::Percentile;
    cfg.tau_percentile = 75.0;
    SimilarityGraphBuilder builder(cfg, 1);

    auto pairs = builder.candidate_pairs(emb, companies);
    std::vector<float> scores;
    for (const auto& p : pairs) scores.push_back(p.score);
    double expected = percentile(scores, 75.0);

    auto g = builder.build(emb, companies);
    EXPECT_EQ(g.tau_mode, TauMode::Percentile);
    EXPECT_DOUBLE_EQ(g.tau_percentile, 75.0);
    EXPECT_DOUBLE_EQ(g.tau, expected);
    // Roughly the top quarter of candidate pairs survive.
    EXPECT_GE(g.num_edges(), pairs.size() / 5);
    EXPECT_LE(g.num_edges(), pairs.size() / 3 + 1);
}

TEST(SimilarityGraph, PercentileWithoutCandidatesFallsBack) {
    auto emb = random_embeddings(1, 4, 1);
    auto companies = companies_for(emb);
    GraphConfig cfg = graph_config(5, 0.4);
    cfg.tau_mode = TauMode::Percentile;
    SimilarityGraphBuilder builder(cfg, 1);
    auto g = builder.build(emb, companies);
    EXPECT_EQ(g.num_nodes(), 1u);
    EXPECT_EQ(g.num_edges(), 0u);
    EXPECT_DOUBLE_EQ(g.tau, 0.4);
}

TEST(SimilarityGraph, DeterministicAcrossRuns) {
    auto emb = random_embeddings(400, 16, 31);
    auto companies = companies_for(emb, random_tags(400, 32));
    for (IndexKind kind : {IndexKind::Flat, IndexKind::Hnsw}) {
        GraphConfig cfg = graph_config(10, 0.3);
        cfg.index = kind;
        SimilarityGraphBuilder a(cfg, 99), b(cfg, 99);
        auto ga = a.build(emb, companies);
        auto gb = b.build(emb, companies);
        EXPECT_EQ(ga.row_ptr, gb.row_ptr) << to_string(kind);
        EXPECT_EQ(ga.cols, gb.cols) << to_string(kind);
        EXPECT_EQ(ga.weights, gb.weights) << to_string(kind);
    }
}

TEST(NeighborIndex, HnswAgreesWithExactSearchOnSmallData) {
    auto emb = random_embeddings(200, 8, 41);
    FlatIndex flat;
    HnswIndex hnsw(16, 200, 200, 7);
    flat.build(emb.data.data(), emb.size(), emb.dim);
    hnsw.build(emb.data.data(), emb.size(), emb.dim);
    EXPECT_EQ(flat.size(), 200u);
    EXPECT_EQ(hnsw.size(), 200u);

    const size_t k = 5;
    std::vector<int64_t> fl(emb.size() * k), hl(emb.size() * k);
    std::vector<float> fs(emb.size() * k), hs(emb.size() * k);
    flat.search(emb.data.data(), emb.size(), k, fl.data(), fs.data());
    hnsw.search(emb.data.data(), emb.size(), k, hl.data(), hs.data());

    size_t agree = 0;
    for (size_t q = 0; q < emb.size(); ++q) {
        EXPECT_EQ(fl[q * k], static_cast<int64_t>(q));
        for (size_t a = 0; a < k; ++a)
            for (size_t b = 0; b < k; ++b)
                if (fl[q * k + a] == hl[q * k + b]) { ++agree; break; }
    }
    double recall = static_cast<double>(agree) / static_cast<double>(emb.size() * k);
    EXPECT_GT(recall, 0.9);
}

TEST(SimilarityGraph, RejectsInvalidConfig) {
    GraphConfig cfg;
    cfg.k = 0;
    EXPECT_THROW(SimilarityGraphBuilder(cfg, 1), std::invalid_argument);
    cfg = GraphConfig{};
    cfg.tau = 1.2;
    EXPECT_THROW(SimilarityGraphBuilder(cfg, 1), std::invalid_argument);
    cfg = GraphConfig{};
    cfg.text_weight = 0.5;
    EXPECT_THROW(SimilarityGraphBuilder(cfg, 1), std::invalid_argument);
}

TEST(SimilarityGraph, HugeKIsClampedToTheTableSize) {
    const size_t n = 12;
    auto emb = random_embeddings(n, 8, 21);
    auto companies = companies_for(emb);
    // k + 1 would wrap to zero.
    SimilarityGraphBuilder builder(graph_config(std::numeric_limits<size_t>::max(), 0.0), 1);
    auto pairs = builder.candidate_pairs(emb, companies);
    EXPECT_EQ(pairs.size(), n * (n - 1) / 2);

    auto g = builder.build(emb, companies);
    for (uint32_t u = 0; u < n; ++u) EXPECT_EQ(g.degree(u), n - 1) << u;
}

TEST(SimilarityGraph, UsesTheSuppliedIndex) {
    const size_t n = 6;
    auto emb = random_embeddings(n, 4, 2);
    auto companies = companies_for(emb);
    size_t calls = 0;
    SimilarityGraphBuilder builder(graph_config(3, 0.0), 9,
                                   [&calls](const GraphConfig& cfg, uint64_t seed) {
                                       ++calls;
                                       EXPECT_EQ(cfg.k, 3u);
                                       EXPECT_EQ(seed, 9u);
                                       return std::make_unique<RingIndex>();
                                   });
    auto g = builder.build(emb, companies);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(g.index_name, "ring");
    ASSERT_EQ(g.num_edges(), n);
    for (uint32_t u = 0; u < n; ++u) {
        EXPECT_EQ(g.degree(u), 2u);
        std::vector<uint32_t> ring = {static_cast<uint32_t>((u + n - 1) % n),
                                      static_cast<uint32_t>((u + 1) % n)};
        std::sort(ring.begin(), ring.end());
        std::vector<uint32_t> cols(g.cols.begin() + static_cast<std::ptrdiff_t>(g.row_ptr[u]),
                                   g.cols.begin() + static_cast<std::ptrdiff_t>(g.row_ptr[u + 1]));
        EXPECT_EQ(cols, ring) << u;
    }
}

TEST(SimilarityGraph, IndexFailureIsIndexBuildError) {
    auto emb = random_embeddings(40, 8, 4);
    auto companies = companies_for(emb);
    for (bool typed : {true, false}) {
        SimilarityGraphBuilder builder(graph_config(5, 0.0), 1,
                                       [typed](const GraphConfig&, uint64_t) {
                                           return std::make_unique<ThrowingIndex>(typed);
                                       });
        SimilarityGraph g;
        EXPECT_THROW(g = builder.build(emb, companies), IndexBuildError) << typed;
        EXPECT_EQ(g.num_nodes(), 0u);
        EXPECT_EQ(g.num_edges(), 0u);
    }

    SimilarityGraphBuilder empty(graph_config(5, 0.0), 1,
                                 [](const GraphConfig&, uint64_t) {
                                     return std::unique_ptr<INeighborIndex>();
                                 });
    EXPECT_THROW(empty.build(emb, companies), IndexBuildError);
    EXPECT_THROW(SimilarityGraphBuilder(GraphConfig{}, 1, nullptr), std::invalid_argument);
}
