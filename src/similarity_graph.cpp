#include "competix/similarity_graph.hpp"
#include "competix/errors.hpp"
#include "competix/ineighbor_index.hpp"
#include "competix/log.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace competix {

namespace {

constexpr size_t kQueryChunk = 16384;
constexpr double kUnitSlack = 1e-6;

inline double dot(const float* a, const float* b, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j) s += static_cast<double>(a[j]) * b[j];
    return s;
}

inline bool pair_less(const ScoredPair& a, const ScoredPair& b) {
    return a.u != b.u ? a.u < b.u : a.v < b.v;
}

}  // namespace

float SimilarityGraph::weight(uint32_t u, uint32_t v) const {
    auto first = cols.begin() + static_cast<std::ptrdiff_t>(row_ptr[u]);
    auto last = cols.begin() + static_cast<std::ptrdiff_t>(row_ptr[u + 1]);
    auto it = std::lower_bound(first, last, v);
    if (it == last || *it != v) return 0.0f;
    return weights[static_cast<size_t>(it - cols.begin())];
}

double SimilarityGraph::density() const {
    size_t n = num_nodes();
    if (n < 2) return 0.0;
    double possible = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
    return static_cast<double>(num_edges()) / possible;
}

double jaccard(const std::vector<std::string>& a,
               const std::vector<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;
    size_t i = 0, j = 0, inter = 0;
    while (i < a.size() && j < b.size()) {
        int c = a[i].compare(b[j]);
        if (c == 0) { ++inter; ++i; ++j; }
        else if (c < 0) ++i;
        else ++j;
    }
    size_t uni = a.size() + b.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

double percentile(std::vector<float> scores, double pct) {
    if (scores.empty())
        throw std::invalid_argument("percentile: empty score set");
    std::sort(scores.begin(), scores.end());
    double pos = (pct / 100.0) * static_cast<double>(scores.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = static_cast<size_t>(std::ceil(pos));
    double frac = pos - static_cast<double>(lo);
    return scores[lo] + (static_cast<double>(scores[hi]) - scores[lo]) * frac;
}

SimilarityGraph assemble_graph(std::vector<std::string> ids,
                               const std::vector<ScoredPair>& pairs,
                               double tau) {
    SimilarityGraph g;
    const size_t n = ids.size();
    g.ids = std::move(ids);
    g.tau = tau;
    g.candidate_pairs = pairs.size();
    g.row_ptr.assign(n + 1, 0);

    for (const auto& p : pairs) {
        if (p.u >= p.v || p.v >= n)
            throw std::invalid_argument("assemble_graph: pairs must satisfy u < v < n");
        if (p.score >= tau) {
            g.row_ptr[p.u + 1]++;
            g.row_ptr[p.v + 1]++;
        }
    }
    for (size_t i = 0; i < n; ++i) g.row_ptr[i + 1] += g.row_ptr[i];

    g.cols.resize(g.row_ptr[n]);
    g.weights.resize(g.row_ptr[n]);
    std::vector<size_t> fill(g.row_ptr.begin(), g.row_ptr.end() - 1);

    // With pairs sorted by (u, v), appending in order leaves every row sorted:
    // a row receives its smaller neighbours (as v) before its larger ones (as u).
    for (const auto& p : pairs) {
        if (p.score < tau) continue;
        size_t a = fill[p.u]++;
        g.cols[a] = p.v;
        g.weights[a] = p.score;
        size_t b = fill[p.v]++;
        g.cols[b] = p.u;
        g.weights[b] = p.score;
    }
    return g;
}

SimilarityGraphBuilder::SimilarityGraphBuilder(GraphConfig cfg, uint64_t seed,
                                               NeighborIndexFactory make_index)
    : cfg_(cfg), seed_(seed), make_index_(std::move(make_index)) {
    cfg_.validate();
    if (!make_index_)
        throw std::invalid_argument("SimilarityGraphBuilder: index factory is empty");
}

std::vector<ScoredPair> SimilarityGraphBuilder::candidate_pairs(
    const FusedEmbeddings& emb,
    const std::vector<Company>& companies,
    std::string* index_name) const {
    const size_t n = emb.size();
    const size_t dim = emb.dim;
    if (emb.data.size() != n * dim)
        throw std::invalid_argument("SimilarityGraphBuilder: embedding buffer size mismatch");
    if (n > static_cast<size_t>(UINT32_MAX))
        throw std::invalid_argument("SimilarityGraphBuilder: too many nodes");
    for (size_t r : emb.rows) {
        if (r >= companies.size())
            throw std::invalid_argument("SimilarityGraphBuilder: embedding row outside company table");
    }
    if (n < 2) return {};

    std::unique_ptr<INeighborIndex> index;
    try {
        index = make_index_(cfg_, seed_);
        if (!index) throw IndexBuildError("index factory returned no index");
        index->build(emb.data.data(), n, dim);
    } catch (const IndexBuildError&) {
        throw;
    } catch (const std::exception& e) {
        throw IndexBuildError(std::string("neighbour index build failed: ") + e.what());
    }
    if (index_name) *index_name = index->name();

    // One extra neighbour because each query normally returns itself.
    // Clamp before adding so a huge k cannot wrap around.
    const size_t keep = std::min(cfg_.k, n - 1);
    const size_t kq = keep + 1;
    std::vector<std::vector<ScoredPair>> per_row(n);
    std::vector<int64_t> labels;
    std::vector<float> sims;

    for (size_t q0 = 0; q0 < n; q0 += kQueryChunk) {
        size_t nq = std::min(kQueryChunk, n - q0);
        labels.assign(nq * kq, -1);
        sims.assign(nq * kq, 0.0f);
        index->search(emb.row(q0), nq, kq, labels.data(), sims.data());

        #pragma omp parallel for schedule(static)
        for (size_t qi = 0; qi < nq; ++qi) {
            const uint32_t i = static_cast<uint32_t>(q0 + qi);
            std::vector<std::pair<float, uint32_t>> nb;
            nb.reserve(kq);
            for (size_t t = 0; t < kq; ++t) {
                int64_t j = labels[qi * kq + t];
                if (j < 0 || static_cast<uint32_t>(j) == i) continue;
                nb.emplace_back(sims[qi * kq + t], static_cast<uint32_t>(j));
            }
            // Ties go to the lower row so the candidate set is reproducible.
            std::sort(nb.begin(), nb.end(), [](const auto& a, const auto& b) {
                return a.first != b.first ? a.first > b.first : a.second < b.second;
            });
            if (nb.size() > keep) nb.resize(keep);

            auto& out = per_row[i];
            out.reserve(nb.size());
            for (const auto& [s, j] : nb)
                out.push_back({std::min(i, j), std::max(i, j), 0.0f, 0.0f, 0.0f});
        }
    }

    std::vector<ScoredPair> pairs;
    for (auto& v : per_row) {
        pairs.insert(pairs.end(), v.begin(), v.end());
        std::vector<ScoredPair>().swap(v);
    }
    std::sort(pairs.begin(), pairs.end(), pair_less);
    pairs.erase(std::unique(pairs.begin(), pairs.end(),
                            [](const ScoredPair& a, const ScoredPair& b) {
                                return a.u == b.u && a.v == b.v;
                            }),
                pairs.end());

    const double wt = cfg_.text_weight;
    const double wc = cfg_.category_weight;
    #pragma omp parallel for schedule(static)
    for (size_t p = 0; p < pairs.size(); ++p) {
        auto& sp = pairs[p];
        double text = std::clamp(dot(emb.row(sp.u), emb.row(sp.v), dim), 0.0, 1.0);
        // Unit-vector rounding: identical directions score exactly 1.
        if (text > 1.0 - kUnitSlack) text = 1.0;
        double cat = jaccard(companies[emb.rows[sp.u]].tags,
                             companies[emb.rows[sp.v]].tags);
        double score = std::clamp(wt * text + wc * cat, 0.0, 1.0);
        sp.text = static_cast<float>(text);
        sp.category = static_cast<float>(cat);
        sp.score = static_cast<float>(score);
    }
    return pairs;
}

double SimilarityGraphBuilder::resolve_tau(const std::vector<ScoredPair>& pairs) const {
    if (cfg_.tau_mode == TauMode::Fixed) return cfg_.tau;
    if (pairs.empty()) {
        CX_WARN("graph", "no candidate pairs for percentile tau; using configured tau=%.4f",
                cfg_.tau);
        return cfg_.tau;
    }
    std::vector<float> scores;
    scores.reserve(pairs.size());
    for (const auto& p : pairs) scores.push_back(p.score);
    return percentile(std::move(scores), cfg_.tau_percentile);
}

SimilarityGraph SimilarityGraphBuilder::build(
    const FusedEmbeddings& emb,
    const std::vector<Company>& companies) const {
    CX_INFO("graph", "building similarity graph for %zu companies (k=%zu, index=%s)",
            emb.size(), cfg_.k, to_string(cfg_.index));

    std::string index_name;
    auto pairs = candidate_pairs(emb, companies, &index_name);
    double tau = resolve_tau(pairs);

    SimilarityGraph g = assemble_graph(emb.ids, pairs, tau);
    g.tau_mode = cfg_.tau_mode;
    g.tau_percentile = cfg_.tau_mode == TauMode::Percentile ? cfg_.tau_percentile : 0.0;
    g.k = cfg_.k;
    g.index_name = index_name;

    CX_INFO("graph", "built graph: %zu candidate pairs, %zu edges, tau=%.4f (%s), density=%.6f",
            pairs.size(), g.num_edges(), tau, to_string(cfg_.tau_mode), g.density());
    return g;
}

}  // namespace competix
