#include "competix/cluster_validator.hpp"
#include "competix/log.hpp"

#include <cblas.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>

namespace competix {

namespace {

constexpr size_t kSilhouetteBlock = 64;   // sample rows per sgemm
constexpr size_t kTopClustersLogged = 5;

void set_note(std::string* note, const char* msg) {
    if (note) *note = msg;
}

}  // namespace

SizeSummary summarize_sizes(const std::vector<size_t>& sizes) {
    SizeSummary s;
    s.num_clusters = sizes.size();
    if (sizes.empty()) return s;

    std::vector<size_t> sorted(sizes);
    std::sort(sorted.begin(), sorted.end());
    s.min = sorted.front();
    s.max = sorted.back();
    size_t mid = sorted.size() / 2;
    s.median = (sorted.size() % 2 == 1)
        ? static_cast<double>(sorted[mid])
        : (static_cast<double>(sorted[mid - 1]) + static_cast<double>(sorted[mid])) / 2.0;

    double sum = 0.0;
    for (size_t v : sorted) {
        sum += static_cast<double>(v);
        if (v == 1) ++s.singletons;
    }
    s.mean = sum / static_cast<double>(sorted.size());
    double var = 0.0;
    for (size_t v : sorted) {
        double d = static_cast<double>(v) - s.mean;
        var += d * d;
    }
    s.stddev = std::sqrt(var / static_cast<double>(sorted.size()));
    return s;
}

std::optional<double> silhouette_score(const float* data, size_t n, size_t dim,
                                       const std::vector<int32_t>& labels,
                                       size_t num_clusters,
                                       const std::vector<size_t>& sample_rows,
                                       std::string* note) {
    if (labels.size() != n)
        throw std::invalid_argument("silhouette_score: labels size mismatch");
    if (num_clusters < 2) {
        set_note(note, "fewer than two clusters");
        return std::nullopt;
    }

    std::vector<size_t> sizes(num_clusters, 0);
    for (int32_t l : labels) {
        if (l < 0 || static_cast<size_t>(l) >= num_clusters)
            throw std::invalid_argument("silhouette_score: label out of range");
        sizes[static_cast<size_t>(l)]++;
    }
    for (size_t s : sizes) {
        if (s < 2) {
            set_note(note, "a cluster has fewer than two members");
            return std::nullopt;
        }
    }

    std::vector<size_t> rows = sample_rows;
    if (rows.empty()) {
        rows.resize(n);
        std::iota(rows.begin(), rows.end(), size_t{0});
    }

    const size_t k = num_clusters;
    std::vector<float> block(kSilhouetteBlock * dim);
    std::vector<float> dots(kSilhouetteBlock * n);
    std::vector<double> row_s(kSilhouetteBlock);
    double total = 0.0;

    for (size_t b0 = 0; b0 < rows.size(); b0 += kSilhouetteBlock) {
        const size_t bn = std::min(kSilhouetteBlock, rows.size() - b0);
        for (size_t r = 0; r < bn; ++r)
            std::copy_n(data + rows[b0 + r] * dim, dim, block.data() + r * dim);

        // dots[r, j] = x_r . x_j; for unit vectors ||x_r - x_j|| = sqrt(2 - 2 dot).
        cblas_sgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                    static_cast<int>(bn), static_cast<int>(n), static_cast<int>(dim),
                    1.0f, block.data(), static_cast<int>(dim),
                    data, static_cast<int>(dim),
                    0.0f, dots.data(), static_cast<int>(n));

        #pragma omp parallel
        {
            std::vector<double> sums(k);
            #pragma omp for schedule(static)
            for (size_t r = 0; r < bn; ++r) {
                const size_t i = rows[b0 + r];
                std::fill(sums.begin(), sums.end(), 0.0);
                const float* drow = dots.data() + r * n;
                for (size_t j = 0; j < n; ++j) {
                    if (j == i) continue;
                    double d2 = 2.0 - 2.0 * static_cast<double>(drow[j]);
                    sums[static_cast<size_t>(labels[j])] += d2 > 0.0 ? std::sqrt(d2) : 0.0;
                }
                const auto own = static_cast<size_t>(labels[i]);
                double a = sums[own] / static_cast<double>(sizes[own] - 1);
                double b = std::numeric_limits<double>::max();
                for (size_t c = 0; c < k; ++c) {
                    if (c == own) continue;
                    b = std::min(b, sums[c] / static_cast<double>(sizes[c]));
                }
                double denom = std::max(a, b);
                row_s[r] = denom > 0.0 ? (b - a) / denom : 0.0;
            }
        }
        // Serial in row order so the sum does not depend on the thread count.
        for (size_t r = 0; r < bn; ++r) total += row_s[r];
    }
    return total / static_cast<double>(rows.size());
}

ClusterValidator::ClusterValidator(ValidationConfig cfg, uint64_t seed)
    : cfg_(cfg), seed_(seed) {
    cfg_.validate();
}

std::vector<size_t> ClusterValidator::silhouette_rows(size_t n) const {
    if (cfg_.silhouette_sample_size == 0 || cfg_.silhouette_sample_size >= n)
        return {};
    std::mt19937_64 rng(derive_seed(seed_, SeedStream::Silhouette));
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), size_t{0});
    // Partial Fisher-Yates: the first m slots are a uniform sample.
    const size_t m = cfg_.silhouette_sample_size;
    for (size_t i = 0; i < m; ++i) {
        std::uniform_int_distribution<size_t> pick(i, n - 1);
        std::swap(idx[i], idx[pick(rng)]);
    }
    idx.resize(m);
    std::sort(idx.begin(), idx.end());
    return idx;
}

std::vector<ReviewSample> ClusterValidator::draw_samples(
    const FusedEmbeddings& emb, const ClusterAssignment& assignment,
    const std::vector<Company>& companies) const {
    std::vector<ReviewSample> samples;
    const size_t k = assignment.num_clusters();
    if (cfg_.sample_clusters == 0 || k == 0) return samples;

    std::mt19937_64 rng(derive_seed(seed_, SeedStream::Sampling));
    std::vector<size_t> chosen(k);
    std::iota(chosen.begin(), chosen.end(), size_t{0});
    const size_t m = std::min(cfg_.sample_clusters, k);
    for (size_t i = 0; i < m; ++i) {
        std::uniform_int_distribution<size_t> pick(i, k - 1);
        std::swap(chosen[i], chosen[pick(rng)]);
    }
    chosen.resize(m);
    std::sort(chosen.begin(), chosen.end());

    samples.reserve(m);
    for (size_t c : chosen) {
        const Cluster& cl = assignment.clusters[c];
        std::vector<uint32_t> members = cl.members;
        const size_t show = std::min(cfg_.members_per_sample, members.size());
        for (size_t i = 0; i < show; ++i) {
            std::uniform_int_distribution<size_t> pick(i, members.size() - 1);
            std::swap(members[i], members[pick(rng)]);
        }
        members.resize(show);
        std::sort(members.begin(), members.end());

        ReviewSample s;
        s.cluster_id = cl.id;
        s.cluster_size = cl.members.size();
        for (uint32_t node : members) {
            const Company& co = companies[emb.rows[node]];
            s.members.push_back({co.id, co.customers, co.product, co.tags});
        }
        samples.push_back(std::move(s));
    }
    return samples;
}

ValidationReport ClusterValidator::validate(
    const FusedEmbeddings& emb, const SimilarityGraph& g,
    const ClusterAssignment& assignment,
    const std::vector<Company>& companies) const {
    const size_t n = emb.size();
    if (g.num_nodes() != n || assignment.labels.size() != n)
        throw std::invalid_argument("ClusterValidator: embeddings, graph and labels disagree in size");

    CX_INFO("validate", "calculating clustering metrics for %zu companies", n);
    ValidationReport rep;
    const size_t k = assignment.num_clusters();

    auto rows = silhouette_rows(n);
    rep.silhouette_rows = rows.empty() ? n : rows.size();
    rep.silhouette = silhouette_score(emb.data.data(), n, emb.dim, assignment.labels,
                                      k, rows, &rep.silhouette_note);
    if (!rep.silhouette) rep.silhouette_rows = 0;

    rep.graph_density = g.density();
    rep.modularity = assignment.modularity;

    std::vector<size_t> internal(k, 0);
    for (size_t u = 0; u < n; ++u) {
        for (size_t e = g.row_ptr[u]; e < g.row_ptr[u + 1]; ++e) {
            uint32_t v = g.cols[e];
            if (v > u && assignment.labels[v] == assignment.labels[u])
                internal[static_cast<size_t>(assignment.labels[u])]++;
        }
    }

    std::vector<size_t> sizes(k);
    double intra_edges = 0.0, intra_possible = 0.0;
    rep.per_cluster.reserve(k);
    for (size_t c = 0; c < k; ++c) {
        const size_t s = assignment.clusters[c].members.size();
        sizes[c] = s;
        ClusterDensity d;
        d.cluster_id = assignment.clusters[c].id;
        d.size = s;
        d.internal_edges = internal[c];
        if (s >= 2) {
            double possible = static_cast<double>(s) * static_cast<double>(s - 1) / 2.0;
            d.density = static_cast<double>(internal[c]) / possible;
            intra_edges += static_cast<double>(internal[c]);
            intra_possible += possible;
        }
        rep.per_cluster.push_back(d);
    }
    if (intra_possible > 0.0) rep.intra_density = intra_edges / intra_possible;
    rep.sizes = summarize_sizes(sizes);
    rep.samples = draw_samples(emb, assignment, companies);

    CX_INFO("validate", "=== CLUSTERING SUMMARY ===");
    CX_INFO("validate", "companies: %zu  clusters: %zu  singletons: %zu",
            n, rep.sizes.num_clusters, rep.sizes.singletons);
    CX_INFO("validate", "cluster size min/median/max: %zu/%.1f/%zu  mean: %.2f",
            rep.sizes.min, rep.sizes.median, rep.sizes.max, rep.sizes.mean);
    if (rep.silhouette)
        CX_INFO("validate", "silhouette: %.4f over %zu rows", *rep.silhouette, rep.silhouette_rows);
    else
        CX_INFO("validate", "silhouette: undefined (%s)", rep.silhouette_note.c_str());
    CX_INFO("validate", "graph density: %.6f  intra-cluster density: %s%.4f",
            rep.graph_density, rep.intra_density ? "" : "n/a ",
            rep.intra_density.value_or(0.0));
    for (size_t c = 0; c < std::min(kTopClustersLogged, k); ++c)
        CX_INFO("validate", "  cluster %zu: %zu companies", c, sizes[c]);
    return rep;
}

}  // namespace competix
