#include "competix/leiden.hpp"
#include "competix/errors.hpp"
#include "competix/log.hpp"

#include <igraph/igraph.h>

#include <limits>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace competix {

namespace {

void igraph_check(igraph_error_t rc, const char* where) {
    if (rc != IGRAPH_SUCCESS) {
        throw ClusteringError(std::string("igraph error at ") + where + ": " +
                              igraph_strerror(rc));
    }
}

// igraph aborts the process on error unless another handler is installed.
void install_error_handler() {
    static std::once_flag once;
    std::call_once(once, [] { igraph_set_error_handler(igraph_error_handler_ignore); });
}

class RealVector {
public:
    explicit RealVector(igraph_integer_t n) {
        igraph_check(igraph_vector_init(&v_, n), "igraph_vector_init");
    }
    ~RealVector() { igraph_vector_destroy(&v_); }
    RealVector(const RealVector&) = delete;
    RealVector& operator=(const RealVector&) = delete;

    igraph_vector_t* get() { return &v_; }
    igraph_real_t& operator[](igraph_integer_t i) { return VECTOR(v_)[i]; }

private:
    igraph_vector_t v_;
};

class IntVector {
public:
    explicit IntVector(igraph_integer_t n) {
        igraph_check(igraph_vector_int_init(&v_, n), "igraph_vector_int_init");
    }
    ~IntVector() { igraph_vector_int_destroy(&v_); }
    IntVector(const IntVector&) = delete;
    IntVector& operator=(const IntVector&) = delete;

    igraph_vector_int_t* get() { return &v_; }
    igraph_integer_t& operator[](igraph_integer_t i) { return VECTOR(v_)[i]; }

private:
    igraph_vector_int_t v_;
};

class Graph {
public:
    Graph(IntVector& edges, igraph_integer_t n) {
        igraph_check(igraph_create(&g_, edges.get(), n, IGRAPH_UNDIRECTED), "igraph_create");
    }
    ~Graph() { igraph_destroy(&g_); }
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    igraph_t* get() { return &g_; }

private:
    igraph_t g_;
};

}  // namespace

LeidenAlgorithm::LeidenAlgorithm(ClusteringConfig cfg, uint64_t seed)
    : cfg_(cfg), seed_(seed) {
    cfg_.validate();
    install_error_handler();
}

Partition LeidenAlgorithm::run(const SimilarityGraph& g) const {
    const size_t n = g.num_nodes();
    Partition p;
    p.membership.resize(n);
    std::iota(p.membership.begin(), p.membership.end(), 0);
    if (n == 0) return p;

    // The CSR holds both directions; igraph takes each edge once.
    size_t m = 0;
    double m2 = 0.0;
    for (size_t u = 0; u < n; ++u) {
        for (size_t e = g.row_ptr[u]; e < g.row_ptr[u + 1]; ++e) {
            float w = g.weights[e];
            if (!(w >= 0.0f))
                throw std::invalid_argument("LeidenAlgorithm: negative or NaN edge weight");
            m2 += w;
            if (g.cols[e] > u) ++m;
        }
    }
    if (m2 <= 0.0) {
        CX_DEBUG("leiden", "graph has no edges; %zu singletons", n);
        return p;
    }

    const auto nv = static_cast<igraph_integer_t>(n);
    const auto ne = static_cast<igraph_integer_t>(m);
    IntVector edges(2 * ne);
    RealVector weights(ne);
    RealVector strength(nv);
    igraph_integer_t k = 0;
    for (size_t u = 0; u < n; ++u) {
        double s = 0.0;
        for (size_t e = g.row_ptr[u]; e < g.row_ptr[u + 1]; ++e) {
            s += g.weights[e];
            uint32_t v = g.cols[e];
            if (v <= u) continue;
            edges[2 * k] = static_cast<igraph_integer_t>(u);
            edges[2 * k + 1] = static_cast<igraph_integer_t>(v);
            weights[k] = g.weights[e];
            ++k;
        }
        strength[static_cast<igraph_integer_t>(u)] = s;
    }

    Graph graph(edges, nv);
    IntVector membership(nv);
    igraph_check(igraph_rng_seed(igraph_rng_default(), static_cast<igraph_uint_t>(seed_)),
                 "igraph_rng_seed");

    const igraph_real_t scaled_resolution = cfg_.resolution / m2;
    igraph_real_t best = -std::numeric_limits<igraph_real_t>::infinity();
    for (uint32_t it = 0; it < cfg_.max_iterations; ++it) {
        igraph_integer_t nb_clusters = 0;
        igraph_real_t quality = 0.0;
        igraph_check(igraph_community_leiden(graph.get(), weights.get(), strength.get(),
                                             scaled_resolution, cfg_.beta,
                                             /*start=*/it > 0, /*n_iterations=*/1,
                                             membership.get(), &nb_clusters, &quality),
                     "igraph_community_leiden");
        p.iterations = it + 1;
        CX_DEBUG("leiden", "iteration %u: %lld communities, quality=%.6f", it,
                 static_cast<long long>(nb_clusters), quality);
        if (quality - best <= 1e-12) break;
        best = quality;
    }

    for (size_t i = 0; i < n; ++i)
        p.membership[i] = static_cast<int32_t>(membership[static_cast<igraph_integer_t>(i)]);

    igraph_real_t q = 0.0;
    igraph_check(igraph_modularity(graph.get(), membership.get(), weights.get(),
                                   cfg_.resolution, /*directed=*/false, &q),
                 "igraph_modularity");
    p.modularity = q;
    return p;
}

}  // namespace competix
