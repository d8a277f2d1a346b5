#ifndef COMPETIX_SIMILARITY_GRAPH_HPP
#define COMPETIX_SIMILARITY_GRAPH_HPP

#include "company.hpp"
#include "config.hpp"
#include "embedding_fuser.hpp"
#include "ineighbor_index.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace competix {

// Candidate pair from the k-NN step, u < v (embedding rows).
struct ScoredPair {
    uint32_t u;
    uint32_t v;
    float text;       // clamped cosine, [0, 1]
    float category;   // Jaccard of tag sets, [0, 1]
    float score;      // text_weight * text + category_weight * category
};

/**
 * Undirected weighted graph in symmetric CSR form. Node i is embedding row i.
 * Every edge (u, v) is stored in both rows with the same weight; columns are
 * ascending within a row and there are no self-loops.
 */
struct SimilarityGraph {
    std::vector<std::string> ids;
    std::vector<size_t>   row_ptr{0};   // num_nodes() + 1
    std::vector<uint32_t> cols;
    std::vector<float>    weights;

    // Resolution metadata for reproducibility.
    TauMode     tau_mode = TauMode::Fixed;
    double      tau = 0.0;              // numeric threshold actually applied
    double      tau_percentile = 0.0;   // meaningful when tau_mode == Percentile
    size_t      k = 0;
    size_t      candidate_pairs = 0;
    std::string index_name;

    size_t num_nodes() const { return row_ptr.size() - 1; }
    size_t num_edges() const { return cols.size() / 2; }
    size_t degree(size_t u) const { return row_ptr[u + 1] - row_ptr[u]; }

    // 0 when the edge is absent.
    float weight(uint32_t u, uint32_t v) const;

    // Edge count over possible edges; 0 for fewer than two nodes.
    double density() const;
};

// |a ∩ b| / |a ∪ b| for sorted unique tag sets; 0 when both are empty.
double jaccard(const std::vector<std::string>& a,
               const std::vector<std::string>& b);

// Linear-interpolated percentile of scores (numpy's default method).
double percentile(std::vector<float> scores, double pct);

// Threshold pairs (sorted by (u, v), unique) at tau into a symmetric graph.
SimilarityGraph assemble_graph(std::vector<std::string> ids,
                               const std::vector<ScoredPair>& pairs,
                               double tau);

// Creates the k-NN index for one build from the graph config and index seed.
using NeighborIndexFactory =
    std::function<std::unique_ptr<INeighborIndex>(const GraphConfig&, uint64_t)>;

/**
 * Builds the competitor graph: k-NN candidates from an INeighborIndex over
 * the fused embeddings, each unordered pair scored once, then kept when its
 * combined score reaches tau (fixed, or a percentile of candidate scores).
 * A pair found from either endpoint's query yields one undirected edge.
 * Index failures surface as IndexBuildError and no graph is produced.
 */
class SimilarityGraphBuilder {
public:
    SimilarityGraphBuilder(GraphConfig cfg, uint64_t seed,
                           NeighborIndexFactory make_index = make_neighbor_index);

    SimilarityGraph build(const FusedEmbeddings& emb,
                          const std::vector<Company>& companies) const;

    // Deduplicated, scored candidate pairs sorted by (u, v).
    std::vector<ScoredPair> candidate_pairs(
        const FusedEmbeddings& emb,
        const std::vector<Company>& companies,
        std::string* index_name = nullptr) const;

    double resolve_tau(const std::vector<ScoredPair>& pairs) const;

private:
    GraphConfig cfg_;
    uint64_t seed_;
    NeighborIndexFactory make_index_;
};

}  // namespace competix

#endif  // COMPETIX_SIMILARITY_GRAPH_HPP
