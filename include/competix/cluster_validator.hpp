#ifndef COMPETIX_CLUSTER_VALIDATOR_HPP
#define COMPETIX_CLUSTER_VALIDATOR_HPP

#include "community_detector.hpp"
#include "company.hpp"
#include "config.hpp"
#include "embedding_fuser.hpp"
#include "similarity_graph.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace competix {

struct SizeSummary {
    size_t num_clusters = 0;
    size_t min = 0;
    size_t max = 0;
    double median = 0.0;
    double mean = 0.0;
    double stddev = 0.0;
    size_t singletons = 0;
};

struct ClusterDensity {
    int32_t cluster_id = 0;
    size_t size = 0;
    size_t internal_edges = 0;
    std::optional<double> density;   // undefined for singletons
};

struct ReviewMember {
    std::string id;
    std::string customers;
    std::string product;
    std::vector<std::string> tags;
};

struct ReviewSample {
    int32_t cluster_id = 0;
    size_t cluster_size = 0;
    std::vector<ReviewMember> members;
};

struct ValidationReport {
    std::optional<double> silhouette;    // undefined for degenerate partitions
    std::string silhouette_note;         // why it is undefined, if it is
    size_t silhouette_rows = 0;          // rows the mean was taken over
    double graph_density = 0.0;
    std::optional<double> intra_density; // all intra edges / all possible intra edges
    std::vector<ClusterDensity> per_cluster;
    SizeSummary sizes;
    double modularity = 0.0;
    std::vector<ReviewSample> samples;
};

// Sizes of clusters ordered by id.
SizeSummary summarize_sizes(const std::vector<size_t>& sizes);

// Euclidean silhouette over unit vectors, evaluated for sample_rows (all rows
// when empty) against every row. Undefined with fewer than two clusters or
// when any cluster has fewer than two members; note explains why.
std::optional<double> silhouette_score(const float* data, size_t n, size_t dim,
                                       const std::vector<int32_t>& labels,
                                       size_t num_clusters,
                                       const std::vector<size_t>& sample_rows,
                                       std::string* note = nullptr);

/**
 * Computes clustering diagnostics and draws a seeded sample of clusters with
 * full member detail for manual review.
 */
class ClusterValidator {
public:
    ClusterValidator(ValidationConfig cfg, uint64_t seed);

    ValidationReport validate(const FusedEmbeddings& emb,
                              const SimilarityGraph& g,
                              const ClusterAssignment& assignment,
                              const std::vector<Company>& companies) const;

    std::vector<ReviewSample> draw_samples(const FusedEmbeddings& emb,
                                           const ClusterAssignment& assignment,
                                           const std::vector<Company>& companies) const;

private:
    std::vector<size_t> silhouette_rows(size_t n) const;

    ValidationConfig cfg_;
    uint64_t seed_;
};

}  // namespace competix

#endif  // COMPETIX_CLUSTER_VALIDATOR_HPP
