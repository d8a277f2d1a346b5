#ifndef COMPETIX_COMMUNITY_DETECTOR_HPP
#define COMPETIX_COMMUNITY_DETECTOR_HPP

#include "config.hpp"
#include "icommunity_algorithm.hpp"
#include "similarity_graph.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace competix {

struct Cluster {
    int32_t id = 0;
    std::vector<uint32_t> members;   // graph nodes, ascending
};

/**
 * Final partition. Cluster ids are dense and ordered by descending size,
 * ties broken by the smallest member identifier, so output is byte-stable.
 * labels[i] is the cluster of graph node i; clusters[c].id == c.
 */
struct ClusterAssignment {
    std::vector<int32_t> labels;
    std::vector<Cluster> clusters;
    double modularity = 0.0;
    uint32_t iterations = 0;
    std::string algorithm;

    size_t num_clusters() const { return clusters.size(); }
};

// Checks the raw partition covers every node and relabels it canonically.
// Throws ClusteringError on an invalid partition.
ClusterAssignment canonicalize(const SimilarityGraph& g, const Partition& p);

class CommunityDetector {
public:
    // Uses LeidenAlgorithm when algo is null.
    CommunityDetector(ClusteringConfig cfg, uint64_t seed,
                      std::unique_ptr<ICommunityAlgorithm> algo = nullptr);

    ClusterAssignment detect(const SimilarityGraph& g) const;

private:
    ClusteringConfig cfg_;
    std::unique_ptr<ICommunityAlgorithm> algo_;
};

}  // namespace competix

#endif  // COMPETIX_COMMUNITY_DETECTOR_HPP
