#ifndef COMPETIX_LEIDEN_HPP
#define COMPETIX_LEIDEN_HPP

#include "config.hpp"
#include "icommunity_algorithm.hpp"

#include <cstdint>
#include <string>

namespace competix {

/**
 * Leiden modularity optimisation backed by igraph.
 *
 * Node weights are the vertex strengths and the resolution is scaled by
 * 1/2m, which turns igraph's objective into weighted modularity with a
 * resolution parameter. Passes repeat from the previous partition until
 * quality stops improving or cfg.max_iterations is reached. igraph's
 * default RNG is seeded before every run, so output is a function of the
 * graph, the config and the seed. Leiden communities are connected.
 */
class LeidenAlgorithm : public ICommunityAlgorithm {
public:
    LeidenAlgorithm(ClusteringConfig cfg, uint64_t seed);

    Partition run(const SimilarityGraph& g) const override;
    std::string name() const override { return "igraph-leiden"; }

private:
    ClusteringConfig cfg_;
    uint64_t seed_;
};

}  // namespace competix

#endif  // COMPETIX_LEIDEN_HPP
