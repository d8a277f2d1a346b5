#ifndef COMPETIX_ICOMMUNITY_ALGORITHM_HPP
#define COMPETIX_ICOMMUNITY_ALGORITHM_HPP

#include "similarity_graph.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace competix {

// Raw output of a community algorithm: one label per graph node.
struct Partition {
    std::vector<int32_t> membership;
    double modularity = 0.0;
    uint32_t iterations = 0;
};

/**
 * Weighted-graph-to-partition capability. Implementations must be
 * deterministic for a fixed graph, configuration and seed.
 */
class ICommunityAlgorithm {
public:
    virtual Partition run(const SimilarityGraph& g) const = 0;

    virtual std::string name() const = 0;

    virtual ~ICommunityAlgorithm() = default;
};

}  // namespace competix

#endif  // COMPETIX_ICOMMUNITY_ALGORITHM_HPP
