#ifndef COMPETIX_INEIGHBOR_INDEX_HPP
#define COMPETIX_INEIGHBOR_INDEX_HPP

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace competix {

/**
 * Nearest-neighbour capability over unit vectors, ranked by inner product
 * (cosine). Data is contiguous row-major float32: data[i * dim + j].
 * search() fills nq * k labels and similarities, best first; missing results
 * are padded with label -1. Labels are row indices into the built data.
 */
class INeighborIndex {
public:
    virtual void build(const float* data, size_t n, size_t dim) = 0;

    virtual void search(const float* queries, size_t nq, size_t k,
                        int64_t* labels, float* sims) const = 0;

    virtual size_t size() const = 0;

    virtual std::string name() const = 0;

    virtual ~INeighborIndex() = default;
};

// Backend selected by cfg.index; seed drives HNSW level assignment.
std::unique_ptr<INeighborIndex> make_neighbor_index(const GraphConfig& cfg,
                                                    uint64_t seed);

}  // namespace competix

#endif  // COMPETIX_INEIGHBOR_INDEX_HPP
