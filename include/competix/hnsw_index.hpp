#ifndef COMPETIX_HNSW_INDEX_HPP
#define COMPETIX_HNSW_INDEX_HPP

#include "ineighbor_index.hpp"

#include <cstdint>
#include <memory>

namespace hnswlib {
class InnerProductSpace;
template <typename dist_t> class HierarchicalNSW;
}

namespace competix {

/**
 * Approximate search backed by hnswlib with the inner-product space.
 * Points are inserted sequentially so the graph depends only on the data
 * and the seed; queries run in parallel.
 */
class HnswIndex : public INeighborIndex {
public:
    HnswIndex(size_t m, size_t ef_construction, size_t ef_search, uint64_t seed);
    ~HnswIndex() override;

    void build(const float* data, size_t n, size_t dim) override;
    void search(const float* queries, size_t nq, size_t k,
                int64_t* labels, float* sims) const override;
    size_t size() const override { return n_; }
    std::string name() const override { return "hnswlib-ip"; }

private:
    size_t m_;
    size_t ef_construction_;
    size_t ef_search_;
    uint64_t seed_;
    size_t n_ = 0;
    size_t dim_ = 0;

    std::unique_ptr<hnswlib::InnerProductSpace> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_;
};

}  // namespace competix

#endif  // COMPETIX_HNSW_INDEX_HPP
