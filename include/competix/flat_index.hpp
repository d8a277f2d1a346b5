#ifndef COMPETIX_FLAT_INDEX_HPP
#define COMPETIX_FLAT_INDEX_HPP

#include "ineighbor_index.hpp"

#include <memory>

namespace faiss {
struct IndexFlatIP;
}

namespace competix {

/**
 * Exact search backed by faiss::IndexFlatIP.
 * Results are identical across runs; faiss parallelises the scan internally.
 */
class FlatIndex : public INeighborIndex {
public:
    FlatIndex();
    ~FlatIndex() override;

    void build(const float* data, size_t n, size_t dim) override;
    void search(const float* queries, size_t nq, size_t k,
                int64_t* labels, float* sims) const override;
    size_t size() const override;
    std::string name() const override { return "faiss-flat-ip"; }

private:
    std::unique_ptr<faiss::IndexFlatIP> index_;
};

}  // namespace competix

#endif  // COMPETIX_FLAT_INDEX_HPP
