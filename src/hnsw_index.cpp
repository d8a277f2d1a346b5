#include "competix/hnsw_index.hpp"
#include "competix/errors.hpp"
#include "competix/log.hpp"

#include <hnswlib/hnswlib.h>

#include <stdexcept>

namespace competix {

HnswIndex::HnswIndex(size_t m, size_t ef_construction, size_t ef_search,
                     uint64_t seed)
    : m_(m), ef_construction_(ef_construction), ef_search_(ef_search),
      seed_(seed) {
    if (m < 2 || ef_construction == 0 || ef_search == 0)
        throw std::invalid_argument("HnswIndex: invalid M or ef parameters");
}

HnswIndex::~HnswIndex() = default;

void HnswIndex::build(const float* data, size_t n, size_t dim) {
    if (data == nullptr || n == 0 || dim == 0)
        throw std::invalid_argument("HnswIndex::build: invalid data or dimensions");

    try {
        space_ = std::make_unique<hnswlib::InnerProductSpace>(dim);
        alg_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space_.get(), n, m_, ef_construction_,
            static_cast<size_t>(seed_));
        // Sequential insertion keeps level assignment and links reproducible.
        for (size_t i = 0; i < n; ++i)
            alg_->addPoint(data + i * dim, static_cast<hnswlib::labeltype>(i));
        alg_->setEf(ef_search_);
    } catch (const std::exception& e) {
        alg_.reset();
        space_.reset();
        n_ = 0;
        throw IndexBuildError(std::string("HnswIndex::build: ") + e.what());
    }

    n_ = n;
    dim_ = dim;
    CX_DEBUG("index", "hnsw index holds %zu vectors (M=%zu, efC=%zu, seed=%llu)",
             n, m_, ef_construction_, static_cast<unsigned long long>(seed_));
}

void HnswIndex::search(const float* queries, size_t nq, size_t k,
                       int64_t* labels, float* sims) const {
    if (!alg_)
        throw std::runtime_error("HnswIndex::search: index not built");
    if (queries == nullptr || labels == nullptr || sims == nullptr)
        throw std::invalid_argument("HnswIndex::search: null buffers");

    #pragma omp parallel for schedule(dynamic, 64)
    for (size_t q = 0; q < nq; ++q) {
        int64_t* lab = labels + q * k;
        float* sim = sims + q * k;
        for (size_t j = 0; j < k; ++j) { lab[j] = -1; sim[j] = -1.0f; }

        auto result = alg_->searchKnn(queries + q * dim_, k);
        // Max-heap on distance (1 - ip): pop fills from the back.
        size_t count = result.size();
        while (!result.empty()) {
            --count;
            sim[count] = 1.0f - result.top().first;
            lab[count] = static_cast<int64_t>(result.top().second);
            result.pop();
        }
    }
}

}  // namespace competix
