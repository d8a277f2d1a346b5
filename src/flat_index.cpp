#include "competix/flat_index.hpp"
#include "competix/errors.hpp"
#include "competix/hnsw_index.hpp"
#include "competix/log.hpp"

#include <faiss/IndexFlat.h>

#include <stdexcept>

namespace competix {

FlatIndex::FlatIndex() = default;
FlatIndex::~FlatIndex() = default;

void FlatIndex::build(const float* data, size_t n, size_t dim) {
    if (data == nullptr || n == 0 || dim == 0)
        throw std::invalid_argument("FlatIndex::build: invalid data or dimensions");
    try {
        index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dim));
        index_->add(static_cast<faiss::idx_t>(n), data);
    } catch (const std::exception& e) {
        index_.reset();
        throw IndexBuildError(std::string("FlatIndex::build: ") + e.what());
    }
    CX_DEBUG("index", "faiss flat index holds %zu vectors (dim=%zu)", n, dim);
}

void FlatIndex::search(const float* queries, size_t nq, size_t k,
                       int64_t* labels, float* sims) const {
    if (!index_)
        throw std::runtime_error("FlatIndex::search: index not built");
    if (queries == nullptr || labels == nullptr || sims == nullptr)
        throw std::invalid_argument("FlatIndex::search: null buffers");
    if (nq == 0 || k == 0) return;

    static_assert(sizeof(faiss::idx_t) == sizeof(int64_t), "faiss idx_t must be 64-bit");
    index_->search(static_cast<faiss::idx_t>(nq), queries,
                   static_cast<faiss::idx_t>(k), sims,
                   reinterpret_cast<faiss::idx_t*>(labels));
}

size_t FlatIndex::size() const {
    return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

std::unique_ptr<INeighborIndex> make_neighbor_index(const GraphConfig& cfg,
                                                    uint64_t seed) {
    switch (cfg.index) {
        case IndexKind::Flat:
            return std::make_unique<FlatIndex>();
        case IndexKind::Hnsw:
            return std::make_unique<HnswIndex>(cfg.hnsw_m, cfg.ef_construction,
                                               cfg.ef_search, seed);
    }
    throw std::invalid_argument("make_neighbor_index: unknown index kind");
}

}  // namespace competix
