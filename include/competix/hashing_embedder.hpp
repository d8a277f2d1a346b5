#ifndef COMPETIX_HASHING_EMBEDDER_HPP
#define COMPETIX_HASHING_EMBEDDER_HPP

#include "iembedding_model.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace competix {

// Feature-hashing embedding: unigrams and adjacent bigrams hashed with
// XXH64 into dim signed buckets, weighted 1 + log(tf), L2-normalized.
// Stateless and deterministic, so concurrent encode() is safe.
class HashingEmbedder : public IEmbeddingModel {
public:
    explicit HashingEmbedder(size_t dim = 384, uint64_t hash_seed = 0,
                             float bigram_weight = 0.5f);

    std::vector<std::vector<float>> encode(
        const std::vector<std::string>& texts) const override;
    size_t dim() const override { return dim_; }
    std::string id() const override;

    std::vector<float> embed_one(const std::string& text) const;

private:
    size_t dim_;
    uint64_t hash_seed_;
    float bigram_weight_;
};

}  // namespace competix

#endif  // COMPETIX_HASHING_EMBEDDER_HPP
