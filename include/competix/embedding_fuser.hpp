#ifndef COMPETIX_EMBEDDING_FUSER_HPP
#define COMPETIX_EMBEDDING_FUSER_HPP

#include "company.hpp"
#include "config.hpp"
#include "iembedding_model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace competix {

// Row-major unit vectors for the companies that survived exclusion, in
// input order. rows[i] is the input row of embedding row i.
struct FusedEmbeddings {
    std::string model_id;
    size_t dim = 0;
    std::vector<size_t> rows;
    std::vector<std::string> ids;
    std::vector<float> data;           // size() * dim
    std::vector<Exclusion> excluded;   // ordered by input row

    size_t size() const { return rows.size(); }
    const float* row(size_t i) const { return data.data() + i * dim; }
};

/**
 * Embeds each available description field and fuses them:
 *   fused = unit(alpha * unit(product) + (1 - alpha) * unit(customers))
 * A company with one usable field gets that field's unit vector regardless of
 * alpha. Companies with neither field are excluded and recorded.
 *
 * Distinct texts are encoded once, in batches of batch_size spread over
 * num_workers threads. A failing batch is retried with exponential backoff
 * up to max_attempts before EmbeddingError aborts the stage. Inconsistent
 * vector widths raise DimensionMismatchError without retry.
 */
class EmbeddingFuser {
public:
    EmbeddingFuser(EmbeddingConfig cfg, const IEmbeddingModel& model);

    FusedEmbeddings fuse(const std::vector<Company>& companies,
                         const std::vector<NormalizedCompany>& normalized) const;

    // Encode texts preserving order; exposed for tests.
    std::vector<std::vector<float>> encode_all(
        const std::vector<std::string>& texts) const;

private:
    std::vector<std::vector<float>> encode_with_retry(
        const std::vector<std::string>& batch, size_t batch_idx) const;

    EmbeddingConfig cfg_;
    const IEmbeddingModel& model_;
};

}  // namespace competix

#endif  // COMPETIX_EMBEDDING_FUSER_HPP
