#ifndef COMPETIX_IEMBEDDING_MODEL_HPP
#define COMPETIX_IEMBEDDING_MODEL_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace competix {

/**
 * Text-to-vector capability. encode() returns one vector per input text, in
 * input order. Implementations must tolerate concurrent encode() calls;
 * EmbeddingFuser never issues more than EmbeddingConfig::num_workers at once.
 * A thrown exception is treated as a transient batch failure and retried.
 */
class IEmbeddingModel {
public:
    virtual std::vector<std::vector<float>> encode(
        const std::vector<std::string>& texts) const = 0;

    /** Output width announced by the model. */
    virtual size_t dim() const = 0;

    virtual std::string id() const = 0;

    virtual ~IEmbeddingModel() = default;
};

}  // namespace competix

#endif  // COMPETIX_IEMBEDDING_MODEL_HPP
