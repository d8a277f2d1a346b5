#ifndef COMPETIX_ERRORS_HPP
#define COMPETIX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace competix {

// Base for structural failures that halt a run. Data defects never throw;
// they are recorded as Exclusion entries instead.
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Embedding batch still failing after the configured number of attempts.
class EmbeddingError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Model returned vectors of inconsistent width.
class DimensionMismatchError : public PipelineError {
public:
    DimensionMismatchError(size_t expected, size_t actual)
        : PipelineError("embedding dimension mismatch: expected " +
                        std::to_string(expected) + ", got " +
                        std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class IndexBuildError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Community detection produced no valid partition.
class ClusteringError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Reading input or publishing output artifacts failed.
class ArtifactError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

}  // namespace competix

#endif  // COMPETIX_ERRORS_HPP
