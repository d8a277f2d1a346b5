#ifndef COMPETIX_PIPELINE_HPP
#define COMPETIX_PIPELINE_HPP

#include "cluster_validator.hpp"
#include "community_detector.hpp"
#include "company.hpp"
#include "config.hpp"
#include "embedding_fuser.hpp"
#include "iembedding_model.hpp"
#include "similarity_graph.hpp"
#include "timing.hpp"

#include <string>
#include <vector>

namespace competix {

// Everything one run produces. Stages never share mutable state; each
// field is the snapshot its stage returned.
struct PipelineResult {
    PipelineConfig config;          // resolved: model_id filled in
    std::string run_timestamp;      // UTC, ISO-8601
    size_t input_count = 0;
    FusedEmbeddings embeddings;
    SimilarityGraph graph;
    ClusterAssignment clusters;
    ValidationReport report;
    StageTimings timings;

    // Cluster of an input row, or -1 when the row was excluded.
    std::vector<int32_t> cluster_by_row() const;
};

/**
 * Runs normalize -> embed/fuse -> graph -> communities -> validation over an
 * in-memory company table. The seed in cfg feeds the index, the community
 * algorithm and every sampling step through derive_seed().
 */
class Pipeline {
public:
    Pipeline(PipelineConfig cfg, const IEmbeddingModel& model);

    PipelineResult run(const std::vector<Company>& companies) const;

    const PipelineConfig& config() const { return cfg_; }

private:
    PipelineConfig cfg_;
    const IEmbeddingModel& model_;
};

std::string utc_timestamp_now();

}  // namespace competix

#endif  // COMPETIX_PIPELINE_HPP
