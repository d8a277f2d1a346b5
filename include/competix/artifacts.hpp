#ifndef COMPETIX_ARTIFACTS_HPP
#define COMPETIX_ARTIFACTS_HPP

#include "company.hpp"
#include "pipeline.hpp"

#include <string>
#include <vector>

namespace competix {

inline constexpr const char* kClustersFile   = "clusters.parquet";
inline constexpr const char* kEmbeddingsFile = "embeddings.parquet";
inline constexpr const char* kAdjacencyFile  = "adjacency.parquet";
inline constexpr const char* kExclusionsFile = "exclusions.parquet";
inline constexpr const char* kMetadataFile   = "metadata.json";

// Run metadata as pretty-printed JSON: resolved configuration, model id,
// timestamp, graph summary, validation metrics, review samples, file names.
std::string metadata_json(const PipelineResult& result);

/**
 * Publishes a run under out_dir. Files are written into "<out_dir>.partial"
 * and the directory is renamed into place only after every file succeeded,
 * replacing a previous run at out_dir. If a file fails the staging directory
 * is removed, ArtifactError is thrown and out_dir is not modified.
 */
void write_artifacts(const PipelineResult& result,
                     const std::vector<Company>& companies,
                     const std::string& out_dir);

}  // namespace competix

#endif  // COMPETIX_ARTIFACTS_HPP
