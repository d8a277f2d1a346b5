#ifndef COMPETIX_CONFIG_HPP
#define COMPETIX_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace competix {

// ---------------------------------------------------------------------------
// Per-stage configuration. Every stage copies its struct at construction;
// validate() throws std::invalid_argument on out-of-range values.
// ---------------------------------------------------------------------------

struct NormalizerConfig {
    // Extra legal-form tokens stripped in addition to the built-in list.
    std::vector<std::string> extra_legal_suffixes;

    void validate() const;
};

struct EmbeddingConfig {
    double   alpha              = 0.6;   // product weight; customers get 1 - alpha
    size_t   batch_size         = 256;   // texts per model call
    uint32_t num_workers        = 4;     // concurrent model calls
    uint32_t max_attempts       = 3;     // per batch, including the first try
    uint32_t backoff_initial_ms = 200;
    double   backoff_multiplier = 2.0;

    void validate() const;
};

enum class TauMode : uint8_t { Fixed, Percentile };
enum class IndexKind : uint8_t { Flat, Hnsw };

const char* to_string(TauMode mode);
const char* to_string(IndexKind kind);

struct GraphConfig {
    size_t    k               = 20;      // neighbours per node, self excluded
    TauMode   tau_mode        = TauMode::Fixed;
    double    tau             = 0.55;    // used when tau_mode == Fixed
    double    tau_percentile  = 90.0;    // used when tau_mode == Percentile
    double    text_weight     = 0.8;
    double    category_weight = 0.2;
    IndexKind index           = IndexKind::Flat;
    size_t    hnsw_m          = 32;
    size_t    ef_construction = 200;
    size_t    ef_search       = 128;

    void validate() const;
};

struct ClusteringConfig {
    double   resolution     = 1.0;
    double   beta           = 0.01;  // randomness of the Leiden refinement step
    uint32_t max_iterations = 64;    // Leiden passes; stops early once quality is flat

    void validate() const;
};

struct ValidationConfig {
    size_t sample_clusters        = 10;
    size_t members_per_sample     = 10;
    size_t silhouette_sample_size = 10000;  // 0 = every row

    void validate() const;
};

struct PipelineConfig {
    std::string      model_id;   // recorded in metadata; filled from the model when empty
    uint64_t         seed = 42;
    NormalizerConfig normalizer;
    EmbeddingConfig  embedding;
    GraphConfig      graph;
    ClusteringConfig clustering;
    ValidationConfig validation;

    void validate() const;
};

// Stage tags for derive_seed(); values are part of the reproducibility contract.
enum class SeedStream : uint64_t {
    Index      = 0x1d3a,
    Clustering = 0x2c11,
    Sampling   = 0x3b57,
    Silhouette = 0x4e09,
};

// Deterministic per-stage seed derived from the run seed (splitmix64).
uint64_t derive_seed(uint64_t seed, SeedStream stream);

}  // namespace competix

#endif  // COMPETIX_CONFIG_HPP
