#include "competix/config.hpp"

#include <cmath>
#include <stdexcept>

namespace competix {

namespace {

void require(bool ok, const char* msg) {
    if (!ok) throw std::invalid_argument(msg);
}

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

}  // namespace

const char* to_string(TauMode mode) {
    return mode == TauMode::Fixed ? "fixed" : "percentile";
}

const char* to_string(IndexKind kind) {
    return kind == IndexKind::Flat ? "flat" : "hnsw";
}

void NormalizerConfig::validate() const {
    for (const auto& s : extra_legal_suffixes)
        require(!s.empty(), "NormalizerConfig: empty legal suffix");
}

void EmbeddingConfig::validate() const {
    require(in_unit(alpha), "EmbeddingConfig: require 0 <= alpha <= 1");
    require(batch_size > 0, "EmbeddingConfig: batch_size must be > 0");
    require(num_workers > 0, "EmbeddingConfig: num_workers must be > 0");
    require(max_attempts >= 1, "EmbeddingConfig: max_attempts must be >= 1");
    require(std::isfinite(backoff_multiplier) && backoff_multiplier >= 1.0,
            "EmbeddingConfig: backoff_multiplier must be >= 1");
}

void GraphConfig::validate() const {
    require(k > 0, "GraphConfig: k must be > 0");
    require(in_unit(tau), "GraphConfig: require 0 <= tau <= 1");
    require(std::isfinite(tau_percentile) && tau_percentile >= 0.0 &&
                tau_percentile <= 100.0,
            "GraphConfig: require 0 <= tau_percentile <= 100");
    require(std::isfinite(text_weight) && std::isfinite(category_weight) &&
                text_weight >= 0.0 && category_weight >= 0.0,
            "GraphConfig: weights must be non-negative");
    require(std::fabs(text_weight + category_weight - 1.0) <= 1e-9,
            "GraphConfig: text_weight + category_weight must equal 1");
    if (index == IndexKind::Hnsw) {
        require(hnsw_m >= 2, "GraphConfig: hnsw_m must be >= 2");
        require(ef_construction > 0 && ef_search > 0,
                "GraphConfig: ef_construction and ef_search must be > 0");
    }
}

void ClusteringConfig::validate() const {
    require(std::isfinite(resolution) && resolution > 0.0,
            "ClusteringConfig: resolution must be > 0");
    require(std::isfinite(beta) && beta > 0.0, "ClusteringConfig: beta must be > 0");
    require(max_iterations > 0, "ClusteringConfig: max_iterations must be > 0");
}

void ValidationConfig::validate() const {
    require(members_per_sample > 0 || sample_clusters == 0,
            "ValidationConfig: members_per_sample must be > 0");
}

void PipelineConfig::validate() const {
    normalizer.validate();
    embedding.validate();
    graph.validate();
    clustering.validate();
    validation.validate();
}

uint64_t derive_seed(uint64_t seed, SeedStream stream) {
    uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (static_cast<uint64_t>(stream) + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

}  // namespace competix
