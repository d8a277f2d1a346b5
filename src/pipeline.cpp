#include "competix/pipeline.hpp"
#include "competix/log.hpp"
#include "competix/text_normalizer.hpp"
#include "competix/timing.hpp"

#include <chrono>
#include <ctime>

namespace competix {

std::string utc_timestamp_now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::vector<int32_t> PipelineResult::cluster_by_row() const {
    std::vector<int32_t> out(input_count, -1);
    for (size_t i = 0; i < embeddings.size(); ++i)
        out[embeddings.rows[i]] = clusters.labels[i];
    return out;
}

Pipeline::Pipeline(PipelineConfig cfg, const IEmbeddingModel& model)
    : cfg_(std::move(cfg)), model_(model) {
    if (cfg_.model_id.empty()) cfg_.model_id = model_.id();
    cfg_.validate();
}

PipelineResult Pipeline::run(const std::vector<Company>& companies) const {
    PipelineResult res;
    res.config = cfg_;
    res.run_timestamp = utc_timestamp_now();
    res.input_count = companies.size();

    CX_INFO("pipeline", "starting run: %zu companies, model=%s, k=%zu, tau=%s, alpha=%.3f, seed=%llu",
            companies.size(), cfg_.model_id.c_str(), cfg_.graph.k,
            to_string(cfg_.graph.tau_mode), cfg_.embedding.alpha,
            static_cast<unsigned long long>(cfg_.seed));

    StageClock clock;
    TextNormalizer normalizer(cfg_.normalizer);
    auto normalized = normalizer.normalize_all(companies);
    res.timings.normalize_ms = clock.lap();

    EmbeddingFuser fuser(cfg_.embedding, model_);
    res.embeddings = fuser.fuse(companies, normalized);
    res.timings.embed_ms = clock.lap();

    SimilarityGraphBuilder builder(cfg_.graph, derive_seed(cfg_.seed, SeedStream::Index));
    res.graph = builder.build(res.embeddings, companies);
    res.timings.graph_ms = clock.lap();

    CommunityDetector detector(cfg_.clustering, derive_seed(cfg_.seed, SeedStream::Clustering));
    res.clusters = detector.detect(res.graph);
    res.timings.cluster_ms = clock.lap();

    ClusterValidator validator(cfg_.validation, cfg_.seed);
    res.report = validator.validate(res.embeddings, res.graph, res.clusters, companies);
    res.timings.validate_ms = clock.lap();

    CX_INFO("pipeline", "run complete: %zu clustered, %zu excluded, %zu clusters "
            "in %.0fms (normalize %.0f, embed %.0f, graph %.0f, cluster %.0f, validate %.0f)",
            res.embeddings.size(), res.embeddings.excluded.size(), res.clusters.num_clusters(),
            res.timings.total_ms(), res.timings.normalize_ms, res.timings.embed_ms,
            res.timings.graph_ms, res.timings.cluster_ms, res.timings.validate_ms);
    return res;
}

}  // namespace competix
