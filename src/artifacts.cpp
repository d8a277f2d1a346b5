#include "competix/artifacts.hpp"
#include "competix/errors.hpp"
#include "competix/log.hpp"
#include "competix/table_io.hpp"

#include <arrow/api.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace competix {

namespace {

template <typename T>
json optional_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

void check(const arrow::Status& st, const char* what) {
    if (!st.ok()) throw ArtifactError(std::string(what) + ": " + st.ToString());
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b, const char* what) {
    auto res = b.Finish();
    check(res.status(), what);
    return std::move(res).ValueOrDie();
}

std::shared_ptr<arrow::Table> clusters_table(const PipelineResult& r,
                                             const std::vector<Company>& companies) {
    auto* pool = arrow::default_memory_pool();
    arrow::StringBuilder ids(pool), customers(pool), products(pool);
    arrow::ListBuilder categories(pool, std::make_shared<arrow::StringBuilder>(pool));
    auto* tags = static_cast<arrow::StringBuilder*>(categories.value_builder());
    arrow::Int32Builder cluster(pool);

    for (size_t i = 0; i < r.embeddings.size(); ++i) {
        const Company& co = companies[r.embeddings.rows[i]];
        check(ids.Append(co.id), "clusters.id");
        check(customers.Append(co.customers), "clusters.customers");
        check(products.Append(co.product), "clusters.product");
        check(categories.Append(), "clusters.categories");
        for (const auto& t : co.tags) check(tags->Append(t), "clusters.categories");
        check(cluster.Append(r.clusters.labels[i]), "clusters.cluster_id");
    }

    auto schema = arrow::schema({
        arrow::field("id", arrow::utf8()),
        arrow::field("customers", arrow::utf8()),
        arrow::field("product", arrow::utf8()),
        arrow::field("categories", arrow::list(arrow::utf8())),
        arrow::field("cluster_id", arrow::int32()),
    });
    return arrow::Table::Make(schema, {finish(ids, "clusters.id"),
                                       finish(customers, "clusters.customers"),
                                       finish(products, "clusters.product"),
                                       finish(categories, "clusters.categories"),
                                       finish(cluster, "clusters.cluster_id")});
}

std::shared_ptr<arrow::Table> embeddings_table(const FusedEmbeddings& emb) {
    auto* pool = arrow::default_memory_pool();
    const int32_t dim = static_cast<int32_t>(emb.dim);
    arrow::StringBuilder ids(pool);
    arrow::FixedSizeListBuilder vectors(pool, std::make_shared<arrow::FloatBuilder>(pool), dim);
    auto* values = static_cast<arrow::FloatBuilder*>(vectors.value_builder());

    for (size_t i = 0; i < emb.size(); ++i) {
        check(ids.Append(emb.ids[i]), "embeddings.id");
        check(vectors.Append(), "embeddings.vector");
        check(values->AppendValues(emb.row(i), dim), "embeddings.vector");
    }

    auto schema = arrow::schema({
        arrow::field("id", arrow::utf8()),
        arrow::field("vector", arrow::fixed_size_list(arrow::float32(), dim)),
    });
    return arrow::Table::Make(schema, {finish(ids, "embeddings.id"),
                                       finish(vectors, "embeddings.vector")});
}

// Both directions of every edge, ordered by (src, dst).
std::shared_ptr<arrow::Table> adjacency_table(const SimilarityGraph& g) {
    auto* pool = arrow::default_memory_pool();
    arrow::StringBuilder src(pool), dst(pool);
    arrow::FloatBuilder weight(pool);

    for (size_t u = 0; u < g.num_nodes(); ++u) {
        for (size_t e = g.row_ptr[u]; e < g.row_ptr[u + 1]; ++e) {
            check(src.Append(g.ids[u]), "adjacency.src");
            check(dst.Append(g.ids[g.cols[e]]), "adjacency.dst");
            check(weight.Append(g.weights[e]), "adjacency.weight");
        }
    }

    auto schema = arrow::schema({
        arrow::field("src", arrow::utf8()),
        arrow::field("dst", arrow::utf8()),
        arrow::field("weight", arrow::float32()),
    });
    return arrow::Table::Make(schema, {finish(src, "adjacency.src"),
                                       finish(dst, "adjacency.dst"),
                                       finish(weight, "adjacency.weight")});
}

std::shared_ptr<arrow::Table> exclusions_table(const std::vector<Exclusion>& excluded) {
    auto* pool = arrow::default_memory_pool();
    arrow::StringBuilder ids(pool), reasons(pool);
    arrow::UInt64Builder rows(pool);
    for (const auto& ex : excluded) {
        check(rows.Append(ex.row), "exclusions.row");
        check(ids.Append(ex.id), "exclusions.id");
        check(reasons.Append(to_string(ex.reason)), "exclusions.reason");
    }
    auto schema = arrow::schema({
        arrow::field("row", arrow::uint64()),
        arrow::field("id", arrow::utf8()),
        arrow::field("reason", arrow::utf8()),
    });
    return arrow::Table::Make(schema, {finish(rows, "exclusions.row"),
                                       finish(ids, "exclusions.id"),
                                       finish(reasons, "exclusions.reason")});
}

json config_json(const PipelineConfig& c, const SimilarityGraph& g) {
    json j;
    j["model_id"] = c.model_id;
    j["seed"] = c.seed;
    j["normalizer"]["extra_legal_suffixes"] = c.normalizer.extra_legal_suffixes;
    j["embedding"] = {
        {"alpha", c.embedding.alpha},
        {"batch_size", c.embedding.batch_size},
        {"num_workers", c.embedding.num_workers},
        {"max_attempts", c.embedding.max_attempts},
        {"backoff_initial_ms", c.embedding.backoff_initial_ms},
        {"backoff_multiplier", c.embedding.backoff_multiplier},
    };
    j["graph"] = {
        {"k", c.graph.k},
        {"tau_mode", to_string(c.graph.tau_mode)},
        {"tau", g.tau},
        {"text_weight", c.graph.text_weight},
        {"category_weight", c.graph.category_weight},
        {"index", to_string(c.graph.index)},
    };
    if (c.graph.tau_mode == TauMode::Percentile)
        j["graph"]["tau_percentile"] = c.graph.tau_percentile;
    else
        j["graph"]["tau_configured"] = c.graph.tau;
    if (c.graph.index == IndexKind::Hnsw) {
        j["graph"]["hnsw_m"] = c.graph.hnsw_m;
        j["graph"]["ef_construction"] = c.graph.ef_construction;
        j["graph"]["ef_search"] = c.graph.ef_search;
    }
    j["clustering"] = {
        {"resolution", c.clustering.resolution},
        {"beta", c.clustering.beta},
        {"max_iterations", c.clustering.max_iterations},
    };
    j["validation"] = {
        {"sample_clusters", c.validation.sample_clusters},
        {"members_per_sample", c.validation.members_per_sample},
        {"silhouette_sample_size", c.validation.silhouette_sample_size},
    };
    return j;
}

json metrics_json(const ValidationReport& rep, const ClusterAssignment& a) {
    json m;
    m["silhouette"] = optional_json(rep.silhouette);
    if (!rep.silhouette) m["silhouette_note"] = rep.silhouette_note;
    m["silhouette_rows"] = rep.silhouette_rows;
    m["graph_density"] = rep.graph_density;
    m["intra_cluster_density"] = optional_json(rep.intra_density);
    m["modularity"] = rep.modularity;
    m["iterations"] = a.iterations;
    m["algorithm"] = a.algorithm;
    m["cluster_sizes"] = {
        {"num_clusters", rep.sizes.num_clusters},
        {"min", rep.sizes.min},
        {"max", rep.sizes.max},
        {"median", rep.sizes.median},
        {"mean", rep.sizes.mean},
        {"stddev", rep.sizes.stddev},
        {"singletons", rep.sizes.singletons},
    };
    json per = json::array();
    for (const auto& d : rep.per_cluster) {
        per.push_back({{"cluster_id", d.cluster_id},
                       {"size", d.size},
                       {"internal_edges", d.internal_edges},
                       {"density", optional_json(d.density)}});
    }
    m["per_cluster"] = std::move(per);
    return m;
}

json samples_json(const std::vector<ReviewSample>& samples) {
    json out = json::array();
    for (const auto& s : samples) {
        json members = json::array();
        for (const auto& mbr : s.members) {
            members.push_back({{"id", mbr.id},
                               {"customers", mbr.customers},
                               {"product", mbr.product},
                               {"categories", mbr.tags}});
        }
        out.push_back({{"cluster_id", s.cluster_id},
                       {"cluster_size", s.cluster_size},
                       {"members", std::move(members)}});
    }
    return out;
}

}  // namespace

std::string metadata_json(const PipelineResult& r) {
    json j;
    j["run_timestamp"] = r.run_timestamp;
    j["config"] = config_json(r.config, r.graph);
    j["input"] = {
        {"companies", r.input_count},
        {"embedded", r.embeddings.size()},
        {"excluded", r.embeddings.excluded.size()},
        {"embedding_dim", r.embeddings.dim},
    };
    j["graph"] = {
        {"nodes", r.graph.num_nodes()},
        {"edges", r.graph.num_edges()},
        {"candidate_pairs", r.graph.candidate_pairs},
        {"tau", r.graph.tau},
        {"index", r.graph.index_name},
    };
    j["metrics"] = metrics_json(r.report, r.clusters);
    j["samples"] = samples_json(r.report.samples);
    j["files"] = {
        {"clusters", kClustersFile},
        {"embeddings", kEmbeddingsFile},
        {"adjacency", kAdjacencyFile},
        {"exclusions", kExclusionsFile},
    };
    return j.dump(2);
}

void write_artifacts(const PipelineResult& result,
                     const std::vector<Company>& companies,
                     const std::string& out_dir) {
    if (out_dir.empty()) throw std::invalid_argument("write_artifacts: empty output directory");
    const fs::path target = fs::path(out_dir).lexically_normal();
    fs::path staging = target;
    staging += ".partial";

    std::error_code ec;
    fs::remove_all(staging, ec);
    try {
        if (target.has_parent_path()) fs::create_directories(target.parent_path());
        fs::create_directories(staging);

        write_parquet(clusters_table(result, companies), (staging / kClustersFile).string());
        write_parquet(embeddings_table(result.embeddings), (staging / kEmbeddingsFile).string());
        write_parquet(adjacency_table(result.graph), (staging / kAdjacencyFile).string());
        write_parquet(exclusions_table(result.embeddings.excluded),
                      (staging / kExclusionsFile).string());

        std::ofstream meta(staging / kMetadataFile, std::ios::binary | std::ios::trunc);
        meta << metadata_json(result) << '\n';
        meta.close();
        if (!meta) throw ArtifactError("failed to write " + (staging / kMetadataFile).string());

        fs::remove_all(target);
        fs::rename(staging, target);
    } catch (const ArtifactError&) {
        fs::remove_all(staging, ec);
        throw;
    } catch (const std::exception& e) {
        fs::remove_all(staging, ec);
        throw ArtifactError("publishing " + target.string() + " failed: " + e.what());
    }
    CX_INFO("io", "published %zu clusters, %zu edges, %zu exclusions to %s",
            result.clusters.num_clusters(), result.graph.num_edges(),
            result.embeddings.excluded.size(), target.c_str());
}

}  // namespace competix
