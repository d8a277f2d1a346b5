#ifndef COMPETIX_BENCH_REPORT_HPP
#define COMPETIX_BENCH_REPORT_HPP

#include "competix/pipeline.hpp"

#include <cstddef>
#include <cstdio>
#include <string>

#include <sys/resource.h>

namespace competix::bench {

// One pipeline run at size n with one neighbour index.
struct StageBenchRow {
    size_t n = 0;
    std::string index;
    StageTimings timings;
    size_t edges = 0;
    size_t clusters = 0;
    double modularity = 0.0;
    double memory_mb = 0.0;

    static StageBenchRow from_result(size_t n, const PipelineResult& res, double memory_mb) {
        StageBenchRow row;
        row.n = n;
        row.index = res.graph.index_name;
        row.timings = res.timings;
        row.edges = res.graph.num_edges();
        row.clusters = res.clusters.num_clusters();
        row.modularity = res.clusters.modularity;
        row.memory_mb = memory_mb;
        return row;
    }
};

// High-water resident set; Linux reports ru_maxrss in kilobytes.
inline double peak_rss_mb() {
    struct rusage ru {};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

/**
 * Prints StageBenchRows as a fixed-width table on stdout and mirrors them
 * to a CSV file when one is given.
 */
class BenchReport {
public:
    explicit BenchReport(const char* csv_path) {
        if (!csv_path) return;
        csv_ = std::fopen(csv_path, "w");
        if (!csv_) {
            std::fprintf(stderr, "[bench] could not open %s, CSV disabled\n", csv_path);
            return;
        }
        std::fprintf(csv_, "index,n,normalize_ms,embed_ms,graph_ms,cluster_ms,validate_ms,"
                           "total_ms,edges,clusters,modularity,memory_mb\n");
    }

    ~BenchReport() {
        if (csv_) std::fclose(csv_);
    }

    BenchReport(const BenchReport&) = delete;
    BenchReport& operator=(const BenchReport&) = delete;

    bool writes_csv() const { return csv_ != nullptr; }

    void print_header() const {
        std::printf("%-14s | %8s | %9s | %9s | %9s | %9s | %9s | %9s | %8s | %7s | %8s\n",
                    "Index", "N", "Norm(ms)", "Embed(ms)", "Graph(ms)", "Clust(ms)",
                    "Valid(ms)", "Edges", "Clusters", "Q", "Mem(MB)");
        std::printf("%s\n", std::string(124, '-').c_str());
        std::fflush(stdout);
    }

    void add(const StageBenchRow& r) {
        const StageTimings& t = r.timings;
        std::printf("%-14s | %8zu | %9.1f | %9.1f | %9.1f | %9.1f | %9.1f | %9zu | %8zu | %7.4f | %8.1f\n",
                    r.index.c_str(), r.n, t.normalize_ms, t.embed_ms, t.graph_ms,
                    t.cluster_ms, t.validate_ms, r.edges, r.clusters, r.modularity,
                    r.memory_mb);
        std::fflush(stdout);
        if (!csv_) return;
        std::fprintf(csv_, "%s,%zu,%.3f,%.3f,%.3f,%.3f,%.3f,%.3f,%zu,%zu,%.6f,%.1f\n",
                     r.index.c_str(), r.n, t.normalize_ms, t.embed_ms, t.graph_ms,
                     t.cluster_ms, t.validate_ms, t.total_ms(), r.edges, r.clusters,
                     r.modularity, r.memory_mb);
        std::fflush(csv_);
    }

private:
    std::FILE* csv_ = nullptr;
};

}  // namespace competix::bench

#endif  // COMPETIX_BENCH_REPORT_HPP
