#include "competix/artifacts.hpp"
#include "competix/errors.hpp"
#include "competix/hashing_embedder.hpp"
#include "competix/log.hpp"
#include "competix/pipeline.hpp"
#include "competix/table_io.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace competix;

static void usage(const char* argv0) {
    std::fprintf(stderr,
        "usage: %s <input.csv|input.parquet> <output_dir> [options]\n"
        "  --k N                 neighbours per company (default 20)\n"
        "  --tau X               fixed similarity threshold (default 0.55)\n"
        "  --tau-percentile P    derive tau from the P-th percentile of candidate scores\n"
        "  --alpha X             product weight in the fused embedding (default 0.6)\n"
        "  --seed N              run seed (default 42)\n"
        "  --index flat|hnsw     nearest-neighbour backend (default flat)\n"
        "  --resolution X        community resolution (default 1.0)\n"
        "  --dim N               hashing embedder width (default 384)\n",
        argv0);
}

// Unsigned option value. std::stoull accepts "-1" and wraps it, so the
// text must be all digits.
static uint64_t parse_count(const std::string& opt, const std::string& val, uint64_t max) {
    if (val.empty() || val.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument(opt + " expects a non-negative integer, got '" + val + "'");
    uint64_t v = std::stoull(val);
    if (v > max)
        throw std::out_of_range(opt + " must be at most " + std::to_string(max));
    return v;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 2;
    }
    const std::string input = argv[1];
    const std::string out_dir = argv[2];

    PipelineConfig cfg;
    size_t dim = 384;
    try {
        for (int i = 3; i < argc; ++i) {
            std::string opt = argv[i];
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + opt);
            std::string val = argv[++i];
            if (opt == "--k") cfg.graph.k = parse_count(opt, val, UINT32_MAX);
            else if (opt == "--tau") { cfg.graph.tau_mode = TauMode::Fixed; cfg.graph.tau = std::stod(val); }
            else if (opt == "--tau-percentile") { cfg.graph.tau_mode = TauMode::Percentile; cfg.graph.tau_percentile = std::stod(val); }
            else if (opt == "--alpha") cfg.embedding.alpha = std::stod(val);
            else if (opt == "--seed") cfg.seed = parse_count(opt, val, UINT64_MAX);
            else if (opt == "--index") {
                if (val == "flat") cfg.graph.index = IndexKind::Flat;
                else if (val == "hnsw") cfg.graph.index = IndexKind::Hnsw;
                else throw std::invalid_argument("unknown index '" + val + "'");
            }
            else if (opt == "--resolution") cfg.clustering.resolution = std::stod(val);
            else if (opt == "--dim") dim = parse_count(opt, val, 1u << 16);
            else throw std::invalid_argument("unknown option " + opt);
        }
    } catch (const std::logic_error& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        usage(argv[0]);
        return 2;
    }

    try {
        HashingEmbedder model(dim);
        auto companies = read_companies(input);
        Pipeline pipeline(cfg, model);
        auto result = pipeline.run(companies);
        write_artifacts(result, companies, out_dir);
    } catch (const PipelineError& e) {
        CX_ERROR("main", "run failed: %s", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        CX_ERROR("main", "invalid configuration: %s", e.what());
        return 2;
    }
    return 0;
}
