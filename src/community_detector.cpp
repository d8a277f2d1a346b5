#include "competix/community_detector.hpp"
#include "competix/errors.hpp"
#include "competix/leiden.hpp"
#include "competix/log.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace competix {

ClusterAssignment canonicalize(const SimilarityGraph& g, const Partition& p) {
    const size_t n = g.num_nodes();
    if (p.membership.size() != n) {
        throw ClusteringError("partition covers " + std::to_string(p.membership.size()) +
                              " nodes, graph has " + std::to_string(n));
    }

    std::unordered_map<int32_t, size_t> group_of;
    std::vector<Cluster> groups;
    std::vector<uint32_t> min_member;   // node with the smallest identifier
    for (size_t i = 0; i < n; ++i) {
        int32_t raw = p.membership[i];
        if (raw < 0)
            throw ClusteringError("partition leaves node " + g.ids[i] + " unassigned");
        auto [it, inserted] = group_of.emplace(raw, groups.size());
        if (inserted) {
            groups.emplace_back();
            min_member.push_back(static_cast<uint32_t>(i));
        }
        size_t gi = it->second;
        groups[gi].members.push_back(static_cast<uint32_t>(i));
        if (g.ids[i] < g.ids[min_member[gi]]) min_member[gi] = static_cast<uint32_t>(i);
    }

    std::vector<size_t> order(groups.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        size_t sa = groups[a].members.size(), sb = groups[b].members.size();
        if (sa != sb) return sa > sb;
        return g.ids[min_member[a]] < g.ids[min_member[b]];
    });

    ClusterAssignment out;
    out.labels.assign(n, -1);
    out.clusters.reserve(groups.size());
    for (size_t rank = 0; rank < order.size(); ++rank) {
        Cluster c = std::move(groups[order[rank]]);
        c.id = static_cast<int32_t>(rank);
        for (uint32_t m : c.members) out.labels[m] = c.id;
        out.clusters.push_back(std::move(c));
    }
    out.modularity = p.modularity;
    out.iterations = p.iterations;
    return out;
}

CommunityDetector::CommunityDetector(ClusteringConfig cfg, uint64_t seed,
                                     std::unique_ptr<ICommunityAlgorithm> algo)
    : cfg_(cfg), algo_(std::move(algo)) {
    cfg_.validate();
    if (!algo_) algo_ = std::make_unique<LeidenAlgorithm>(cfg_, seed);
}

ClusterAssignment CommunityDetector::detect(const SimilarityGraph& g) const {
    CX_INFO("cluster", "finding clusters with %s (resolution=%.3f) on %zu nodes, %zu edges",
            algo_->name().c_str(), cfg_.resolution, g.num_nodes(), g.num_edges());

    Partition p;
    try {
        p = algo_->run(g);
    } catch (const ClusteringError&) {
        throw;
    } catch (const std::exception& e) {
        throw ClusteringError(algo_->name() + " failed: " + e.what());
    }

    ClusterAssignment out = canonicalize(g, p);
    out.algorithm = algo_->name();

    size_t singletons = 0;
    for (const auto& c : out.clusters)
        if (c.members.size() == 1) ++singletons;
    CX_INFO("cluster", "found %zu clusters (%zu singletons), modularity=%.4f, iterations=%u",
            out.num_clusters(), singletons, out.modularity, out.iterations);
    return out;
}

}  // namespace competix
