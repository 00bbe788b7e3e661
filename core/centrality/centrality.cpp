#include "centrality/centrality.hpp"

namespace ctxguard {

const char* toString(SpreaderTier tier) {
    switch (tier) {
        case SpreaderTier::High: return "High";
        case SpreaderTier::Medium: return "Medium";
        case SpreaderTier::Low: return "Low";
    }
    return "Low";
}

RankingEntry computeCentrality(const Graph& graph, const std::string& node_id) {
    RankingEntry entry;
    entry.node_id = node_id;
    entry.degree = graph.degree(node_id);
    entry.weighted_degree = graph.weightedDegree(node_id);

    size_t n = graph.nodeCount();
    if (n >= 2) {
        entry.centrality = static_cast<double>(entry.degree) / static_cast<double>(n - 1);
    }
    return entry;
}

std::vector<RankingEntry> computeCentrality(const Graph& graph) {
    std::vector<RankingEntry> entries;
    entries.reserve(graph.nodeCount());
    graph.forEachNode([&](const std::string& id) {
        entries.push_back(computeCentrality(graph, id));
    });
    return entries;
}

} // namespace ctxguard
