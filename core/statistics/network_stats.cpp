#include "statistics/network_stats.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <set>

namespace ctxguard {

NetworkStats computeStats(const Graph& graph) {
    NetworkStats stats;
    stats.node_count = graph.nodeCount();
    stats.edge_count = graph.edgeCount();

    double n = static_cast<double>(stats.node_count);
    double m = static_cast<double>(stats.edge_count);
    if (stats.node_count >= 2) {
        double max_edges = n * (n - 1.0) / 2.0;
        stats.density = std::clamp(m / max_edges, 0.0, 1.0);
    }
    if (stats.node_count > 0) {
        stats.avg_degree = 2.0 * m / n;
    }
    return stats;
}

FilterResult filterAndStats(const Graph& graph, int min_connections) {
    if (min_connections < 0) {
        throw InvalidParameter("min_connections must be >= 0, got " +
                               std::to_string(min_connections));
    }

    // Nodes first; edges follow from the kept node set
    std::set<std::string> kept;
    graph.forEachNode([&](const std::string& id) {
        if (graph.degree(id) >= static_cast<size_t>(min_connections)) {
            kept.insert(id);
        }
    });

    FilterResult result;
    result.subgraph = graph.extractSubgraph(kept);
    result.stats = computeStats(result.subgraph);

    log::logger()->debug("Filter min_connections={} kept {}/{} nodes, {}/{} edges",
                         min_connections, result.stats.node_count, graph.nodeCount(),
                         result.stats.edge_count, graph.edgeCount());
    return result;
}

} // namespace ctxguard
