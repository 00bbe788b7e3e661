#pragma once

#include "graph/graph.hpp"

#include <cstddef>

namespace ctxguard {

/// Aggregate figures of one graph view. Recomputed whenever the view
/// changes; carries no identity of its own.
struct NetworkStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;     // edges / (n(n-1)/2), 0 for n < 2
    double avg_degree = 0.0;  // 2 * edges / n, 0 for n = 0
};

struct FilterResult {
    Graph subgraph;
    NetworkStats stats;
};

/// Statistics of the whole graph.
NetworkStats computeStats(const Graph& graph);

/// Keep accounts with at least `min_connections` distinct neighbours in
/// `graph`, then keep exactly the edges between kept accounts. Throws
/// InvalidParameter for a negative threshold.
FilterResult filterAndStats(const Graph& graph, int min_connections);

} // namespace ctxguard
