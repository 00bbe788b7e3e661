#pragma once

#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace ctxguard {

// ─── GraphDelta ────────────────────────────────────────────────
// Set of changes between two graph snapshots. Fully invertible.

struct GraphDelta {
    std::vector<std::string> added_nodes;
    std::vector<std::string> removed_nodes;
    std::vector<InteractionEdge> added_edges;
    std::vector<InteractionEdge> removed_edges;

    // For undo: weight of a surviving edge before and after
    std::vector<InteractionEdge> reweighted_before;
    std::vector<InteractionEdge> reweighted_after;

    bool empty() const {
        return added_nodes.empty() && removed_nodes.empty() &&
               added_edges.empty() && removed_edges.empty() &&
               reweighted_after.empty();
    }
};

/// Diff utility for comparing two graph snapshots.
class GraphDiff {
public:
    /// Compute a delta that transforms `from` into `to`.
    static GraphDelta diff(const Graph& from, const Graph& to);

    /// Invert a delta (swap add/remove, swap before/after).
    static GraphDelta invert(const GraphDelta& delta);

    /// Return a copy of `graph` with `delta` applied.
    static Graph apply(const Graph& graph, const GraphDelta& delta);
};

} // namespace ctxguard
