#pragma once

#include "graph/edge_store.hpp"
#include "graph/graph.hpp"

#include <set>
#include <string>
#include <vector>

namespace ctxguard {

/// Builds immutable Graph snapshots from raw interaction records.
///
/// Records naming the same unordered pair are merged into one edge whose
/// weight is the sum of the contributing weights. Per-pair weights are
/// summed in sorted order, so the result does not depend on input order.
class GraphBuilder {
public:
    /// Throws InvalidEdge on the first bad record; nothing is built.
    static Graph build(const std::vector<InteractionEdge>& edges);

    /// As above, also adding accounts that have no interactions.
    static Graph build(const std::vector<InteractionEdge>& edges,
                       const std::set<std::string>& isolated_nodes);

    /// Build from a store: its records plus its isolated nodes.
    static Graph build(const EdgeStore& store);

    /// Union of nodes, pair weights summed. Associative and commutative,
    /// so partial builds of disjoint record subsets can be combined.
    static Graph merge(const Graph& a, const Graph& b);
};

} // namespace ctxguard
