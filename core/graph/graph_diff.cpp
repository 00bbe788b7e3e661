#include "graph/graph_diff.hpp"

namespace ctxguard {

GraphDelta GraphDiff::diff(const Graph& from, const Graph& to) {
    GraphDelta delta;

    // Nodes in `to` but not in `from` → added, and the reverse → removed
    to.forEachNode([&](const std::string& id) {
        if (!from.hasNode(id)) delta.added_nodes.push_back(id);
    });
    from.forEachNode([&](const std::string& id) {
        if (!to.hasNode(id)) delta.removed_nodes.push_back(id);
    });

    // Same logic for edges, plus weight changes on surviving pairs
    to.forEachEdge([&](const InteractionEdge& e) {
        if (!from.hasEdge(e.source, e.target)) {
            delta.added_edges.push_back(e);
            return;
        }
        double before = from.weight(e.source, e.target);
        if (before != e.weight) {
            delta.reweighted_before.emplace_back(e.source, e.target, before);
            delta.reweighted_after.push_back(e);
        }
    });
    from.forEachEdge([&](const InteractionEdge& e) {
        if (!to.hasEdge(e.source, e.target)) delta.removed_edges.push_back(e);
    });

    return delta;
}

GraphDelta GraphDiff::invert(const GraphDelta& delta) {
    GraphDelta inv;

    inv.added_nodes = delta.removed_nodes;
    inv.removed_nodes = delta.added_nodes;
    inv.added_edges = delta.removed_edges;
    inv.removed_edges = delta.added_edges;

    inv.reweighted_before = delta.reweighted_after;
    inv.reweighted_after = delta.reweighted_before;

    return inv;
}

Graph GraphDiff::apply(const Graph& graph, const GraphDelta& delta) {
    Graph result = graph;

    for (const auto& e : delta.removed_edges) {
        result.removeEdge(e.source, e.target);
    }
    for (const auto& id : delta.removed_nodes) {
        result.removeNode(id);
    }

    for (const auto& id : delta.added_nodes) {
        result.addNode(id);
    }
    for (const auto& e : delta.added_edges) {
        result.setWeight(e.source, e.target, e.weight);
    }
    for (const auto& e : delta.reweighted_after) {
        result.setWeight(e.source, e.target, e.weight);
    }

    return result;
}

} // namespace ctxguard
