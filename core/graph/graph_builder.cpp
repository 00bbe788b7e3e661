#include "graph/graph_builder.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace ctxguard {

namespace {

using NodePair = std::pair<std::string, std::string>;

NodePair orderedPair(const std::string& a, const std::string& b) {
    return a < b ? NodePair(a, b) : NodePair(b, a);
}

// Finite record weights can still sum past the double range
void checkMergedWeight(const std::string& a, const std::string& b, double total) {
    if (!std::isfinite(total)) {
        std::string msg = "Merged weight of " + a + " - " + b + " overflows";
        log::logger()->warn("Graph build rejected pair: {}", msg);
        throw InvalidEdge(msg);
    }
}

} // namespace

Graph GraphBuilder::build(const std::vector<InteractionEdge>& edges) {
    return build(edges, {});
}

Graph GraphBuilder::build(const std::vector<InteractionEdge>& edges,
                          const std::set<std::string>& isolated_nodes) {
    std::map<NodePair, std::vector<double>> contributions;
    for (const auto& edge : edges) {
        try {
            validateEdge(edge);
        } catch (const InvalidEdge& e) {
            log::logger()->warn("Graph build rejected record: {}", e.what());
            throw;
        }
        contributions[orderedPair(edge.source, edge.target)].push_back(edge.weight);
    }

    Graph graph;
    for (const auto& id : isolated_nodes) {
        if (id.empty()) {
            throw InvalidParameter("Isolated node id must not be empty");
        }
        graph.addNode(id);
    }
    for (auto& [pair, weights] : contributions) {
        std::sort(weights.begin(), weights.end());
        double total = 0.0;
        for (double w : weights) total += w;
        checkMergedWeight(pair.first, pair.second, total);
        graph.setWeight(pair.first, pair.second, total);
    }

    log::logger()->debug("Built graph from {} records: {} nodes, {} edges",
                         edges.size(), graph.nodeCount(), graph.edgeCount());
    return graph;
}

Graph GraphBuilder::build(const EdgeStore& store) {
    return build(store.records(), store.isolatedNodes());
}

Graph GraphBuilder::merge(const Graph& a, const Graph& b) {
    Graph merged = a;
    b.forEachNode([&](const std::string& id) { merged.addNode(id); });
    b.forEachEdge([&](const InteractionEdge& e) {
        checkMergedWeight(e.source, e.target, merged.weight(e.source, e.target) + e.weight);
        merged.addWeight(e.source, e.target, e.weight);
    });
    return merged;
}

} // namespace ctxguard
