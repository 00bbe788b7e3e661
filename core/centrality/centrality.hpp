#pragma once

#include "graph/graph.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ctxguard {

enum class SpreaderTier { High, Medium, Low };

const char* toString(SpreaderTier tier);

/// Per-account centrality figures. `tier` is filled in by SpreaderRanker;
/// plain centrality computation leaves it at Low.
struct RankingEntry {
    std::string node_id;
    size_t degree = 0;             // distinct neighbours
    double weighted_degree = 0.0;  // sum of incident weights
    double centrality = 0.0;       // degree / (n - 1)
    SpreaderTier tier = SpreaderTier::Low;

    bool operator==(const RankingEntry& other) const {
        return node_id == other.node_id && degree == other.degree &&
               weighted_degree == other.weighted_degree &&
               centrality == other.centrality && tier == other.tier;
    }
};

/// Centrality of every node, in node-id order.
std::vector<RankingEntry> computeCentrality(const Graph& graph);

/// Centrality of one node. Unknown ids yield an all-zero entry.
RankingEntry computeCentrality(const Graph& graph, const std::string& node_id);

} // namespace ctxguard
