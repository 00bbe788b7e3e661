#pragma once

#include "graph/edge.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ctxguard {

// ─── Graph ─────────────────────────────────────────────────────
// Undirected weighted simple graph over account ids. Duplicate pairs
// have already been merged, so each unordered pair carries one weight.
// Adjacency is kept in ordered maps so every iteration is in node-id
// order and results never depend on hashing.
//
// A Graph is a value: the public interface is read-only and copies are
// independent. Instances are produced by GraphBuilder or GraphDiff.

class Graph {
public:
    Graph() = default;

    // ── Nodes ──
    bool hasNode(const std::string& id) const { return adjacency_.count(id) > 0; }
    std::vector<std::string> getNodeIds() const;
    size_t nodeCount() const { return adjacency_.size(); }

    // ── Edges ──
    bool hasEdge(const std::string& a, const std::string& b) const;
    /// Merged weight of the pair, 0 if the accounts are not connected.
    double weight(const std::string& a, const std::string& b) const;
    size_t edgeCount() const { return edge_count_; }
    /// Every edge once, with source < target.
    std::vector<InteractionEdge> getEdges() const;

    // ── Adjacency queries ──
    std::vector<std::string> getNeighborNodes(const std::string& id) const;
    const std::map<std::string, double>& neighbors(const std::string& id) const;
    size_t degree(const std::string& id) const;
    double weightedDegree(const std::string& id) const;

    // ── Subgraph extraction ──
    /// Nodes of `node_ids` present in this graph, and exactly the edges
    /// whose both endpoints are among them.
    Graph extractSubgraph(const std::set<std::string>& node_ids) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const std::string&)>& fn) const;
    void forEachEdge(const std::function<void(const InteractionEdge&)>& fn) const;

    bool operator==(const Graph& other) const {
        return edge_count_ == other.edge_count_ && adjacency_ == other.adjacency_;
    }
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    friend class GraphBuilder;
    friend class GraphDiff;

    void addNode(const std::string& id);
    /// Add `w` to the pair weight, creating nodes and the edge as needed.
    void addWeight(const std::string& a, const std::string& b, double w);
    void setWeight(const std::string& a, const std::string& b, double w);
    void removeEdge(const std::string& a, const std::string& b);
    void removeNode(const std::string& id);

    std::map<std::string, std::map<std::string, double>> adjacency_;
    size_t edge_count_ = 0;
};

} // namespace ctxguard
