#include "graph/graph.hpp"

namespace ctxguard {

namespace {
const std::map<std::string, double> kNoNeighbors;
} // namespace

// ─── Nodes ─────────────────────────────────────────────────────

std::vector<std::string> Graph::getNodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(adjacency_.size());
    for (const auto& [id, _] : adjacency_) {
        ids.push_back(id);
    }
    return ids;
}

void Graph::addNode(const std::string& id) {
    adjacency_[id];  // ensure entry exists
}

void Graph::removeNode(const std::string& id) {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return;

    for (const auto& [neighbor, _] : it->second) {
        adjacency_[neighbor].erase(id);
        --edge_count_;
    }
    adjacency_.erase(it);
}

// ─── Edges ─────────────────────────────────────────────────────

bool Graph::hasEdge(const std::string& a, const std::string& b) const {
    auto it = adjacency_.find(a);
    if (it == adjacency_.end()) return false;
    return it->second.count(b) > 0;
}

double Graph::weight(const std::string& a, const std::string& b) const {
    auto it = adjacency_.find(a);
    if (it == adjacency_.end()) return 0.0;
    auto jt = it->second.find(b);
    return jt != it->second.end() ? jt->second : 0.0;
}

std::vector<InteractionEdge> Graph::getEdges() const {
    std::vector<InteractionEdge> edges;
    edges.reserve(edge_count_);
    forEachEdge([&](const InteractionEdge& e) { edges.push_back(e); });
    return edges;
}

void Graph::addWeight(const std::string& a, const std::string& b, double w) {
    auto& row = adjacency_[a];
    auto it = row.find(b);
    if (it == row.end()) {
        row.emplace(b, w);
        adjacency_[b].emplace(a, w);
        ++edge_count_;
    } else {
        it->second += w;
        adjacency_[b][a] = it->second;
    }
}

void Graph::setWeight(const std::string& a, const std::string& b, double w) {
    auto& row = adjacency_[a];
    if (!row.count(b)) ++edge_count_;
    row[b] = w;
    adjacency_[b][a] = w;
}

void Graph::removeEdge(const std::string& a, const std::string& b) {
    auto it = adjacency_.find(a);
    if (it == adjacency_.end() || !it->second.erase(b)) return;
    adjacency_[b].erase(a);
    --edge_count_;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<std::string> Graph::getNeighborNodes(const std::string& id) const {
    std::vector<std::string> result;
    for (const auto& [neighbor, _] : neighbors(id)) {
        result.push_back(neighbor);
    }
    return result;
}

const std::map<std::string, double>& Graph::neighbors(const std::string& id) const {
    auto it = adjacency_.find(id);
    return it != adjacency_.end() ? it->second : kNoNeighbors;
}

size_t Graph::degree(const std::string& id) const {
    return neighbors(id).size();
}

double Graph::weightedDegree(const std::string& id) const {
    double total = 0.0;
    for (const auto& [_, w] : neighbors(id)) {
        total += w;
    }
    return total;
}

// ─── Subgraph extraction ──────────────────────────────────────

Graph Graph::extractSubgraph(const std::set<std::string>& node_ids) const {
    Graph sub;
    for (const auto& id : node_ids) {
        if (hasNode(id)) sub.addNode(id);
    }
    forEachEdge([&](const InteractionEdge& e) {
        if (sub.hasNode(e.source) && sub.hasNode(e.target)) {
            sub.setWeight(e.source, e.target, e.weight);
        }
    });
    return sub;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const std::string&)>& fn) const {
    for (const auto& [id, _] : adjacency_) {
        fn(id);
    }
}

void Graph::forEachEdge(const std::function<void(const InteractionEdge&)>& fn) const {
    for (const auto& [source, row] : adjacency_) {
        for (const auto& [target, w] : row) {
            if (source < target) {
                fn(InteractionEdge(source, target, w));
            }
        }
    }
}

} // namespace ctxguard
