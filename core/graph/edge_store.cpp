#include "graph/edge_store.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <cmath>

namespace ctxguard {

void validateEdge(const InteractionEdge& edge) {
    if (edge.source.empty() || edge.target.empty()) {
        throw InvalidEdge("Edge has an empty account id");
    }
    if (edge.source == edge.target) {
        throw InvalidEdge("Self-loop on account: " + edge.source);
    }
    if (!std::isfinite(edge.weight) || edge.weight < 1.0) {
        throw InvalidEdge("Edge " + edge.source + " - " + edge.target +
                          " has weight " + std::to_string(edge.weight) +
                          ", expected a finite value >= 1");
    }
}

void EdgeStore::add(const InteractionEdge& edge) {
    try {
        validateEdge(edge);
    } catch (const InvalidEdge& e) {
        log::logger()->warn("Rejected interaction record: {}", e.what());
        throw;
    }
    records_.push_back(edge);
}

void EdgeStore::add(const std::string& source, const std::string& target, double weight) {
    add(InteractionEdge(source, target, weight));
}

void EdgeStore::addAll(const std::vector<InteractionEdge>& edges) {
    for (size_t i = 0; i < edges.size(); ++i) {
        try {
            validateEdge(edges[i]);
        } catch (const InvalidEdge& e) {
            log::logger()->warn("Rejected batch of {} records at index {}: {}",
                                edges.size(), i, e.what());
            throw;
        }
    }
    records_.insert(records_.end(), edges.begin(), edges.end());
}

void EdgeStore::addIsolatedNode(const std::string& node_id) {
    if (node_id.empty()) {
        throw InvalidParameter("Isolated node id must not be empty");
    }
    isolated_.insert(node_id);
}

void EdgeStore::clear() {
    records_.clear();
    isolated_.clear();
}

} // namespace ctxguard
