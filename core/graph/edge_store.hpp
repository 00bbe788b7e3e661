#pragma once

#include "graph/edge.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace ctxguard {

// ─── EdgeStore ─────────────────────────────────────────────────
// Holds validated raw interaction records in arrival order, plus the
// accounts that appear in post data without any interaction.
// Records are never merged here; merging is the GraphBuilder's job.

class EdgeStore {
public:
    EdgeStore() = default;

    /// Validate and append one record. Throws InvalidEdge; the store is
    /// unchanged on failure.
    void add(const InteractionEdge& edge);
    void add(const std::string& source, const std::string& target, double weight = 1.0);

    /// Validate every record, then append them all. One bad record
    /// rejects the whole batch.
    void addAll(const std::vector<InteractionEdge>& edges);

    /// Register an account with no interactions.
    void addIsolatedNode(const std::string& node_id);

    const std::vector<InteractionEdge>& records() const { return records_; }
    const std::set<std::string>& isolatedNodes() const { return isolated_; }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty() && isolated_.empty(); }
    void clear();

private:
    std::vector<InteractionEdge> records_;
    std::set<std::string> isolated_;
};

} // namespace ctxguard
