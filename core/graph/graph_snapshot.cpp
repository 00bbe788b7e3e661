#include "graph/graph_snapshot.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>

namespace ctxguard {

uint64_t SnapshotLog::record(int64_t timestamp, const Graph& graph) {
    if (!events_.empty() && timestamp < events_.back().timestamp) {
        throw InvalidParameter("Snapshot timestamp " + std::to_string(timestamp) +
                               " precedes latest " +
                               std::to_string(events_.back().timestamp));
    }

    SnapshotEvent event;
    event.id = next_id_++;
    event.parent_id = latestId();
    event.timestamp = timestamp;
    event.delta = GraphDiff::diff(latest_, graph);

    log::logger()->debug("Snapshot {} at {}: +{} / -{} nodes, +{} / -{} edges",
                         event.id, timestamp,
                         event.delta.added_nodes.size(), event.delta.removed_nodes.size(),
                         event.delta.added_edges.size(), event.delta.removed_edges.size());

    index_[event.id] = events_.size();
    events_.push_back(std::move(event));
    latest_ = graph;
    return events_.back().id;
}

std::vector<SnapshotEvent> SnapshotLog::eventsSince(uint64_t id) const {
    if (id == 0) return events_;
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw InvalidParameter("Snapshot not found: " + std::to_string(id));
    }
    return std::vector<SnapshotEvent>(events_.begin() + it->second + 1, events_.end());
}

std::vector<GraphDelta> SnapshotLog::getDeltaChain(uint64_t snapshot_id) const {
    std::vector<GraphDelta> chain;
    uint64_t current = snapshot_id;

    while (current != 0) {
        const SnapshotEvent* event = getEvent(current);
        if (!event) {
            throw InvalidParameter("Snapshot not found: " + std::to_string(current));
        }
        chain.push_back(event->delta);
        current = event->parent_id;
    }

    // Reverse to get root → snapshot order
    std::reverse(chain.begin(), chain.end());
    return chain;
}

Graph SnapshotLog::restore(uint64_t snapshot_id) const {
    Graph g;
    for (const auto& delta : getDeltaChain(snapshot_id)) {
        g = GraphDiff::apply(g, delta);
    }
    return g;
}

const SnapshotEvent* SnapshotLog::getEvent(uint64_t id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &events_[it->second] : nullptr;
}

} // namespace ctxguard
