#pragma once

#include "graph/graph_diff.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace ctxguard {

/// One entry of the snapshot event stream: the delta that turns the
/// parent snapshot into this one, stamped with the time it was recorded.
struct SnapshotEvent {
    uint64_t id = 0;
    uint64_t parent_id = 0;  // 0 = empty graph
    int64_t timestamp = 0;   // caller-defined units, non-decreasing
    GraphDelta delta;
};

/// Delta-based snapshot log consumed by the presentation layer for live
/// updates. Each recorded graph is stored as the diff from the previous
/// one; any snapshot can be restored by replaying the chain.
///
/// The log is an ordinary value owned by its caller. Analysis functions
/// never consult it.
class SnapshotLog {
public:
    /// Append `graph` as the newest snapshot and return its id.
    /// Throws InvalidParameter if `timestamp` precedes the latest event.
    uint64_t record(int64_t timestamp, const Graph& graph);

    /// Events in recording order.
    const std::vector<SnapshotEvent>& events() const { return events_; }

    /// Events recorded after snapshot `id` (all events for id 0).
    std::vector<SnapshotEvent> eventsSince(uint64_t id) const;

    /// Get the delta chain from the empty graph to a snapshot.
    std::vector<GraphDelta> getDeltaChain(uint64_t snapshot_id) const;

    /// Rebuild the graph recorded as `snapshot_id` (empty graph for 0).
    /// Throws InvalidParameter for unknown ids.
    Graph restore(uint64_t snapshot_id) const;

    /// Most recent snapshot, or the empty graph when nothing is recorded.
    const Graph& latest() const { return latest_; }
    uint64_t latestId() const { return events_.empty() ? 0 : events_.back().id; }

    const SnapshotEvent* getEvent(uint64_t id) const;
    size_t eventCount() const { return events_.size(); }

private:
    uint64_t next_id_ = 1;
    std::vector<SnapshotEvent> events_;
    std::map<uint64_t, size_t> index_;  // id → position in events_
    Graph latest_;
};

} // namespace ctxguard
