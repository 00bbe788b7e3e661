#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "graph/edge_store.hpp"
#include "graph/graph.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_diff.hpp"
#include "graph/graph_snapshot.hpp"

#include <algorithm>
#include <vector>

using namespace ctxguard;

// ─── Edge Store ────────────────────────────────────────────────

TEST(EdgeStoreTest, AddKeepsArrivalOrder) {
    EdgeStore store;
    store.add("user_1", "user_2", 3);
    store.add("user_2", "user_1", 2);
    ASSERT_EQ(store.size(), 2);
    EXPECT_EQ(store.records()[0], InteractionEdge("user_1", "user_2", 3));
    EXPECT_EQ(store.records()[1], InteractionEdge("user_2", "user_1", 2));
}

TEST(EdgeStoreTest, RejectsSelfLoop) {
    EdgeStore store;
    EXPECT_THROW(store.add("user_1", "user_1", 1), InvalidEdge);
    EXPECT_EQ(store.size(), 0);
}

TEST(EdgeStoreTest, RejectsWeightBelowOne) {
    EdgeStore store;
    EXPECT_THROW(store.add("a", "b", 0.0), InvalidEdge);
    EXPECT_THROW(store.add("a", "b", -2.0), InvalidEdge);
    EXPECT_THROW(store.add("a", "b", 0.5), InvalidEdge);
    EXPECT_TRUE(store.empty());
}

TEST(EdgeStoreTest, RejectsEmptyIds) {
    EdgeStore store;
    EXPECT_THROW(store.add("", "b", 1), InvalidEdge);
    EXPECT_THROW(store.add("a", "", 1), InvalidEdge);
}

TEST(EdgeStoreTest, BatchIsAllOrNothing) {
    EdgeStore store;
    store.add("a", "b", 1);
    std::vector<InteractionEdge> batch = {{"c", "d", 2}, {"e", "e", 1}, {"f", "g", 1}};
    EXPECT_THROW(store.addAll(batch), InvalidEdge);
    EXPECT_EQ(store.size(), 1);

    batch[1] = InteractionEdge("e", "h", 1);
    store.addAll(batch);
    EXPECT_EQ(store.size(), 4);
}

TEST(EdgeStoreTest, IsolatedNodesAndClear) {
    EdgeStore store;
    store.addIsolatedNode("lurker");
    EXPECT_FALSE(store.empty());
    EXPECT_THROW(store.addIsolatedNode(""), InvalidParameter);
    store.clear();
    EXPECT_TRUE(store.empty());
}

// ─── Graph Builder ─────────────────────────────────────────────

TEST(GraphBuilderTest, MergesReversedDuplicates) {
    std::vector<InteractionEdge> edges = {{"A", "B", 3}, {"B", "A", 2}, {"A", "C", 1}};
    Graph g = GraphBuilder::build(edges);

    EXPECT_EQ(g.nodeCount(), 3);
    EXPECT_EQ(g.edgeCount(), 2);
    EXPECT_DOUBLE_EQ(g.weight("A", "B"), 5.0);
    EXPECT_DOUBLE_EQ(g.weight("B", "A"), 5.0);
    EXPECT_DOUBLE_EQ(g.weight("A", "C"), 1.0);
    EXPECT_DOUBLE_EQ(g.weight("B", "C"), 0.0);
}

TEST(GraphBuilderTest, RejectsSelfLoopWithoutBuilding) {
    std::vector<InteractionEdge> edges = {{"A", "B", 1}, {"C", "C", 1}};
    EXPECT_THROW(GraphBuilder::build(edges), InvalidEdge);
}

TEST(GraphBuilderTest, RejectsNonPositiveWeight) {
    std::vector<InteractionEdge> edges = {{"A", "B", 0}};
    EXPECT_THROW(GraphBuilder::build(edges), InvalidEdge);
}

TEST(GraphBuilderTest, IsolatedNodesHaveZeroDegree) {
    std::vector<InteractionEdge> edges = {{"A", "B", 2}};
    Graph g = GraphBuilder::build(edges, {"Z"});
    EXPECT_EQ(g.nodeCount(), 3);
    EXPECT_TRUE(g.hasNode("Z"));
    EXPECT_EQ(g.degree("Z"), 0);
    EXPECT_DOUBLE_EQ(g.weightedDegree("Z"), 0.0);
}

TEST(GraphBuilderTest, BuildFromStore) {
    EdgeStore store;
    store.add("A", "B", 1);
    store.add("B", "A", 4);
    store.addIsolatedNode("C");
    Graph g = GraphBuilder::build(store);
    EXPECT_EQ(g.nodeCount(), 3);
    EXPECT_DOUBLE_EQ(g.weight("A", "B"), 5.0);
}

TEST(GraphBuilderTest, EveryPermutationBuildsTheSameGraph) {
    std::vector<InteractionEdge> edges = {
        {"A", "B", 1.1}, {"B", "A", 2.7}, {"C", "A", 1.3},
        {"B", "C", 4.0}, {"A", "B", 1.9}};
    Graph reference = GraphBuilder::build(edges);

    std::vector<size_t> order(edges.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    do {
        std::vector<InteractionEdge> permuted;
        for (size_t i : order) permuted.push_back(edges[i]);
        EXPECT_EQ(GraphBuilder::build(permuted), reference);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST(GraphBuilderTest, PartialBuildsMergeToFullBuild) {
    std::vector<InteractionEdge> first = {{"A", "B", 3}, {"A", "C", 1}};
    std::vector<InteractionEdge> second = {{"B", "A", 2}, {"C", "D", 5}};
    std::vector<InteractionEdge> all = first;
    all.insert(all.end(), second.begin(), second.end());

    Graph a = GraphBuilder::build(first);
    Graph b = GraphBuilder::build(second);
    EXPECT_EQ(GraphBuilder::merge(a, b), GraphBuilder::build(all));
    EXPECT_EQ(GraphBuilder::merge(a, b), GraphBuilder::merge(b, a));
}

TEST(GraphBuilderTest, OverflowingMergedWeightRejected) {
    std::vector<InteractionEdge> huge = {{"a", "b", 1e308}, {"b", "a", 1e308}, {"c", "d", 1}};
    EXPECT_THROW(GraphBuilder::build(huge), InvalidEdge);

    Graph left = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 1e308}});
    Graph right = GraphBuilder::build(std::vector<InteractionEdge>{{"b", "a", 1e308}});
    EXPECT_THROW(GraphBuilder::merge(left, right), InvalidEdge);
    EXPECT_DOUBLE_EQ(GraphBuilder::merge(left, GraphBuilder::build(
                         std::vector<InteractionEdge>{{"c", "d", 2}})).weight("a", "b"),
                     1e308);
}

TEST(GraphBuilderTest, EmptyInputGivesEmptyGraph) {
    Graph g = GraphBuilder::build(std::vector<InteractionEdge>{});
    EXPECT_EQ(g.nodeCount(), 0);
    EXPECT_EQ(g.edgeCount(), 0);
}

// ─── Graph queries ─────────────────────────────────────────────

TEST(GraphTest, AdjacencyQueries) {
    std::vector<InteractionEdge> edges = {{"hub", "a", 2}, {"hub", "b", 3}, {"c", "hub", 1}};
    Graph g = GraphBuilder::build(edges);

    EXPECT_EQ(g.degree("hub"), 3);
    EXPECT_DOUBLE_EQ(g.weightedDegree("hub"), 6.0);
    EXPECT_EQ(g.getNeighborNodes("hub"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(g.degree("missing"), 0);
    EXPECT_TRUE(g.getNeighborNodes("missing").empty());
}

TEST(GraphTest, EdgesListedOnceInOrder) {
    std::vector<InteractionEdge> edges = {{"b", "a", 1}, {"c", "a", 2}};
    auto listed = GraphBuilder::build(edges).getEdges();
    ASSERT_EQ(listed.size(), 2);
    EXPECT_EQ(listed[0], InteractionEdge("a", "b", 1));
    EXPECT_EQ(listed[1], InteractionEdge("a", "c", 2));
}

TEST(GraphTest, ExtractSubgraph) {
    std::vector<InteractionEdge> edges = {{"a", "b", 1}, {"b", "c", 1}};
    Graph g = GraphBuilder::build(edges);

    Graph sub = g.extractSubgraph({"a", "b", "unknown"});
    EXPECT_EQ(sub.nodeCount(), 2);
    EXPECT_EQ(sub.edgeCount(), 1);  // only ab edge
    EXPECT_EQ(g.nodeCount(), 3);    // source untouched
}

// ─── Graph Diff ────────────────────────────────────────────────

TEST(GraphDiffTest, DetectsAddedRemovedAndReweighted) {
    Graph from = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 1}, {"b", "c", 2}});
    Graph to = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 4}, {"a", "d", 1}});

    auto delta = GraphDiff::diff(from, to);
    EXPECT_EQ(delta.added_nodes, std::vector<std::string>{"d"});
    EXPECT_EQ(delta.removed_nodes, std::vector<std::string>{"c"});
    ASSERT_EQ(delta.added_edges.size(), 1);
    EXPECT_EQ(delta.added_edges[0], InteractionEdge("a", "d", 1));
    ASSERT_EQ(delta.removed_edges.size(), 1);
    EXPECT_EQ(delta.removed_edges[0], InteractionEdge("b", "c", 2));
    ASSERT_EQ(delta.reweighted_after.size(), 1);
    EXPECT_DOUBLE_EQ(delta.reweighted_before[0].weight, 1.0);
    EXPECT_DOUBLE_EQ(delta.reweighted_after[0].weight, 4.0);
}

TEST(GraphDiffTest, ApplyAndInvert) {
    Graph from = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 1}, {"b", "c", 2}},
                                     {"lurker"});
    Graph to = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 3}, {"c", "d", 1}});

    GraphDelta delta = GraphDiff::diff(from, to);
    ASSERT_FALSE(delta.empty());
    EXPECT_EQ(GraphDiff::apply(from, delta), to);
    EXPECT_EQ(GraphDiff::apply(to, GraphDiff::invert(delta)), from);
}

TEST(GraphDiffTest, IdenticalGraphsGiveEmptyDelta) {
    Graph g = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 2}});
    EXPECT_TRUE(GraphDiff::diff(g, g).empty());
}

// ─── Snapshot Log ──────────────────────────────────────────────

TEST(SnapshotLogTest, RecordAndRestore) {
    Graph first = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 1}});
    Graph second = GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 2}, {"b", "c", 1}});
    Graph third = GraphBuilder::build(std::vector<InteractionEdge>{{"b", "c", 1}});

    SnapshotLog snapshots;
    uint64_t s1 = snapshots.record(100, first);
    uint64_t s2 = snapshots.record(130, second);
    uint64_t s3 = snapshots.record(130, third);

    EXPECT_EQ(snapshots.eventCount(), 3);
    EXPECT_EQ(snapshots.latestId(), s3);
    EXPECT_EQ(snapshots.latest(), third);
    EXPECT_EQ(snapshots.getEvent(s2)->parent_id, s1);

    EXPECT_EQ(snapshots.restore(s1), first);
    EXPECT_EQ(snapshots.restore(s2), second);
    EXPECT_EQ(snapshots.restore(s3), third);
    EXPECT_EQ(snapshots.restore(0), Graph());
}

TEST(SnapshotLogTest, EventsSince) {
    SnapshotLog snapshots;
    uint64_t s1 = snapshots.record(1, GraphBuilder::build(std::vector<InteractionEdge>{{"a", "b", 1}}));
    snapshots.record(2, GraphBuilder::build(std::vector<InteractionEdge>{{"a", "c", 1}}));

    EXPECT_EQ(snapshots.eventsSince(0).size(), 2);
    auto tail = snapshots.eventsSince(s1);
    ASSERT_EQ(tail.size(), 1);
    EXPECT_EQ(tail[0].timestamp, 2);
    EXPECT_THROW(snapshots.eventsSince(99), InvalidParameter);
}

TEST(SnapshotLogTest, RejectsTimeTravelAndUnknownIds) {
    SnapshotLog snapshots;
    snapshots.record(50, Graph());
    EXPECT_THROW(snapshots.record(49, Graph()), InvalidParameter);
    EXPECT_EQ(snapshots.eventCount(), 1);
    EXPECT_THROW(snapshots.restore(7), InvalidParameter);
}
