#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/context_engine.hpp"
#include "graph/graph_builder.hpp"

#include <string>
#include <vector>

using namespace ctxguard;

namespace {

std::vector<InteractionEdge> interactions() {
    return {{"A", "B", 3}, {"B", "A", 2}, {"A", "C", 1},
            {"B", "C", 1}, {"C", "D", 4}};
}

PostRecord makePost(const std::string& id, uint64_t shares,
                    VerificationStatus status,
                    ArchiveStatus archive = ArchiveStatus::Pending) {
    PostRecord post;
    post.post_id = id;
    post.user_id = "user_" + id;
    post.platform = "Twitter";
    post.category = "Health";
    post.shares = shares;
    post.verification_status = status;
    post.archive_status = archive;
    return post;
}

} // namespace

// ─── Configuration ─────────────────────────────────────────────

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.min_connections, 2);
    EXPECT_EQ(config.ranking.top_n, 10);
    EXPECT_EQ(layoutName(config.layout), "force-directed");
}

TEST(EngineConfigTest, InvalidConfigRejectedAtConstruction) {
    EngineConfig negative;
    negative.min_connections = -1;
    EXPECT_THROW(ContextEngine{negative}, InvalidParameter);

    EngineConfig bad_risk;
    bad_risk.risk.base = -0.5;
    EXPECT_THROW(ContextEngine{bad_risk}, InvalidParameter);

    EngineConfig unseeded;
    unseeded.layout = RandomLayout{};
    EXPECT_THROW(ContextEngine{unseeded}, InvalidParameter);

    EngineConfig flat;
    ForceDirectedLayout zero_k;
    zero_k.k = 0.0;
    flat.layout = zero_k;
    EXPECT_THROW(ContextEngine{flat}, InvalidParameter);

    EngineConfig bad_level;
    bad_level.log_level = "chatty";
    EXPECT_THROW(ContextEngine{bad_level}, InvalidParameter);
}

TEST(EngineConfigTest, LogLevelApplied) {
    EngineConfig config;
    config.log_level = "error";
    ContextEngine engine(config);
    EXPECT_EQ(log::logger()->level(), spdlog::level::err);
    log::setLevel(spdlog::level::warn);
}

// ─── Network analysis ──────────────────────────────────────────

TEST(ContextEngineTest, NetworkReport) {
    ContextEngine engine;
    NetworkReport report = engine.analyzeNetwork(interactions());

    EXPECT_EQ(report.full_stats.node_count, 4u);
    EXPECT_EQ(report.full_stats.edge_count, 4u);
    EXPECT_DOUBLE_EQ(report.graph.weight("A", "B"), 5.0);

    // D has degree 1 and is filtered out
    EXPECT_EQ(report.stats.node_count, 3u);
    EXPECT_EQ(report.stats.edge_count, 3u);
    EXPECT_FALSE(report.filtered.hasNode("D"));

    ASSERT_EQ(report.ranking.size(), 4u);
    EXPECT_EQ(report.ranking.front().node_id, "C");  // all tie on 6, C has degree 3
    EXPECT_EQ(report.ranking[1].node_id, "A");

    EXPECT_EQ(report.positions.size(), 3u);
    EXPECT_EQ(report.positions.count("D"), 0u);
}

TEST(ContextEngineTest, FilteredPositionsComeFromFullLayout) {
    ContextEngine engine;
    NetworkReport report = engine.analyzeNetwork(interactions());

    Positions full = layout(report.graph, engine.config().layout);
    ASSERT_EQ(full.count("D"), 1u);
    ASSERT_EQ(report.positions.size(), 3u);
    for (const auto& [id, point] : report.positions) {
        EXPECT_EQ(point, full.at(id)) << id;
    }
}

TEST(ContextEngineTest, StoreAndRecordsAgree) {
    ContextEngine engine;
    EdgeStore store;
    store.addAll(interactions());

    auto from_store = engine.analyzeNetwork(store);
    auto from_records = engine.analyzeNetwork(interactions());
    EXPECT_EQ(from_store.graph, from_records.graph);
    EXPECT_EQ(from_store.ranking, from_records.ranking);
    EXPECT_EQ(from_store.positions, from_records.positions);
}

TEST(ContextEngineTest, ConfiguredLayoutAndThreshold) {
    EngineConfig config;
    config.min_connections = 0;
    config.layout = CircularLayout{};
    config.ranking.top_n = 2;
    ContextEngine engine(config);

    auto report = engine.analyzeNetwork(interactions());
    EXPECT_EQ(report.filtered, report.graph);
    EXPECT_EQ(report.positions, layout(report.graph, CircularLayout{}));
    EXPECT_EQ(report.ranking.size(), 2u);
}

TEST(ContextEngineTest, EmptyNetwork) {
    ContextEngine engine;
    auto report = engine.analyzeNetwork(std::vector<InteractionEdge>{});
    EXPECT_EQ(report.full_stats.node_count, 0u);
    EXPECT_DOUBLE_EQ(report.full_stats.density, 0.0);
    EXPECT_TRUE(report.ranking.empty());
    EXPECT_TRUE(report.positions.empty());
}

TEST(ContextEngineTest, InvalidInteractionRejected) {
    ContextEngine engine;
    std::vector<InteractionEdge> edges = {{"A", "A", 1}};
    EXPECT_THROW(engine.analyzeNetwork(edges), InvalidEdge);
}

// ─── Post analysis ─────────────────────────────────────────────

TEST(ContextEngineTest, PostReport) {
    ContextEngine engine;
    std::vector<PostRecord> posts = {
        makePost("quiet", 5, VerificationStatus::UnderReview),
        makePost("viral", 10000, VerificationStatus::VerifiedFalse),
        makePost("done", 10000, VerificationStatus::VerifiedFalse, ArchiveStatus::Archived),
    };

    PostReport report = engine.analyzePosts(posts);
    ASSERT_EQ(report.posts.size(), 3u);
    EXPECT_EQ(report.posts[0].post.post_id, "done");  // tie on score, id order
    EXPECT_EQ(report.posts[1].post.post_id, "viral");
    EXPECT_EQ(report.posts[2].post.post_id, "quiet");
    EXPECT_EQ(report.posts[1].assessment.tier, RiskTier::High);
    EXPECT_EQ(report.posts[2].assessment.tier, RiskTier::Low);

    EXPECT_EQ(report.summary.total, 3u);
    EXPECT_EQ(report.summary.archived, 1u);
    EXPECT_EQ(report.summary.high_risk, 0u);  // 79 is below the critical score

    ASSERT_EQ(report.recovery_queue.size(), 2u);
    EXPECT_EQ(report.recovery_queue[0].post.post_id, "viral");
}

TEST(ContextEngineTest, PostFilterApplied) {
    ContextEngine engine;
    std::vector<PostRecord> posts = {
        makePost("a", 10000, VerificationStatus::VerifiedFalse),
        makePost("b", 5, VerificationStatus::UnderReview),
    };
    PostFilter filter;
    filter.min_score = 50.0;

    auto report = engine.analyzePosts(posts, filter);
    ASSERT_EQ(report.posts.size(), 1u);
    EXPECT_EQ(report.posts[0].post.post_id, "a");
    EXPECT_DOUBLE_EQ(engine.score(posts[0]).score, report.posts[0].assessment.score);
}

TEST(ContextEngineTest, RecoveryQueueLimit) {
    EngineConfig config;
    config.recovery_queue_limit = 1;
    ContextEngine engine(config);

    std::vector<PostRecord> posts = {
        makePost("a", 100, VerificationStatus::Flagged),
        makePost("b", 9000, VerificationStatus::Debunked),
    };
    auto report = engine.analyzePosts(posts);
    ASSERT_EQ(report.recovery_queue.size(), 1u);
    EXPECT_EQ(report.recovery_queue[0].post.post_id, "b");
}
