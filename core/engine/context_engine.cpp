#include "engine/context_engine.hpp"
#include "common/logging.hpp"
#include "graph/graph_builder.hpp"
#include "risk/default_risk.hpp"

#include <string>
#include <utility>

namespace ctxguard {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

ContextEngine::ContextEngine(EngineConfig config)
    : config_(validated(config)),
      scorer_(makeDefaultRiskScorer(config_.risk)),
      ranker_(config_.ranking) {
    if (config_.log_level) {
        log::setLevel(*config_.log_level);
    }
}

NetworkReport ContextEngine::analyzeNetwork(const EdgeStore& store) const {
    return analyzeGraph(GraphBuilder::build(store));
}

NetworkReport ContextEngine::analyzeNetwork(const std::vector<InteractionEdge>& edges) const {
    return analyzeGraph(GraphBuilder::build(edges));
}

NetworkReport ContextEngine::analyzeGraph(const Graph& graph) const {
    NetworkReport report;
    report.graph = graph;
    report.full_stats = computeStats(graph);

    auto filtered = filterAndStats(graph, config_.min_connections);
    report.filtered = std::move(filtered.subgraph);
    report.stats = filtered.stats;

    report.ranking = ranker_.rank(graph);
    // Full-network layout, restricted to the filtered nodes
    Positions full_positions = layout(graph, config_.layout);
    report.filtered.forEachNode([&](const std::string& id) {
        report.positions.emplace(id, full_positions.at(id));
    });

    log::logger()->info("Network analysis: {} nodes, {} edges, {} after filter, top spreader {}",
                        report.full_stats.node_count, report.full_stats.edge_count,
                        report.stats.node_count,
                        report.ranking.empty() ? std::string("-") : report.ranking.front().node_id);
    return report;
}

PostReport ContextEngine::analyzePosts(const std::vector<PostRecord>& posts,
                                       const PostFilter& filter) const {
    PostReport report;
    auto scored = scorePosts(scorer_, posts);
    report.posts = sortPosts(filterPosts(scored, filter), PostSortKey::Score);
    report.summary = summarize(report.posts);
    report.recovery_queue = recoveryQueue(report.posts, config_.recovery_queue_limit);

    log::logger()->info("Post analysis: {} of {} posts selected, {} critical",
                        report.summary.total, posts.size(), report.summary.high_risk);
    return report;
}

} // namespace ctxguard
