#pragma once

#include "analytics/post_analytics.hpp"
#include "centrality/spreader_ranker.hpp"
#include "engine/engine_config.hpp"
#include "graph/edge_store.hpp"
#include "graph/graph.hpp"
#include "layout/layout.hpp"
#include "risk/risk.hpp"
#include "statistics/network_stats.hpp"

#include <vector>

namespace ctxguard {

/// Everything the network view of the dashboard needs for one
/// recomputation.
struct NetworkReport {
    Graph graph;                        // merged, unfiltered
    NetworkStats full_stats;
    Graph filtered;                     // min_connections applied
    NetworkStats stats;                 // of `filtered`
    std::vector<RankingEntry> ranking;  // top_n over the unfiltered graph
    Positions positions;                // full-graph layout, `filtered` nodes only
};

/// Everything the post view needs for one recomputation.
struct PostReport {
    std::vector<ScoredPost> posts;  // after the filter, highest score first
    PostSummary summary;
    std::vector<ScoredPost> recovery_queue;
};

// ─── Context Engine ────────────────────────────────────────────
// Facade over the analysis modules. Holds only its configuration; each
// call builds fresh snapshots from its arguments and shares nothing
// with earlier calls.

class ContextEngine {
public:
    explicit ContextEngine(EngineConfig config = {});

    NetworkReport analyzeNetwork(const EdgeStore& store) const;
    NetworkReport analyzeNetwork(const std::vector<InteractionEdge>& edges) const;

    /// Network report for an already built graph.
    NetworkReport analyzeGraph(const Graph& graph) const;

    PostReport analyzePosts(const std::vector<PostRecord>& posts,
                            const PostFilter& filter = {}) const;

    RiskAssessment score(const PostRecord& post) const { return scorer_.score(post); }

    const EngineConfig& config() const { return config_; }
    const RiskScorer& scorer() const { return scorer_; }
    const SpreaderRanker& ranker() const { return ranker_; }

private:
    EngineConfig config_;
    RiskScorer scorer_;
    SpreaderRanker ranker_;
};

} // namespace ctxguard
