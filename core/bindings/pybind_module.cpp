// PyBind11 bindings for the ctxguard C++ core.
// Exposes graph building, spreader ranking, filtering, layout, risk
// scoring and post analytics to the Python presentation layer.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DCTXGUARD_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "analytics/post_analytics.hpp"
#include "centrality/centrality.hpp"
#include "centrality/spreader_ranker.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/context_engine.hpp"
#include "graph/edge_store.hpp"
#include "graph/graph.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_diff.hpp"
#include "graph/graph_snapshot.hpp"
#include "layout/layout.hpp"
#include "risk/default_risk.hpp"
#include "risk/risk.hpp"
#include "statistics/network_stats.hpp"

namespace py = pybind11;

PYBIND11_MODULE(ctxguard_bindings, m) {
    m.doc() = "Context Graph & Risk Scoring Engine bindings";

    // ── Errors ──
    auto base_error = py::register_exception<ctxguard::Error>(m, "Error", PyExc_ValueError);
    py::register_exception<ctxguard::InvalidEdge>(m, "InvalidEdge", base_error.ptr());
    py::register_exception<ctxguard::UnsupportedLayout>(m, "UnsupportedLayout", base_error.ptr());
    py::register_exception<ctxguard::InvalidParameter>(m, "InvalidParameter", base_error.ptr());

    m.def("set_log_level",
          py::overload_cast<const std::string&>(&ctxguard::log::setLevel),
          py::arg("level"));

    // ── InteractionEdge ──
    py::class_<ctxguard::InteractionEdge>(m, "InteractionEdge")
        .def(py::init<>())
        .def(py::init<std::string, std::string, double>(),
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def_readwrite("source", &ctxguard::InteractionEdge::source)
        .def_readwrite("target", &ctxguard::InteractionEdge::target)
        .def_readwrite("weight", &ctxguard::InteractionEdge::weight);

    // ── EdgeStore ──
    py::class_<ctxguard::EdgeStore>(m, "EdgeStore")
        .def(py::init<>())
        .def("add", py::overload_cast<const std::string&, const std::string&, double>(
                 &ctxguard::EdgeStore::add),
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def("add_all", &ctxguard::EdgeStore::addAll)
        .def("add_isolated_node", &ctxguard::EdgeStore::addIsolatedNode)
        .def("records", &ctxguard::EdgeStore::records)
        .def("isolated_nodes", &ctxguard::EdgeStore::isolatedNodes)
        .def("size", &ctxguard::EdgeStore::size)
        .def("clear", &ctxguard::EdgeStore::clear);

    // ── Graph ──
    py::class_<ctxguard::Graph>(m, "Graph")
        .def(py::init<>())
        .def("has_node", &ctxguard::Graph::hasNode)
        .def("get_node_ids", &ctxguard::Graph::getNodeIds)
        .def("node_count", &ctxguard::Graph::nodeCount)
        .def("has_edge", &ctxguard::Graph::hasEdge)
        .def("weight", &ctxguard::Graph::weight)
        .def("edge_count", &ctxguard::Graph::edgeCount)
        .def("get_edges", &ctxguard::Graph::getEdges)
        .def("get_neighbor_nodes", &ctxguard::Graph::getNeighborNodes)
        .def("degree", &ctxguard::Graph::degree)
        .def("weighted_degree", &ctxguard::Graph::weightedDegree)
        .def("extract_subgraph", &ctxguard::Graph::extractSubgraph)
        .def("__eq__", &ctxguard::Graph::operator==);

    py::class_<ctxguard::GraphBuilder>(m, "GraphBuilder")
        .def_static("build", py::overload_cast<const std::vector<ctxguard::InteractionEdge>&,
                                               const std::set<std::string>&>(
                        &ctxguard::GraphBuilder::build),
                    py::arg("edges"), py::arg("isolated_nodes") = std::set<std::string>{})
        .def_static("build_store", py::overload_cast<const ctxguard::EdgeStore&>(
                        &ctxguard::GraphBuilder::build))
        .def_static("merge", &ctxguard::GraphBuilder::merge);

    // ── GraphDelta / SnapshotLog ──
    py::class_<ctxguard::GraphDelta>(m, "GraphDelta")
        .def(py::init<>())
        .def("empty", &ctxguard::GraphDelta::empty)
        .def_readwrite("added_nodes", &ctxguard::GraphDelta::added_nodes)
        .def_readwrite("removed_nodes", &ctxguard::GraphDelta::removed_nodes)
        .def_readwrite("added_edges", &ctxguard::GraphDelta::added_edges)
        .def_readwrite("removed_edges", &ctxguard::GraphDelta::removed_edges)
        .def_readwrite("reweighted_before", &ctxguard::GraphDelta::reweighted_before)
        .def_readwrite("reweighted_after", &ctxguard::GraphDelta::reweighted_after);

    m.def("graph_diff", &ctxguard::GraphDiff::diff, py::arg("from"), py::arg("to"));
    m.def("graph_apply", &ctxguard::GraphDiff::apply, py::arg("graph"), py::arg("delta"));

    py::class_<ctxguard::SnapshotEvent>(m, "SnapshotEvent")
        .def_readonly("id", &ctxguard::SnapshotEvent::id)
        .def_readonly("parent_id", &ctxguard::SnapshotEvent::parent_id)
        .def_readonly("timestamp", &ctxguard::SnapshotEvent::timestamp)
        .def_readonly("delta", &ctxguard::SnapshotEvent::delta);

    py::class_<ctxguard::SnapshotLog>(m, "SnapshotLog")
        .def(py::init<>())
        .def("record", &ctxguard::SnapshotLog::record, py::arg("timestamp"), py::arg("graph"))
        .def("events", &ctxguard::SnapshotLog::events)
        .def("events_since", &ctxguard::SnapshotLog::eventsSince)
        .def("restore", &ctxguard::SnapshotLog::restore)
        .def("latest", &ctxguard::SnapshotLog::latest)
        .def("latest_id", &ctxguard::SnapshotLog::latestId);

    // ── Ranking ──
    py::enum_<ctxguard::SpreaderTier>(m, "SpreaderTier")
        .value("High", ctxguard::SpreaderTier::High)
        .value("Medium", ctxguard::SpreaderTier::Medium)
        .value("Low", ctxguard::SpreaderTier::Low);

    py::class_<ctxguard::RankingEntry>(m, "RankingEntry")
        .def_readonly("node_id", &ctxguard::RankingEntry::node_id)
        .def_readonly("degree", &ctxguard::RankingEntry::degree)
        .def_readonly("weighted_degree", &ctxguard::RankingEntry::weighted_degree)
        .def_readonly("centrality", &ctxguard::RankingEntry::centrality)
        .def_readonly("tier", &ctxguard::RankingEntry::tier);

    py::class_<ctxguard::RankingConfig>(m, "RankingConfig")
        .def(py::init<>())
        .def_readwrite("top_n", &ctxguard::RankingConfig::top_n)
        .def_readwrite("high_fraction", &ctxguard::RankingConfig::high_fraction)
        .def_readwrite("medium_fraction", &ctxguard::RankingConfig::medium_fraction);

    py::class_<ctxguard::SpreaderRanker>(m, "SpreaderRanker")
        .def(py::init<ctxguard::RankingConfig>(), py::arg("config") = ctxguard::RankingConfig{})
        .def("rank", py::overload_cast<const ctxguard::Graph&, int>(
                 &ctxguard::SpreaderRanker::rank, py::const_),
             py::arg("graph"), py::arg("top_n"))
        .def("rank_all", &ctxguard::SpreaderRanker::rankAll);

    m.def("compute_centrality",
          py::overload_cast<const ctxguard::Graph&>(&ctxguard::computeCentrality));

    // ── Statistics ──
    py::class_<ctxguard::NetworkStats>(m, "NetworkStats")
        .def_readonly("node_count", &ctxguard::NetworkStats::node_count)
        .def_readonly("edge_count", &ctxguard::NetworkStats::edge_count)
        .def_readonly("density", &ctxguard::NetworkStats::density)
        .def_readonly("avg_degree", &ctxguard::NetworkStats::avg_degree);

    m.def("compute_stats", &ctxguard::computeStats);
    m.def("filter_and_stats", [](const ctxguard::Graph& graph, int min_connections) {
        auto result = ctxguard::filterAndStats(graph, min_connections);
        return py::make_tuple(result.subgraph, result.stats);
    }, py::arg("graph"), py::arg("min_connections"));

    // ── Layout ──
    py::class_<ctxguard::Point2D>(m, "Point2D")
        .def_readonly("x", &ctxguard::Point2D::x)
        .def_readonly("y", &ctxguard::Point2D::y);

    py::class_<ctxguard::ForceDirectedLayout>(m, "ForceDirectedLayout")
        .def(py::init<>())
        .def_readwrite("k", &ctxguard::ForceDirectedLayout::k)
        .def_readwrite("iterations", &ctxguard::ForceDirectedLayout::iterations)
        .def_readwrite("seed", &ctxguard::ForceDirectedLayout::seed);
    py::class_<ctxguard::CircularLayout>(m, "CircularLayout")
        .def(py::init<>())
        .def_readwrite("radius", &ctxguard::CircularLayout::radius);
    py::class_<ctxguard::RandomLayout>(m, "RandomLayout")
        .def(py::init<>())
        .def_readwrite("seed", &ctxguard::RandomLayout::seed);
    py::class_<ctxguard::StressLayout>(m, "StressLayout")
        .def(py::init<>())
        .def_readwrite("iterations", &ctxguard::StressLayout::iterations)
        .def_readwrite("tolerance", &ctxguard::StressLayout::tolerance);

    m.def("layout", &ctxguard::layout, py::arg("graph"), py::arg("spec"));
    m.def("layout_by_name", [](const ctxguard::Graph& graph, const std::string& name,
                               std::optional<uint64_t> seed) {
        return ctxguard::layout(graph, ctxguard::makeLayoutSpec(name, seed));
    }, py::arg("graph"), py::arg("algorithm"), py::arg("seed") = std::nullopt);

    // ── Risk scoring ──
    py::enum_<ctxguard::VerificationStatus>(m, "VerificationStatus")
        .value("UnderReview", ctxguard::VerificationStatus::UnderReview)
        .value("Disputed", ctxguard::VerificationStatus::Disputed)
        .value("Flagged", ctxguard::VerificationStatus::Flagged)
        .value("FactChecked", ctxguard::VerificationStatus::FactChecked)
        .value("Debunked", ctxguard::VerificationStatus::Debunked)
        .value("VerifiedFalse", ctxguard::VerificationStatus::VerifiedFalse);
    m.def("parse_verification_status", &ctxguard::parseVerificationStatus);

    py::enum_<ctxguard::ArchiveStatus>(m, "ArchiveStatus")
        .value("Pending", ctxguard::ArchiveStatus::Pending)
        .value("Archived", ctxguard::ArchiveStatus::Archived);

    py::enum_<ctxguard::RiskTier>(m, "RiskTier")
        .value("High", ctxguard::RiskTier::High)
        .value("Medium", ctxguard::RiskTier::Medium)
        .value("Low", ctxguard::RiskTier::Low);

    py::class_<ctxguard::PostRecord>(m, "PostRecord")
        .def(py::init<>())
        .def_readwrite("post_id", &ctxguard::PostRecord::post_id)
        .def_readwrite("user_id", &ctxguard::PostRecord::user_id)
        .def_readwrite("platform", &ctxguard::PostRecord::platform)
        .def_readwrite("category", &ctxguard::PostRecord::category)
        .def_readwrite("content", &ctxguard::PostRecord::content)
        .def_readwrite("timestamp", &ctxguard::PostRecord::timestamp)
        .def_readwrite("shares", &ctxguard::PostRecord::shares)
        .def_readwrite("likes", &ctxguard::PostRecord::likes)
        .def_readwrite("comments", &ctxguard::PostRecord::comments)
        .def_readwrite("views", &ctxguard::PostRecord::views)
        .def_readwrite("verification_status", &ctxguard::PostRecord::verification_status)
        .def_readwrite("archive_status", &ctxguard::PostRecord::archive_status)
        .def_readwrite("archive_url", &ctxguard::PostRecord::archive_url);

    py::class_<ctxguard::RiskBreakdown>(m, "RiskBreakdown")
        .def_readonly("shares", &ctxguard::RiskBreakdown::shares)
        .def_readonly("views", &ctxguard::RiskBreakdown::views)
        .def_readonly("comments", &ctxguard::RiskBreakdown::comments)
        .def_readonly("likes", &ctxguard::RiskBreakdown::likes)
        .def_readonly("status_multiplier", &ctxguard::RiskBreakdown::status_multiplier)
        .def("engagement", &ctxguard::RiskBreakdown::engagement);

    py::class_<ctxguard::RiskAssessment>(m, "RiskAssessment")
        .def_readonly("score", &ctxguard::RiskAssessment::score)
        .def_readonly("tier", &ctxguard::RiskAssessment::tier)
        .def_readonly("breakdown", &ctxguard::RiskAssessment::breakdown);

    py::class_<ctxguard::RiskWeights>(m, "RiskWeights")
        .def(py::init<>())
        .def_readwrite("shares", &ctxguard::RiskWeights::shares)
        .def_readwrite("views", &ctxguard::RiskWeights::views)
        .def_readwrite("comments", &ctxguard::RiskWeights::comments)
        .def_readwrite("likes", &ctxguard::RiskWeights::likes)
        .def_readwrite("shares_reference", &ctxguard::RiskWeights::shares_reference)
        .def_readwrite("views_reference", &ctxguard::RiskWeights::views_reference)
        .def_readwrite("comments_reference", &ctxguard::RiskWeights::comments_reference)
        .def_readwrite("likes_reference", &ctxguard::RiskWeights::likes_reference)
        .def_readwrite("base", &ctxguard::RiskWeights::base)
        .def_readwrite("under_review", &ctxguard::RiskWeights::under_review)
        .def_readwrite("disputed", &ctxguard::RiskWeights::disputed)
        .def_readwrite("flagged", &ctxguard::RiskWeights::flagged)
        .def_readwrite("fact_checked", &ctxguard::RiskWeights::fact_checked)
        .def_readwrite("debunked", &ctxguard::RiskWeights::debunked)
        .def_readwrite("verified_false", &ctxguard::RiskWeights::verified_false)
        .def_readwrite("high_threshold", &ctxguard::RiskWeights::high_threshold)
        .def_readwrite("medium_threshold", &ctxguard::RiskWeights::medium_threshold)
        .def("multiplier", &ctxguard::RiskWeights::multiplier)
        .def("validate", &ctxguard::RiskWeights::validate);

    py::class_<ctxguard::RiskScorer>(m, "RiskScorer")
        .def(py::init([](const ctxguard::RiskWeights& weights) {
                 return ctxguard::makeDefaultRiskScorer(weights);
             }),
             py::arg("weights") = ctxguard::RiskWeights{})
        .def("score", &ctxguard::RiskScorer::score)
        .def("classify", &ctxguard::RiskScorer::classify);

    // ── Post analytics ──
    py::class_<ctxguard::ScoredPost>(m, "ScoredPost")
        .def_readonly("post", &ctxguard::ScoredPost::post)
        .def_readonly("assessment", &ctxguard::ScoredPost::assessment);

    py::class_<ctxguard::PostFilter>(m, "PostFilter")
        .def(py::init<>())
        .def_readwrite("platforms", &ctxguard::PostFilter::platforms)
        .def_readwrite("categories", &ctxguard::PostFilter::categories)
        .def_readwrite("min_score", &ctxguard::PostFilter::min_score);

    py::enum_<ctxguard::PostSortKey>(m, "PostSortKey")
        .value("Timestamp", ctxguard::PostSortKey::Timestamp)
        .value("Score", ctxguard::PostSortKey::Score)
        .value("Shares", ctxguard::PostSortKey::Shares);

    py::class_<ctxguard::PostSummary>(m, "PostSummary")
        .def_readonly("total", &ctxguard::PostSummary::total)
        .def_readonly("high_risk", &ctxguard::PostSummary::high_risk)
        .def_readonly("archived", &ctxguard::PostSummary::archived)
        .def_readonly("active_spreaders", &ctxguard::PostSummary::active_spreaders)
        .def_readonly("by_platform", &ctxguard::PostSummary::by_platform)
        .def_readonly("by_category", &ctxguard::PostSummary::by_category)
        .def_readonly("by_status", &ctxguard::PostSummary::by_status);

    m.def("score_posts", &ctxguard::scorePosts);
    m.def("filter_posts", &ctxguard::filterPosts);
    m.def("sort_posts", &ctxguard::sortPosts);
    m.def("summarize", &ctxguard::summarize,
          py::arg("posts"), py::arg("critical_score") = ctxguard::kCriticalScore);
    m.def("recovery_queue", &ctxguard::recoveryQueue);

    py::class_<ctxguard::HistogramBin>(m, "HistogramBin")
        .def_readonly("lower", &ctxguard::HistogramBin::lower)
        .def_readonly("upper", &ctxguard::HistogramBin::upper)
        .def_readonly("count", &ctxguard::HistogramBin::count);

    py::class_<ctxguard::ContentCount>(m, "ContentCount")
        .def_readonly("content", &ctxguard::ContentCount::content)
        .def_readonly("count", &ctxguard::ContentCount::count);

    m.def("posts_per_day", &ctxguard::postsPerDay);
    m.def("score_histogram", &ctxguard::scoreHistogram,
          py::arg("posts"), py::arg("bins") = ctxguard::kScoreHistogramBins);
    m.def("search_posts", &ctxguard::searchPosts, py::arg("posts"), py::arg("term"));
    m.def("top_content", &ctxguard::topContent,
          py::arg("posts"), py::arg("limit") = ctxguard::kTopContentCount);

    // ── Engine ──
    py::class_<ctxguard::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("risk", &ctxguard::EngineConfig::risk)
        .def_readwrite("ranking", &ctxguard::EngineConfig::ranking)
        .def_readwrite("min_connections", &ctxguard::EngineConfig::min_connections)
        .def_readwrite("layout", &ctxguard::EngineConfig::layout)
        .def_readwrite("recovery_queue_limit", &ctxguard::EngineConfig::recovery_queue_limit)
        .def_readwrite("log_level", &ctxguard::EngineConfig::log_level);

    py::class_<ctxguard::NetworkReport>(m, "NetworkReport")
        .def_readonly("graph", &ctxguard::NetworkReport::graph)
        .def_readonly("full_stats", &ctxguard::NetworkReport::full_stats)
        .def_readonly("filtered", &ctxguard::NetworkReport::filtered)
        .def_readonly("stats", &ctxguard::NetworkReport::stats)
        .def_readonly("ranking", &ctxguard::NetworkReport::ranking)
        .def_readonly("positions", &ctxguard::NetworkReport::positions);

    py::class_<ctxguard::PostReport>(m, "PostReport")
        .def_readonly("posts", &ctxguard::PostReport::posts)
        .def_readonly("summary", &ctxguard::PostReport::summary)
        .def_readonly("recovery_queue", &ctxguard::PostReport::recovery_queue);

    py::class_<ctxguard::ContextEngine>(m, "ContextEngine")
        .def(py::init<ctxguard::EngineConfig>(), py::arg("config") = ctxguard::EngineConfig{})
        .def("analyze_network", py::overload_cast<const std::vector<ctxguard::InteractionEdge>&>(
                 &ctxguard::ContextEngine::analyzeNetwork, py::const_))
        .def("analyze_store", py::overload_cast<const ctxguard::EdgeStore&>(
                 &ctxguard::ContextEngine::analyzeNetwork, py::const_))
        .def("analyze_graph", &ctxguard::ContextEngine::analyzeGraph)
        .def("analyze_posts", &ctxguard::ContextEngine::analyzePosts,
             py::arg("posts"), py::arg("filter") = ctxguard::PostFilter{})
        .def("score", &ctxguard::ContextEngine::score);
}
