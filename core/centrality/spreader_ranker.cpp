#include "centrality/spreader_ranker.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cmath>

namespace ctxguard {

namespace {

// Band size for a population fraction. The epsilon keeps products such
// as 30 * 0.1 from rounding up to an extra node.
size_t bandSize(size_t population, double fraction) {
    double raw = static_cast<double>(population) * fraction;
    auto count = static_cast<size_t>(std::ceil(raw - 1e-9));
    return std::min(count, population);
}

} // namespace

void RankingConfig::validate() const {
    if (top_n < 1) {
        throw InvalidParameter("top_n must be >= 1, got " + std::to_string(top_n));
    }
    if (high_fraction < 0.0 || medium_fraction < 0.0 ||
        high_fraction + medium_fraction > 1.0) {
        throw InvalidParameter("Tier fractions must be non-negative and sum to at most 1");
    }
}

SpreaderRanker::SpreaderRanker(RankingConfig config)
    : config_(config) {
    config_.validate();
}

bool SpreaderRanker::ranksBefore(const RankingEntry& a, const RankingEntry& b) {
    if (a.weighted_degree != b.weighted_degree) {
        return a.weighted_degree > b.weighted_degree;
    }
    if (a.degree != b.degree) {
        return a.degree > b.degree;
    }
    return a.node_id < b.node_id;
}

std::vector<RankingEntry> SpreaderRanker::rankAll(const Graph& graph) const {
    auto ranked = computeCentrality(graph);
    std::sort(ranked.begin(), ranked.end(), ranksBefore);
    assignTiers(ranked);
    return ranked;
}

std::vector<RankingEntry> SpreaderRanker::rank(const Graph& graph, int top_n) const {
    if (top_n < 1) {
        throw InvalidParameter("top_n must be >= 1, got " + std::to_string(top_n));
    }

    // Tiers depend on the whole population, so rank everything first
    auto ranked = rankAll(graph);
    if (ranked.size() > static_cast<size_t>(top_n)) {
        ranked.resize(static_cast<size_t>(top_n));
    }

    log::logger()->debug("Ranked {} of {} nodes", ranked.size(), graph.nodeCount());
    return ranked;
}

std::vector<RankingEntry> SpreaderRanker::rank(const Graph& graph) const {
    return rank(graph, config_.top_n);
}

void SpreaderRanker::assignTiers(std::vector<RankingEntry>& ranked) const {
    size_t n = ranked.size();
    size_t high_count = bandSize(n, config_.high_fraction);
    size_t medium_end = bandSize(n, config_.high_fraction + config_.medium_fraction);

    // Nodes tying with the last member of a band join that band
    double high_cutoff = high_count > 0 ? ranked[high_count - 1].weighted_degree
                                        : HUGE_VAL;
    double medium_cutoff = medium_end > high_count ? ranked[medium_end - 1].weighted_degree
                                                   : HUGE_VAL;

    for (auto& entry : ranked) {
        if (entry.weighted_degree <= 0.0) {
            entry.tier = SpreaderTier::Low;
        } else if (entry.weighted_degree >= high_cutoff) {
            entry.tier = SpreaderTier::High;
        } else if (entry.weighted_degree >= medium_cutoff) {
            entry.tier = SpreaderTier::Medium;
        } else {
            entry.tier = SpreaderTier::Low;
        }
    }
}

} // namespace ctxguard
