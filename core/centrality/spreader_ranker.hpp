#pragma once

#include "centrality/centrality.hpp"

#include <vector>

namespace ctxguard {

/// Population fractions used for tier assignment. The first
/// `high_fraction` of the ranking is High, the next `medium_fraction`
/// is Medium, the remainder Low.
struct RankingConfig {
    int top_n = 10;
    double high_fraction = 0.1;
    double medium_fraction = 0.2;

    /// Throws InvalidParameter on top_n < 1 or fractions outside [0, 1]
    /// whose sum exceeds 1.
    void validate() const;
};

// ─── Spreader Ranker ───────────────────────────────────────────
// Orders accounts by weighted degree and classifies them into tiers
// relative to the current node population.
//
// Order: weighted_degree desc, degree desc, node_id asc. The last key
// is unique per node, so the order is total and reproducible.

class SpreaderRanker {
public:
    explicit SpreaderRanker(RankingConfig config = {});

    /// Ranked and tiered entries for the `top_n` strongest spreaders
    /// (all nodes when the graph is smaller). Throws InvalidParameter
    /// for top_n < 1.
    std::vector<RankingEntry> rank(const Graph& graph, int top_n) const;

    /// rank() with the configured top_n.
    std::vector<RankingEntry> rank(const Graph& graph) const;

    /// Every node, ranked and tiered.
    std::vector<RankingEntry> rankAll(const Graph& graph) const;

    /// Strict weak ordering used by rank(); true if `a` ranks before `b`.
    static bool ranksBefore(const RankingEntry& a, const RankingEntry& b);

    const RankingConfig& config() const { return config_; }

private:
    RankingConfig config_;

    void assignTiers(std::vector<RankingEntry>& ranked) const;
};

} // namespace ctxguard
