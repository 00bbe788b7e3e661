#pragma once

#include "centrality/spreader_ranker.hpp"
#include "layout/layout.hpp"
#include "risk/risk.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ctxguard {

/// Engine configuration parameters. Every field has a usable default.
struct EngineConfig {
    RiskWeights risk;
    RankingConfig ranking;
    int min_connections = 2;                    // filter threshold
    LayoutSpec layout = ForceDirectedLayout{};  // k 3.0, 100 iterations, seed 42
    size_t recovery_queue_limit = 5;

    // Applied to the shared logger when the engine is constructed
    std::optional<std::string> log_level;

    /// Throws InvalidParameter if any part is out of range.
    void validate() const;
};

} // namespace ctxguard
