#pragma once

#include "risk/risk.hpp"

namespace ctxguard {

/// Scorer with the four engagement signals, scaled by `weights`.
RiskScorer makeDefaultRiskScorer(const RiskWeights& weights = {});

} // namespace ctxguard
