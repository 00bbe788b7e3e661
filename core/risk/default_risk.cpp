#include "risk/default_risk.hpp"
#include "risk/engagement_signal.hpp"

namespace ctxguard {

RiskScorer makeDefaultRiskScorer(const RiskWeights& weights) {
    RiskScorer scorer(weights);
    scorer.addSignal(std::make_unique<EngagementSignal>(EngagementMetric::Shares,
                                                        weights.shares_reference));
    scorer.addSignal(std::make_unique<EngagementSignal>(EngagementMetric::Views,
                                                        weights.views_reference));
    scorer.addSignal(std::make_unique<EngagementSignal>(EngagementMetric::Comments,
                                                        weights.comments_reference));
    scorer.addSignal(std::make_unique<EngagementSignal>(EngagementMetric::Likes,
                                                        weights.likes_reference));
    return scorer;
}

} // namespace ctxguard
