#pragma once

#include "risk/risk.hpp"

namespace ctxguard {

enum class EngagementMetric { Shares, Views, Comments, Likes };

/// Log-scaled engagement: min(1, log1p(x) / log1p(reference)).
/// Non-decreasing in x, saturating at the reference scale.
class EngagementSignal : public RiskSignal {
public:
    EngagementSignal(EngagementMetric metric, double reference);

    double compute(const PostRecord& post) const override;
    std::string name() const override;

    EngagementMetric metric() const { return metric_; }
    double reference() const { return reference_; }

private:
    EngagementMetric metric_;
    double reference_;
};

} // namespace ctxguard
