#include "risk/engagement_signal.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ctxguard {

EngagementSignal::EngagementSignal(EngagementMetric metric, double reference)
    : metric_(metric), reference_(reference) {
    if (!std::isfinite(reference) || reference <= 0.0) {
        throw InvalidParameter("Engagement reference scale must be positive");
    }
}

double EngagementSignal::compute(const PostRecord& post) const {
    uint64_t value = 0;
    switch (metric_) {
        case EngagementMetric::Shares: value = post.shares; break;
        case EngagementMetric::Views: value = post.views; break;
        case EngagementMetric::Comments: value = post.comments; break;
        case EngagementMetric::Likes: value = post.likes; break;
    }
    double normalized = std::log1p(static_cast<double>(value)) / std::log1p(reference_);
    return std::min(1.0, normalized);
}

std::string EngagementSignal::name() const {
    switch (metric_) {
        case EngagementMetric::Shares: return "shares";
        case EngagementMetric::Views: return "views";
        case EngagementMetric::Comments: return "comments";
        case EngagementMetric::Likes: return "likes";
    }
    return "shares";
}

} // namespace ctxguard
