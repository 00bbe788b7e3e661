#include "risk/risk.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iterator>
#include <string>

namespace ctxguard {

const char* toString(RiskTier tier) {
    switch (tier) {
        case RiskTier::High: return "High";
        case RiskTier::Medium: return "Medium";
        case RiskTier::Low: return "Low";
    }
    return "Low";
}

double RiskBreakdown::engagement() const {
    return std::clamp(shares + views + comments + likes, 0.0, 1.0);
}

// ─── Risk Weights ──────────────────────────────────────────────

double RiskWeights::multiplier(VerificationStatus status) const {
    switch (status) {
        case VerificationStatus::UnderReview: return under_review;
        case VerificationStatus::Disputed: return disputed;
        case VerificationStatus::Flagged: return flagged;
        case VerificationStatus::FactChecked: return fact_checked;
        case VerificationStatus::Debunked: return debunked;
        case VerificationStatus::VerifiedFalse: return verified_false;
    }
    return under_review;
}

void RiskWeights::validate() const {
    for (double w : {shares, views, comments, likes}) {
        if (!std::isfinite(w) || w < 0.0) {
            throw InvalidParameter("Risk signal weights must be finite and non-negative");
        }
    }
    for (double ref : {shares_reference, views_reference, comments_reference, likes_reference}) {
        if (!std::isfinite(ref) || ref <= 0.0) {
            throw InvalidParameter("Risk reference scales must be positive");
        }
    }
    if (!(base >= 0.0 && base <= 1.0)) {
        throw InvalidParameter("Risk base must lie in [0, 1]");
    }

    const double ordered[] = {under_review, disputed, flagged,
                              fact_checked, debunked, verified_false};
    if (!std::isfinite(ordered[0]) || ordered[0] < 0.0) {
        throw InvalidParameter("Verification multipliers must be non-negative");
    }
    for (size_t i = 1; i < std::size(ordered); ++i) {
        if (!std::isfinite(ordered[i]) || ordered[i] < ordered[i - 1]) {
            throw InvalidParameter(
                "Verification multipliers must not decrease from Under Review to Verified False");
        }
    }

    if (!(medium_threshold >= 0.0 && medium_threshold <= high_threshold &&
          high_threshold <= 100.0)) {
        throw InvalidParameter("Tier thresholds must satisfy 0 <= medium <= high <= 100");
    }
}

// ─── Risk Scorer ───────────────────────────────────────────────

RiskScorer::RiskScorer(RiskWeights weights)
    : weights_(weights) {
    weights_.validate();
}

void RiskScorer::setWeights(const RiskWeights& w) {
    w.validate();
    weights_ = w;
}

void RiskScorer::addSignal(std::unique_ptr<RiskSignal> signal) {
    if (!signal) {
        throw InvalidParameter("Risk signal must not be null");
    }
    const std::string name = signal->name();
    if (name != "shares" && name != "views" && name != "comments" && name != "likes") {
        throw InvalidParameter("Risk signal '" + name + "' has no breakdown term");
    }
    signals_.push_back(std::move(signal));
}

RiskBreakdown RiskScorer::computeBreakdown(const PostRecord& post) const {
    RiskBreakdown bd;
    for (const auto& signal : signals_) {
        double raw = std::clamp(signal->compute(post), 0.0, 1.0);
        assignToBreakdown(bd, signal->name(), raw);
    }
    bd.status_multiplier = weights_.multiplier(post.verification_status);
    return bd;
}

RiskAssessment RiskScorer::score(const PostRecord& post) const {
    RiskAssessment result;
    result.breakdown = computeBreakdown(post);

    double intensity = weights_.base + (1.0 - weights_.base) * result.breakdown.engagement();
    double raw = 100.0 * result.breakdown.status_multiplier * intensity;
    result.score = std::clamp(raw, 0.0, 100.0);
    result.tier = classify(result.score);
    return result;
}

RiskTier RiskScorer::classify(double score) const {
    if (score >= weights_.high_threshold) return RiskTier::High;
    if (score >= weights_.medium_threshold) return RiskTier::Medium;
    return RiskTier::Low;
}

void RiskScorer::assignToBreakdown(RiskBreakdown& bd,
                                   const std::string& name,
                                   double value) const {
    if (name == "shares") {
        bd.shares += weights_.shares * value;
    } else if (name == "views") {
        bd.views += weights_.views * value;
    } else if (name == "comments") {
        bd.comments += weights_.comments * value;
    } else if (name == "likes") {
        bd.likes += weights_.likes * value;
    }
}

} // namespace ctxguard
