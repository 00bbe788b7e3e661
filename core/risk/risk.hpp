#pragma once

#include "risk/post_record.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ctxguard {

enum class RiskTier { High, Medium, Low };

const char* toString(RiskTier tier);

// ─── Risk Breakdown ────────────────────────────────────────────
// Weighted per-signal contributions. Engagement is their sum, capped
// at 1.

struct RiskBreakdown {
    double shares   = 0.0;
    double views    = 0.0;
    double comments = 0.0;
    double likes    = 0.0;
    double status_multiplier = 0.0;

    double engagement() const;
};

struct RiskAssessment {
    double score = 0.0;  // [0, 100]
    RiskTier tier = RiskTier::Low;
    RiskBreakdown breakdown;
};

// ─── Risk Signal ───────────────────────────────────────────────
// Abstract base class for individual engagement terms. A signal maps a
// post to [0, 1] and must be non-decreasing in its metric.

class RiskSignal {
public:
    virtual ~RiskSignal() = default;

    virtual double compute(const PostRecord& post) const = 0;

    /// "shares", "views", "comments" or "likes".
    virtual std::string name() const = 0;
};

// ─── Risk Weights ──────────────────────────────────────────────

struct RiskWeights {
    // Signal weights
    double shares   = 0.7;
    double views    = 0.3;
    double comments = 0.3;
    double likes    = 0.2;

    // Reference scales: a metric at its reference saturates its signal
    double shares_reference   = 10000.0;
    double views_reference    = 100000.0;
    double comments_reference = 1000.0;
    double likes_reference    = 10000.0;

    // Score floor, as a fraction, for a post with no engagement
    double base = 0.3;

    // Verification multipliers, non-decreasing in confirmation order
    double under_review   = 0.55;
    double disputed       = 0.65;
    double flagged        = 0.75;
    double fact_checked   = 0.85;
    double debunked       = 0.95;
    double verified_false = 1.0;

    // Tier thresholds: score >= high → High, >= medium → Medium
    double high_threshold   = 70.0;
    double medium_threshold = 40.0;

    double multiplier(VerificationStatus status) const;

    /// Throws InvalidParameter if any invariant above is broken.
    void validate() const;
};

// ─── Risk Scorer ───────────────────────────────────────────────
// Combines weighted engagement signals with the verification
// multiplier:
//   score = 100 · multiplier · (base + (1 - base) · engagement)
// clamped to [0, 100]. Pure: the same post always gets the same result.

class RiskScorer {
public:
    explicit RiskScorer(RiskWeights weights = {});

    /// Throws InvalidParameter for a null signal or a name outside
    /// shares/views/comments/likes.
    void addSignal(std::unique_ptr<RiskSignal> signal);

    RiskAssessment score(const PostRecord& post) const;

    RiskBreakdown computeBreakdown(const PostRecord& post) const;

    /// Tier for a score, using the configured thresholds.
    RiskTier classify(double score) const;

    const RiskWeights& weights() const { return weights_; }
    /// Reference scales are read by signals at construction and are not
    /// changed by this call.
    void setWeights(const RiskWeights& w);

    size_t signalCount() const { return signals_.size(); }

private:
    RiskWeights weights_;
    std::vector<std::unique_ptr<RiskSignal>> signals_;

    // Map signal name to field in RiskBreakdown
    void assignToBreakdown(RiskBreakdown& bd, const std::string& name, double value) const;
};

} // namespace ctxguard
