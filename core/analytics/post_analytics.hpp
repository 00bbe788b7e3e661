#pragma once

#include "risk/risk.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ctxguard {

struct ScoredPost {
    PostRecord post;
    RiskAssessment assessment;
};

/// Dashboard-side selection. Empty sets select every platform/category.
struct PostFilter {
    std::set<std::string> platforms;
    std::set<std::string> categories;
    double min_score = 0.0;
};

enum class PostSortKey { Timestamp, Score, Shares };

/// Overview figures for a set of scored posts.
struct PostSummary {
    size_t total = 0;
    size_t high_risk = 0;          // score above the critical threshold
    size_t archived = 0;
    size_t active_spreaders = 0;   // distinct non-empty user ids
    std::map<std::string, size_t> by_platform;
    std::map<std::string, size_t> by_category;
    std::map<std::string, size_t> by_status;
};

/// Score above which a post counts as critical in summaries.
inline constexpr double kCriticalScore = 85.0;

/// One equal-width bin of the score distribution, [lower, upper). The
/// last bin also holds scores equal to its upper bound.
struct HistogramBin {
    double lower = 0.0;
    double upper = 0.0;
    size_t count = 0;
};

inline constexpr int kScoreHistogramBins = 15;

struct ContentCount {
    std::string content;
    size_t count = 0;
};

inline constexpr size_t kTopContentCount = 7;

std::vector<ScoredPost> scorePosts(const RiskScorer& scorer,
                                   const std::vector<PostRecord>& posts);

std::vector<ScoredPost> filterPosts(const std::vector<ScoredPost>& posts,
                                    const PostFilter& filter);

/// Descending by key, ties broken by post_id ascending.
std::vector<ScoredPost> sortPosts(std::vector<ScoredPost> posts, PostSortKey key);

PostSummary summarize(const std::vector<ScoredPost>& posts,
                      double critical_score = kCriticalScore);

/// Post counts per UTC calendar day, keyed "YYYY-MM-DD".
std::map<std::string, size_t> postsPerDay(const std::vector<ScoredPost>& posts);

/// Distribution of scores over [0, 100] in `bins` equal-width bins.
/// Throws InvalidParameter for bins < 1.
std::vector<HistogramBin> scoreHistogram(const std::vector<ScoredPost>& posts,
                                         int bins = kScoreHistogramBins);

/// Posts whose content contains `term`, ignoring ASCII case. An empty
/// term selects every post. Input order is kept.
std::vector<ScoredPost> searchPosts(const std::vector<ScoredPost>& posts,
                                    const std::string& term);

/// Most repeated non-empty contents, count desc then content asc.
std::vector<ContentCount> topContent(const std::vector<ScoredPost>& posts,
                                     size_t limit = kTopContentCount);

/// Posts still waiting for archival, most urgent first (score desc,
/// then post_id), at most `limit` of them.
std::vector<ScoredPost> recoveryQueue(const std::vector<ScoredPost>& posts, size_t limit);

} // namespace ctxguard
