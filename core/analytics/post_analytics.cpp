#include "analytics/post_analytics.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace ctxguard {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Days since 1970-01-01 to a proleptic Gregorian date (Hinnant's
// civil_from_days), formatted as YYYY-MM-DD
std::string civilDate(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t day = doy - (153 * mp + 2) / 5 + 1;
    const int64_t month = mp < 10 ? mp + 3 : mp - 9;
    const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02lld-%02lld",
                  static_cast<long long>(year), static_cast<long long>(month),
                  static_cast<long long>(day));
    return buffer;
}

std::string lowercase(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::vector<ScoredPost> scorePosts(const RiskScorer& scorer,
                                   const std::vector<PostRecord>& posts) {
    std::vector<ScoredPost> scored;
    scored.reserve(posts.size());
    for (const auto& post : posts) {
        scored.push_back({post, scorer.score(post)});
    }
    return scored;
}

std::vector<ScoredPost> filterPosts(const std::vector<ScoredPost>& posts,
                                    const PostFilter& filter) {
    std::vector<ScoredPost> selected;
    for (const auto& sp : posts) {
        if (!filter.platforms.empty() && !filter.platforms.count(sp.post.platform)) continue;
        if (!filter.categories.empty() && !filter.categories.count(sp.post.category)) continue;
        if (sp.assessment.score < filter.min_score) continue;
        selected.push_back(sp);
    }
    return selected;
}

std::vector<ScoredPost> sortPosts(std::vector<ScoredPost> posts, PostSortKey key) {
    auto before = [key](const ScoredPost& a, const ScoredPost& b) {
        switch (key) {
            case PostSortKey::Timestamp:
                if (a.post.timestamp != b.post.timestamp) {
                    return a.post.timestamp > b.post.timestamp;
                }
                break;
            case PostSortKey::Score:
                if (a.assessment.score != b.assessment.score) {
                    return a.assessment.score > b.assessment.score;
                }
                break;
            case PostSortKey::Shares:
                if (a.post.shares != b.post.shares) {
                    return a.post.shares > b.post.shares;
                }
                break;
        }
        return a.post.post_id < b.post.post_id;
    };
    std::sort(posts.begin(), posts.end(), before);
    return posts;
}

PostSummary summarize(const std::vector<ScoredPost>& posts, double critical_score) {
    PostSummary summary;
    std::set<std::string> users;

    for (const auto& sp : posts) {
        ++summary.total;
        if (sp.assessment.score > critical_score) ++summary.high_risk;
        if (sp.post.archive_status == ArchiveStatus::Archived) ++summary.archived;
        if (!sp.post.user_id.empty()) users.insert(sp.post.user_id);

        ++summary.by_platform[sp.post.platform];
        ++summary.by_category[sp.post.category];
        ++summary.by_status[toString(sp.post.verification_status)];
    }

    summary.active_spreaders = users.size();
    return summary;
}

// ─── Dashboard aggregates ──────────────────────────────────────

std::map<std::string, size_t> postsPerDay(const std::vector<ScoredPost>& posts) {
    std::map<std::string, size_t> per_day;
    for (const auto& sp : posts) {
        int64_t ts = sp.post.timestamp;
        int64_t days = ts / kSecondsPerDay;
        if (ts % kSecondsPerDay < 0) --days;  // floor for pre-epoch times
        ++per_day[civilDate(days)];
    }
    return per_day;
}

std::vector<HistogramBin> scoreHistogram(const std::vector<ScoredPost>& posts, int bins) {
    if (bins < 1) {
        throw InvalidParameter("Score histogram needs at least one bin, got " +
                               std::to_string(bins));
    }

    const double width = 100.0 / bins;
    std::vector<HistogramBin> histogram(static_cast<size_t>(bins));
    for (int i = 0; i < bins; ++i) {
        histogram[i].lower = width * i;
        histogram[i].upper = i + 1 == bins ? 100.0 : width * (i + 1);
    }

    for (const auto& sp : posts) {
        double score = std::clamp(sp.assessment.score, 0.0, 100.0);
        int index = static_cast<int>(std::floor(score / width));
        index = std::min(index, bins - 1);
        ++histogram[index].count;
    }
    return histogram;
}

std::vector<ScoredPost> searchPosts(const std::vector<ScoredPost>& posts,
                                    const std::string& term) {
    if (term.empty()) return posts;

    const std::string needle = lowercase(term);
    std::vector<ScoredPost> matches;
    for (const auto& sp : posts) {
        if (lowercase(sp.post.content).find(needle) != std::string::npos) {
            matches.push_back(sp);
        }
    }
    return matches;
}

std::vector<ContentCount> topContent(const std::vector<ScoredPost>& posts, size_t limit) {
    std::map<std::string, size_t> counts;
    for (const auto& sp : posts) {
        if (!sp.post.content.empty()) ++counts[sp.post.content];
    }

    std::vector<ContentCount> ranked;
    ranked.reserve(counts.size());
    for (const auto& [content, count] : counts) {
        ranked.push_back({content, count});
    }
    // Stable over the map's content order, so equal counts stay ascending
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ContentCount& a, const ContentCount& b) {
                         return a.count > b.count;
                     });
    if (ranked.size() > limit) ranked.resize(limit);
    return ranked;
}

std::vector<ScoredPost> recoveryQueue(const std::vector<ScoredPost>& posts, size_t limit) {
    std::vector<ScoredPost> pending;
    for (const auto& sp : posts) {
        if (sp.post.archive_status == ArchiveStatus::Pending) pending.push_back(sp);
    }
    pending = sortPosts(std::move(pending), PostSortKey::Score);
    if (pending.size() > limit) pending.resize(limit);
    return pending;
}

} // namespace ctxguard
