#pragma once

#include <cstdint>
#include <string>

namespace ctxguard {

/// Fact-check outcome of a flagged post, from least to most confirmed
/// false. Declaration order is the confirmation order.
enum class VerificationStatus {
    UnderReview,
    Disputed,
    Flagged,
    FactChecked,
    Debunked,
    VerifiedFalse
};

enum class ArchiveStatus { Pending, Archived };

/// A flagged post as handed over by ingestion. Fields are already
/// validated there; scoring never mutates a record.
struct PostRecord {
    std::string post_id;
    std::string user_id;
    std::string platform;
    std::string category;
    std::string content;    // post text as captured
    int64_t timestamp = 0;  // seconds since epoch

    // Engagement
    uint64_t shares = 0;
    uint64_t likes = 0;
    uint64_t comments = 0;
    uint64_t views = 0;

    VerificationStatus verification_status = VerificationStatus::UnderReview;
    ArchiveStatus archive_status = ArchiveStatus::Pending;
    std::string archive_url;
};

/// Accepts the display names ("Verified False", "Fact-Checked", ...)
/// case-insensitively, with '-', '_' or ' ' as separators. Throws
/// InvalidParameter for anything else.
VerificationStatus parseVerificationStatus(const std::string& name);
const char* toString(VerificationStatus status);

ArchiveStatus parseArchiveStatus(const std::string& name);
const char* toString(ArchiveStatus status);

} // namespace ctxguard
