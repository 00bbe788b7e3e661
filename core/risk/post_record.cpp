#include "risk/post_record.hpp"
#include "common/errors.hpp"

#include <cctype>

namespace ctxguard {

namespace {

// Lowercase with separators dropped: "Fact-Checked" → "factchecked"
std::string foldName(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

VerificationStatus parseVerificationStatus(const std::string& name) {
    std::string key = foldName(name);
    if (key == "underreview") return VerificationStatus::UnderReview;
    if (key == "disputed") return VerificationStatus::Disputed;
    if (key == "flagged") return VerificationStatus::Flagged;
    if (key == "factchecked") return VerificationStatus::FactChecked;
    if (key == "debunked") return VerificationStatus::Debunked;
    if (key == "verifiedfalse") return VerificationStatus::VerifiedFalse;
    throw InvalidParameter("Unknown verification status: " + name);
}

const char* toString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::UnderReview: return "Under Review";
        case VerificationStatus::Disputed: return "Disputed";
        case VerificationStatus::Flagged: return "Flagged";
        case VerificationStatus::FactChecked: return "Fact-Checked";
        case VerificationStatus::Debunked: return "Debunked";
        case VerificationStatus::VerifiedFalse: return "Verified False";
    }
    return "Under Review";
}

ArchiveStatus parseArchiveStatus(const std::string& name) {
    std::string key = foldName(name);
    if (key == "pending") return ArchiveStatus::Pending;
    if (key == "archived") return ArchiveStatus::Archived;
    throw InvalidParameter("Unknown archive status: " + name);
}

const char* toString(ArchiveStatus status) {
    return status == ArchiveStatus::Archived ? "Archived" : "Pending";
}

} // namespace ctxguard
