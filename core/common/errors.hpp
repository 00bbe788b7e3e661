#pragma once

#include <stdexcept>
#include <string>

namespace ctxguard {

// ─── Error taxonomy ────────────────────────────────────────────
// Every failure of the engine is reported synchronously with one of
// these. Callers that skip-and-continue catch the specific type.

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Self-loop, weight below 1, non-finite weight or empty account id.
class InvalidEdge : public Error {
public:
    explicit InvalidEdge(const std::string& message) : Error(message) {}
};

/// Unknown layout algorithm name.
class UnsupportedLayout : public Error {
public:
    explicit UnsupportedLayout(const std::string& message) : Error(message) {}
};

/// Out-of-range scalar parameter (top_n, min_connections, seed, weights...).
class InvalidParameter : public Error {
public:
    explicit InvalidParameter(const std::string& message) : Error(message) {}
};

} // namespace ctxguard
