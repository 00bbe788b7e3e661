#pragma once

#include <string>
#include <utility>

namespace ctxguard {

/// A raw interaction record between two accounts that shared related
/// content. Undirected: (a, b) and (b, a) describe the same relation.
struct InteractionEdge {
    std::string source;
    std::string target;
    double weight = 1.0;

    InteractionEdge() = default;
    InteractionEdge(std::string source, std::string target, double weight = 1.0)
        : source(std::move(source)), target(std::move(target)), weight(weight) {}

    bool operator==(const InteractionEdge& other) const {
        return source == other.source && target == other.target && weight == other.weight;
    }
    bool operator!=(const InteractionEdge& other) const { return !(*this == other); }
};

/// Throws InvalidEdge if the record cannot describe inter-account sharing:
/// empty ids, a self-loop, or a weight that is not a finite value >= 1.
void validateEdge(const InteractionEdge& edge);

} // namespace ctxguard
