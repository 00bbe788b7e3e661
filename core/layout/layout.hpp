#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace ctxguard {

struct Point2D {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point2D& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2D& other) const { return !(*this == other); }
};

/// node id → position. Coordinates are unconstrained; consumers rescale.
using Positions = std::map<std::string, Point2D>;

// ─── Layout algorithms ─────────────────────────────────────────
// Each algorithm is a parameter struct; LayoutSpec is the closed set of
// them. All of them are deterministic for fixed parameters.

/// Fruchterman-Reingold spring embedding, seeded initial placement.
struct ForceDirectedLayout {
    double k = 3.0;        // optimal distance between nodes
    int iterations = 100;
    uint64_t seed = 42;

    void validate() const;
};

/// Nodes evenly spaced on a circle, in node-id order.
struct CircularLayout {
    double radius = 1.0;

    void validate() const;
};

/// Uniform positions in [0, 1)². The seed is mandatory.
struct RandomLayout {
    std::optional<uint64_t> seed;

    void validate() const;
};

/// Stress majorization (SMACOF) over hop distances, circular start.
struct StressLayout {
    int iterations = 300;
    double tolerance = 1e-4;  // relative stress change that stops iteration

    void validate() const;
};

using LayoutSpec = std::variant<ForceDirectedLayout, CircularLayout,
                                RandomLayout, StressLayout>;

/// Throws InvalidParameter if the held parameters are unusable.
void validateLayout(const LayoutSpec& spec);

/// Compute positions for every node of `graph`. An empty graph gives an
/// empty mapping. Throws InvalidParameter for unusable parameters.
Positions layout(const Graph& graph, const LayoutSpec& spec);

/// Resolve an algorithm name ("force-directed"/"spring", "circular",
/// "random", "stress-majorization"/"kamada-kawai") to a spec with default
/// parameters. `seed` overrides the force-directed seed and is required
/// for "random". Throws UnsupportedLayout or InvalidParameter.
LayoutSpec makeLayoutSpec(const std::string& name,
                          std::optional<uint64_t> seed = std::nullopt);

/// Canonical name of the algorithm held by `spec`.
std::string layoutName(const LayoutSpec& spec);

Positions forceDirectedLayout(const Graph& graph, const ForceDirectedLayout& params);
Positions circularLayout(const Graph& graph, const CircularLayout& params);
Positions randomLayout(const Graph& graph, const RandomLayout& params);
Positions stressLayout(const Graph& graph, const StressLayout& params);

} // namespace ctxguard
