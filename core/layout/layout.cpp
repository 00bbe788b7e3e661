#include "layout/layout.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>
#include <type_traits>

namespace ctxguard {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string normalizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == ' ') {
            out.push_back('-');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

} // namespace

// ─── Parameter checks ──────────────────────────────────────────

void ForceDirectedLayout::validate() const {
    if (!std::isfinite(k) || k <= 0.0) {
        throw InvalidParameter("Force-directed layout k must be positive");
    }
    if (iterations < 1) {
        throw InvalidParameter("Force-directed layout needs at least one iteration");
    }
}

void CircularLayout::validate() const {
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw InvalidParameter("Circular layout radius must be positive");
    }
}

void RandomLayout::validate() const {
    if (!seed) {
        throw InvalidParameter("Random layout requires an explicit seed");
    }
}

void StressLayout::validate() const {
    if (iterations < 1) {
        throw InvalidParameter("Stress layout needs at least one iteration");
    }
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw InvalidParameter("Stress layout tolerance must be non-negative");
    }
}

void validateLayout(const LayoutSpec& spec) {
    std::visit([](const auto& params) { params.validate(); }, spec);
}

Positions layout(const Graph& graph, const LayoutSpec& spec) {
    Positions positions = std::visit([&](const auto& params) -> Positions {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, ForceDirectedLayout>) {
            return forceDirectedLayout(graph, params);
        } else if constexpr (std::is_same_v<T, CircularLayout>) {
            return circularLayout(graph, params);
        } else if constexpr (std::is_same_v<T, RandomLayout>) {
            return randomLayout(graph, params);
        } else {
            return stressLayout(graph, params);
        }
    }, spec);

    log::logger()->debug("{} layout placed {} nodes", layoutName(spec), positions.size());
    return positions;
}

LayoutSpec makeLayoutSpec(const std::string& name, std::optional<uint64_t> seed) {
    std::string key = normalizeName(name);

    if (key == "force-directed" || key == "spring") {
        ForceDirectedLayout spec;
        if (seed) spec.seed = *seed;
        return spec;
    }
    if (key == "circular") {
        return CircularLayout{};
    }
    if (key == "random") {
        if (!seed) {
            throw InvalidParameter("Random layout requires an explicit seed");
        }
        return RandomLayout{seed};
    }
    if (key == "stress-majorization" || key == "stress" || key == "kamada-kawai") {
        return StressLayout{};
    }
    throw UnsupportedLayout("Unknown layout algorithm: " + name);
}

std::string layoutName(const LayoutSpec& spec) {
    switch (spec.index()) {
        case 0: return "force-directed";
        case 1: return "circular";
        case 2: return "random";
        default: return "stress-majorization";
    }
}

// ─── Circular ──────────────────────────────────────────────────

Positions circularLayout(const Graph& graph, const CircularLayout& params) {
    params.validate();

    Positions positions;
    auto ids = graph.getNodeIds();
    if (ids.size() == 1) {
        positions[ids[0]] = Point2D{0.0, 0.0};
        return positions;
    }

    const double step = 2.0 * kPi / static_cast<double>(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        double theta = step * static_cast<double>(i);
        positions[ids[i]] = Point2D{params.radius * std::cos(theta),
                                    params.radius * std::sin(theta)};
    }
    return positions;
}

// ─── Random ────────────────────────────────────────────────────

Positions randomLayout(const Graph& graph, const RandomLayout& params) {
    params.validate();

    std::mt19937_64 rng(*params.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    Positions positions;
    graph.forEachNode([&](const std::string& id) {
        double x = unit(rng);
        double y = unit(rng);
        positions[id] = Point2D{x, y};
    });
    return positions;
}

} // namespace ctxguard
