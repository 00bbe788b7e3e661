// Fruchterman-Reingold spring embedding.
//
// Direct O(n^2) repulsion; interaction graphs handed to the presentation
// layer are small enough that a Barnes-Hut tree would not pay off.

#include "layout/layout.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace ctxguard {

namespace {

// Floor on pair distance and displacement length; coincident nodes
// would otherwise divide by zero.
constexpr double kMinDistance = 0.01;

} // namespace

Positions forceDirectedLayout(const Graph& graph, const ForceDirectedLayout& params) {
    params.validate();

    auto ids = graph.getNodeIds();
    const size_t n = ids.size();
    Positions positions;
    if (n == 0) return positions;

    // Seeded start in node-id order
    std::mt19937_64 rng(params.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<double> pos_x(n), pos_y(n);
    for (size_t i = 0; i < n; ++i) {
        pos_x[i] = unit(rng);
        pos_y[i] = unit(rng);
    }

    // Dense weight matrix indexed like `ids`
    std::vector<double> weights(n * n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& [neighbor, w] : graph.neighbors(ids[i])) {
            auto j = static_cast<size_t>(
                std::lower_bound(ids.begin(), ids.end(), neighbor) - ids.begin());
            weights[i * n + j] = w;
        }
    }

    // Linear cooling from a tenth of the initial spread
    double x_span = *std::max_element(pos_x.begin(), pos_x.end()) -
                    *std::min_element(pos_x.begin(), pos_x.end());
    double y_span = *std::max_element(pos_y.begin(), pos_y.end()) -
                    *std::min_element(pos_y.begin(), pos_y.end());
    double temperature = 0.1 * std::max(std::max(x_span, y_span), kMinDistance);
    const double cooling = temperature / static_cast<double>(params.iterations + 1);
    const double k = params.k;

    std::vector<double> disp_x(n), disp_y(n);
    for (int iter = 0; iter < params.iterations; ++iter) {
        std::fill(disp_x.begin(), disp_x.end(), 0.0);
        std::fill(disp_y.begin(), disp_y.end(), 0.0);

        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                double dx = pos_x[i] - pos_x[j];
                double dy = pos_y[i] - pos_y[j];
                double dist = std::max(std::sqrt(dx * dx + dy * dy), kMinDistance);

                // Repulsion k²/d against attraction w·d²/k, both along delta/d
                double force = k * k / (dist * dist) - weights[i * n + j] * dist / k;
                disp_x[i] += dx * force;
                disp_y[i] += dy * force;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            double length = std::max(std::sqrt(disp_x[i] * disp_x[i] + disp_y[i] * disp_y[i]),
                                     kMinDistance);
            pos_x[i] += disp_x[i] * temperature / length;
            pos_y[i] += disp_y[i] * temperature / length;
        }

        temperature -= cooling;
    }

    for (size_t i = 0; i < n; ++i) {
        positions[ids[i]] = Point2D{pos_x[i], pos_y[i]};
    }
    return positions;
}

} // namespace ctxguard
