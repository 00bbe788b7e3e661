// Stress majorization (SMACOF) over graph-theoretic hop distances.
//
// Minimises sum_{i<j} w_ij (||x_i - x_j|| - d_ij)² with w_ij = d_ij^-2,
// updating one node at a time (localized majorization). Pairs in
// different components are given the largest finite distance plus one.

#include "layout/layout.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <vector>

namespace ctxguard {

namespace {

constexpr double kPi = 3.14159265358979323846;

// All-pairs hop distances by BFS from every node; unreachable = -1
std::vector<int> hopDistances(const Graph& graph, const std::vector<std::string>& ids) {
    const size_t n = ids.size();
    std::vector<std::vector<size_t>> adjacency(n);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& [neighbor, _] : graph.neighbors(ids[i])) {
            adjacency[i].push_back(static_cast<size_t>(
                std::lower_bound(ids.begin(), ids.end(), neighbor) - ids.begin()));
        }
    }

    std::vector<int> dist(n * n, -1);
    for (size_t s = 0; s < n; ++s) {
        std::queue<size_t> frontier;
        dist[s * n + s] = 0;
        frontier.push(s);
        while (!frontier.empty()) {
            size_t u = frontier.front();
            frontier.pop();
            for (size_t v : adjacency[u]) {
                if (dist[s * n + v] < 0) {
                    dist[s * n + v] = dist[s * n + u] + 1;
                    frontier.push(v);
                }
            }
        }
    }
    return dist;
}

double stress(const std::vector<double>& x, const std::vector<double>& y,
              const std::vector<double>& d, size_t n) {
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double dx = x[i] - x[j];
            double dy = y[i] - y[j];
            double diff = std::sqrt(dx * dx + dy * dy) - d[i * n + j];
            total += diff * diff / (d[i * n + j] * d[i * n + j]);
        }
    }
    return total;
}

} // namespace

Positions stressLayout(const Graph& graph, const StressLayout& params) {
    params.validate();

    auto ids = graph.getNodeIds();
    const size_t n = ids.size();
    Positions positions;
    if (n == 0) return positions;
    if (n == 1) {
        positions[ids[0]] = Point2D{0.0, 0.0};
        return positions;
    }

    auto hops = hopDistances(graph, ids);
    int max_hop = 0;
    for (int h : hops) max_hop = std::max(max_hop, h);

    std::vector<double> d(n * n);
    for (size_t idx = 0; idx < n * n; ++idx) {
        d[idx] = hops[idx] < 0 ? static_cast<double>(max_hop + 1)
                               : static_cast<double>(hops[idx]);
    }

    // Deterministic start: circle with radius matching the distance scale
    std::vector<double> x(n), y(n);
    const double radius = std::max(1.0, static_cast<double>(max_hop) / 2.0);
    for (size_t i = 0; i < n; ++i) {
        double theta = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(n);
        x[i] = radius * std::cos(theta);
        y[i] = radius * std::sin(theta);
    }

    double previous = stress(x, y, d, n);
    for (int iter = 0; iter < params.iterations; ++iter) {
        for (size_t i = 0; i < n; ++i) {
            double num_x = 0.0, num_y = 0.0, denom = 0.0;
            for (size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                double dij = d[i * n + j];
                double wij = 1.0 / (dij * dij);
                double dx = x[i] - x[j];
                double dy = y[i] - y[j];
                double len = std::sqrt(dx * dx + dy * dy);

                num_x += wij * x[j];
                num_y += wij * y[j];
                if (len > std::numeric_limits<double>::epsilon()) {
                    num_x += wij * dij * dx / len;
                    num_y += wij * dij * dy / len;
                }
                denom += wij;
            }
            x[i] = num_x / denom;
            y[i] = num_y / denom;
        }

        double current = stress(x, y, d, n);
        if (previous <= 0.0 || (previous - current) / previous < params.tolerance) {
            break;
        }
        previous = current;
    }

    for (size_t i = 0; i < n; ++i) {
        positions[ids[i]] = Point2D{x[i], y[i]};
    }
    return positions;
}

} // namespace ctxguard
