#include "metrics/metric_engine.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>

namespace fcg {

namespace {

// Single-source shortest path lengths, distance of an edge = max(1 - w, floor)
std::vector<double> dijkstra(const WeightedGraph& graph, size_t source, double min_distance) {
    const double inf = std::numeric_limits<double>::infinity();
    std::vector<double> dist(graph.num_nodes(), inf);
    using Entry = std::pair<double, size_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;

    dist[source] = 0.0;
    heap.emplace(0.0, source);

    while (!heap.empty()) {
        auto [d, u] = heap.top();
        heap.pop();
        if (d > dist[u]) continue;

        for (const auto& [v, w] : graph.neighbors(u)) {
            if (v == u) continue;
            double nd = d + std::max(1.0 - w, min_distance);
            if (nd < dist[v]) {
                dist[v] = nd;
                heap.emplace(nd, v);
            }
        }
    }

    return dist;
}

} // namespace

double MetricEngine::global_efficiency(const WeightedGraph& graph, double min_distance) {
    const size_t n = graph.num_nodes();
    if (n < 2 || graph.num_edges() == 0) return 0.0;

    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        std::vector<double> dist = dijkstra(graph, i, min_distance);
        for (size_t j = 0; j < n; ++j) {
            if (j == i || std::isinf(dist[j])) continue;
            total += 1.0 / dist[j];
        }
    }
    return total / (static_cast<double>(n) * static_cast<double>(n - 1));
}

// ============== GLOBAL / LOCAL EFFICIENCY ==============
MetricResult MetricEngine::compute_efficiency(const WeightedGraph& graph) const {
    MetricResult result;
    result.kind = MetricKind::EFFICIENCY;
    result.columns = metric_score_columns(MetricKind::EFFICIENCY);
    result.summary["Global Efficiency"] = 0.0;
    result.summary["Local Efficiency"] = 0.0;
    result.summary["Component Size"] = 0.0;

    // Distances are only meaningful for weights in [0, 1]
    WeightedGraph usable(false);
    for (size_t u = 0; u < graph.num_nodes(); ++u) {
        for (const auto& [v, w] : graph.neighbors(u)) {
            if (w < 0.0 || w > 1.0) continue;
            usable.set_edge(graph.node_id(u), graph.node_id(v), w);
        }
    }
    if (usable.num_edges() == 0) return result;

    report_progress("Efficiency", 0, 100);

    // Only the largest connected component is scored (ties: first discovered)
    auto components = usable.connected_components();
    size_t largest = 0;
    for (size_t i = 1; i < components.size(); ++i) {
        if (components[i].size() > components[largest].size()) largest = i;
    }
    WeightedGraph core = usable.induced_subgraph(components[largest]);
    const size_t n = core.num_nodes();
    result.summary["Component Size"] = static_cast<double>(n);

    const double min_distance = config_.efficiency_min_distance;
    result.summary["Global Efficiency"] = global_efficiency(core, min_distance);
    report_progress("Efficiency", 30, 100);

    double local_sum = 0.0;
    size_t scored = 0;
    for (size_t v = 0; v < n; ++v) {
        std::vector<size_t> nbrs;
        for (const auto& [u, _] : core.neighbors(v)) {
            if (u != v) nbrs.push_back(u);
        }

        double local = std::numeric_limits<double>::quiet_NaN();
        if (nbrs.size() >= 2) {
            local = global_efficiency(core.induced_subgraph(nbrs), min_distance);
            local_sum += local;
            scored++;
        }
        result.rows.push_back({core.node_id(v), {local}});
    }

    if (scored > 0) {
        result.summary["Local Efficiency"] = local_sum / static_cast<double>(scored);
    }

    report_progress("Efficiency", 100, 100);
    return result;
}

} // namespace fcg
