#include "metrics/metric_engine.hpp"

namespace fcg {

void MetricEngine::report_progress(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

MetricResult MetricEngine::run(MetricKind kind, const WeightedGraph& graph) const {
    if (metric_uses_directed_graph(kind) != graph.directed()) {
        throw std::invalid_argument(
            "Metric '" + metric_kind_to_string(kind) + "' requires a " +
            (metric_uses_directed_graph(kind) ? "directed" : "undirected") + " graph");
    }

    switch (kind) {
        case MetricKind::PAGERANK: return compute_pagerank(graph);
        case MetricKind::CLUSTERING: return compute_clustering(graph);
        case MetricKind::DEGREE: return compute_degree(graph);
        case MetricKind::HITS: return compute_hits(graph);
        case MetricKind::EIGENVECTOR: return compute_eigenvector_centrality(graph);
        case MetricKind::COMMUNITY: return compute_community(graph);
        case MetricKind::EFFICIENCY: return compute_efficiency(graph);
    }
    throw std::invalid_argument("Unknown metric kind");
}

} // namespace fcg
