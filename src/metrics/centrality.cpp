#include "metrics/metric_engine.hpp"
#include <algorithm>
#include <cmath>

namespace fcg {

namespace {

double l1_distance(const std::vector<double>& a, const std::vector<double>& b) {
    double err = 0.0;
    for (size_t i = 0; i < a.size(); ++i) err += std::abs(a[i] - b[i]);
    return err;
}

void normalize_l1(std::vector<double>& vec) {
    double sum = 0.0;
    for (double v : vec) sum += v;
    if (sum <= 0.0) return;
    for (double& v : vec) v /= sum;
}

void normalize_l2(std::vector<double>& vec) {
    double sq = 0.0;
    for (double v : vec) sq += v * v;
    double norm = std::sqrt(sq);
    if (norm == 0.0) return;
    for (double& v : vec) v /= norm;
}

MetricResult make_result(MetricKind kind) {
    MetricResult result;
    result.kind = kind;
    result.columns = metric_score_columns(kind);
    return result;
}

} // namespace

// ============== PAGERANK ==============
MetricResult MetricEngine::compute_pagerank(const WeightedGraph& graph) const {
    MetricResult result = make_result(MetricKind::PAGERANK);
    const size_t n = graph.num_nodes();
    if (n == 0) return result;

    report_progress("PageRank", 0, 100);

    const double nd = static_cast<double>(n);
    std::vector<double> pr(n, 1.0 / nd);
    std::vector<double> out(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        out[i] = graph.out_strength(i);
    }

    double damping = config_.pagerank_damping;
    int iterations = config_.pagerank_max_iterations;
    result.converged = false;

    for (int iter = 0; iter < iterations; ++iter) {
        std::vector<double> next(n, (1.0 - damping) / nd);

        // Mass on nodes without outgoing weight is spread uniformly
        double dangling = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (out[i] <= 0.0) dangling += pr[i];
        }
        double dangling_contrib = damping * dangling / nd;

        for (size_t u = 0; u < n; ++u) {
            if (out[u] <= 0.0) continue;
            double share = damping * pr[u] / out[u];
            for (const auto& [v, w] : graph.neighbors(u)) {
                next[v] += share * w;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            next[i] += dangling_contrib;
        }

        double err = l1_distance(next, pr);
        pr.swap(next);
        result.iterations = iter + 1;

        if (err < config_.pagerank_tolerance) {
            result.converged = true;
            break;
        }
        if ((iter + 1) % 10 == 0) {
            report_progress("PageRank", (100 * (iter + 1)) / std::max(1, iterations), 100);
        }
    }

    for (size_t i = 0; i < n; ++i) {
        result.rows.push_back({graph.node_id(i), {pr[i]}});
    }

    report_progress("PageRank", 100, 100);
    return result;
}

// ============== HITS ==============
MetricResult MetricEngine::compute_hits(const WeightedGraph& graph) const {
    MetricResult result = make_result(MetricKind::HITS);
    const size_t n = graph.num_nodes();
    if (n == 0) return result;

    report_progress("HITS", 0, 100);

    std::vector<double> hub(n, 1.0 / static_cast<double>(n));
    std::vector<double> authority(n, 0.0);
    int iterations = config_.hits_max_iterations;
    result.converged = false;

    // Weights only mark edge presence here
    for (int iter = 0; iter < iterations; ++iter) {
        std::fill(authority.begin(), authority.end(), 0.0);
        for (size_t u = 0; u < n; ++u) {
            for (const auto& [v, _] : graph.neighbors(u)) {
                authority[v] += hub[u];
            }
        }
        normalize_l1(authority);

        std::vector<double> next_hub(n, 0.0);
        for (size_t u = 0; u < n; ++u) {
            for (const auto& [v, _] : graph.neighbors(u)) {
                next_hub[u] += authority[v];
            }
        }
        normalize_l1(next_hub);

        double err = l1_distance(next_hub, hub);
        hub.swap(next_hub);
        result.iterations = iter + 1;

        if (err < config_.hits_tolerance) {
            result.converged = true;
            break;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        result.rows.push_back({graph.node_id(i), {hub[i], authority[i]}});
    }

    report_progress("HITS", 100, 100);
    return result;
}

// ============== EIGENVECTOR CENTRALITY ==============
MetricResult MetricEngine::compute_eigenvector_centrality(const WeightedGraph& graph) const {
    MetricResult result = make_result(MetricKind::EIGENVECTOR);
    const size_t n = graph.num_nodes();
    if (n == 0) return result;

    report_progress("Eigenvector centrality", 0, 100);

    std::vector<double> x(n, 1.0 / static_cast<double>(n));
    int iterations = config_.eigenvector_max_iterations;
    double err = 0.0;

    for (int iter = 0; iter < iterations; ++iter) {
        std::vector<double> next(n, 0.0);
        for (size_t u = 0; u < n; ++u) {
            for (const auto& [v, w] : graph.neighbors(u)) {
                next[v] += x[u] * w;
            }
        }
        // A zero vector stays zero
        normalize_l2(next);

        err = l1_distance(next, x);
        x.swap(next);

        if (err < config_.eigenvector_tolerance) {
            result.iterations = iter + 1;
            for (size_t i = 0; i < n; ++i) {
                result.rows.push_back({graph.node_id(i), {x[i]}});
            }
            report_progress("Eigenvector centrality", 100, 100);
            return result;
        }
    }

    throw ConvergenceError("Eigenvector centrality", iterations, err);
}

} // namespace fcg
