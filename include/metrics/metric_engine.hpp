#pragma once

#include "graph/weighted_graph.hpp"
#include "metrics/metric_result.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fcg {

// Metric configuration
struct MetricConfig {
    // PageRank
    double pagerank_damping = 0.85;
    double pagerank_tolerance = 1e-6;    // L1 change between iterates
    int pagerank_max_iterations = 100;   // Last iterate returned when reached

    // HITS
    double hits_tolerance = 1e-8;
    int hits_max_iterations = 100;

    // Eigenvector centrality (exhausting the cap is an error)
    double eigenvector_tolerance = 1e-6;
    int eigenvector_max_iterations = 1000;

    // Community partitioning
    double community_resolution = 1.0;
    int community_max_levels = 32;       // Aggregation levels

    // Efficiency: distances (1 - w) are floored here so a unit weight stays finite
    double efficiency_min_distance = 1e-6;
};

/**
 * @brief Power iteration exhausted its cap before reaching tolerance
 */
class ConvergenceError : public std::runtime_error {
public:
    ConvergenceError(const std::string& metric, int iterations, double residual)
        : std::runtime_error(metric + " failed to converge within " +
                             std::to_string(iterations) + " iterations (residual " +
                             std::to_string(residual) + ")"),
          iterations_(iterations), residual_(residual) {}

    int iterations() const { return iterations_; }
    double residual() const { return residual_; }

private:
    int iterations_;
    double residual_;
};

/**
 * @brief Community assignment of one graph
 */
struct Partition {
    std::vector<NeuronId> neurons;       // Graph node order
    std::vector<int> labels;             // 0..community_count-1, parallel to neurons
    int community_count = 0;
    double modularity = 0.0;
    int levels = 0;                      // Aggregation levels performed

    int label_of(const NeuronId& neuron) const {
        for (size_t i = 0; i < neurons.size(); ++i) {
            if (neurons[i] == neuron) return labels[i];
        }
        return -1;
    }

    // Community table rows plus modularity and community count
    MetricResult to_result(const AnimalId& animal = kDefaultAnimal) const;
};

// Progress callback
using MetricProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Structural metrics over one animal's connectivity graph
 *
 * Every operation is a pure function of the graph and the configuration.
 * PageRank and HITS expect a directed graph, all other metrics an
 * undirected one; efficiency additionally expects weights in [0, 1]
 * (see WeightFilter::UnitInterval).
 */
class MetricEngine {
public:
    MetricEngine() = default;
    explicit MetricEngine(const MetricConfig& config) : config_(config) {}

    void set_config(const MetricConfig& config) { config_ = config; }
    const MetricConfig& config() const { return config_; }
    void set_progress_callback(MetricProgressCallback cb) { progress_cb_ = std::move(cb); }

    // Individual metrics
    MetricResult compute_pagerank(const WeightedGraph& graph) const;
    MetricResult compute_hits(const WeightedGraph& graph) const;
    MetricResult compute_eigenvector_centrality(const WeightedGraph& graph) const;
    MetricResult compute_clustering(const WeightedGraph& graph) const;
    MetricResult compute_degree(const WeightedGraph& graph) const;
    Partition compute_partition(const WeightedGraph& graph) const;
    MetricResult compute_community(const WeightedGraph& graph) const;
    MetricResult compute_efficiency(const WeightedGraph& graph) const;

    /**
     * @brief Dispatch by kind
     * @throws std::invalid_argument if the graph orientation does not suit the metric
     */
    MetricResult run(MetricKind kind, const WeightedGraph& graph) const;

    /**
     * @brief Weighted modularity of a labelling (labels parallel to node order)
     */
    static double modularity(const WeightedGraph& graph, const std::vector<int>& labels,
                             double resolution = 1.0);

    /**
     * @brief Global efficiency of the whole graph with distance max(1 - w, min_distance)
     *
     * No component reduction is applied here.
     */
    static double global_efficiency(const WeightedGraph& graph, double min_distance = 1e-6);

private:
    MetricConfig config_;
    MetricProgressCallback progress_cb_;

    void report_progress(const std::string& stage, int current, int total) const;
};

} // namespace fcg
