#pragma once

#include "graph/weighted_graph.hpp"
#include "io/edge_table.hpp"
#include "metrics/metric_engine.hpp"
#include "report/result_table.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fcg {

// ============================================================================
// Analysis Configuration
// ============================================================================

/**
 * @brief Configuration for an analysis run
 */
struct AnalysisConfig {
    // Input columns
    std::string animal_column = "Animal";           ///< Optional column
    std::string pair_column = "Neuron Pair";
    std::string weight_column = "Mean Edge Weight";

    // Metric selection
    std::vector<std::string> metrics = {
        "pagerank", "clustering", "degree", "hits", "eigenvector", "community", "efficiency"
    };

    // Algorithm parameters
    double pagerank_damping = 0.85;
    double pagerank_tolerance = 1e-6;
    int pagerank_max_iterations = 100;
    double hits_tolerance = 1e-8;
    int hits_max_iterations = 100;
    double eigenvector_tolerance = 1e-6;
    int eigenvector_max_iterations = 1000;
    double community_resolution = 1.0;
    int community_max_levels = 32;
    double efficiency_min_distance = 1e-6;

    // Output Configuration
    std::string output_directory = "metrics_out";   ///< Output directory
    std::string output_format = "csv";              ///< "csv" or "tsv"
    bool write_json = true;                         ///< Mirror every table as JSON
    bool verbose = true;                            ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static AnalysisConfig from_json_file(const std::string& path);

    /**
     * @brief Read the keys present in a JSON object over the defaults
     */
    static AnalysisConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables (FCG_OUTPUT_DIR, FCG_METRICS, FCG_VERBOSE)
     */
    static AnalysisConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    MetricConfig metric_config() const;
    EdgeTableColumns edge_table_columns() const;

    /**
     * @brief Selected metrics, deduplicated, in request order
     * @throws std::invalid_argument on an unknown metric name
     */
    std::vector<MetricKind> metric_kinds() const;
};

// ============================================================================
// Analysis Statistics
// ============================================================================

/**
 * @brief Statistics from one analysis run
 */
struct AnalysisStatistics {
    // Input
    int rows_read = 0;
    int records_loaded = 0;
    int animals_processed = 0;
    int records_dropped_for_efficiency = 0;

    // Per metric name
    std::map<std::string, int> metrics_computed;
    std::map<std::string, int> metrics_skipped;
    std::map<std::string, int> metrics_not_converged;
    std::vector<std::string> warnings;

    // Timing
    double total_time_seconds = 0.0;
    double graph_building_time_seconds = 0.0;
    double metric_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

/**
 * @brief Parsed content of an input table
 */
struct LoadedEdges {
    std::vector<EdgeRecord> records;
    bool has_animal_column = false;
    int rows_read = 0;
};

// ============================================================================
// Analysis Pipeline
// ============================================================================

/**
 * @brief Batch metric computation over every animal of an edge table
 *
 * Edge table → records → one graph per (animal, metric orientation)
 * → MetricEngine → ResultSet. A ConvergenceError skips that metric for that
 * animal only; parse errors abort the run.
 */
class AnalysisPipeline {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit AnalysisPipeline(const AnalysisConfig& config);

    // The engine's progress hook refers back to this pipeline
    AnalysisPipeline(const AnalysisPipeline&) = delete;
    AnalysisPipeline& operator=(const AnalysisPipeline&) = delete;

    /**
     * @brief Read and parse an edge table
     * @throws EdgeTableError, MalformedPairError, InvalidWeightError
     */
    LoadedEdges load(const std::string& path);

    /**
     * @brief Read an edge table and compute the configured metrics
     */
    ResultSet process_file(const std::string& path);

    /**
     * @brief Parse raw rows and compute the configured metrics
     */
    ResultSet process_rows(const std::vector<RawEdgeRow>& rows, bool has_animal_column);

    /**
     * @brief Compute the configured metrics for every animal in the records
     */
    ResultSet process_records(const std::vector<EdgeRecord>& records, bool has_animal_column);

    /**
     * @brief Community partition of every animal's undirected graph
     */
    std::vector<std::pair<AnimalGraph, Partition>> partition_records(
        const std::vector<EdgeRecord>& records);

    /**
     * @brief Write every table and run_stats.json to the output directory
     * @return Paths written
     */
    std::vector<std::string> save_results(const ResultSet& results);

    /**
     * @brief Set progress callback
     */
    void set_progress_callback(ProgressCallback callback);

    /**
     * @brief Get run statistics
     */
    AnalysisStatistics get_statistics() const { return stats_; }

    /**
     * @brief Reset statistics
     */
    void reset_statistics();

    /**
     * @brief Get current configuration
     */
    AnalysisConfig get_config() const { return config_; }

    /**
     * @brief Update configuration
     */
    void set_config(const AnalysisConfig& config);

private:
    AnalysisConfig config_;
    AnalysisStatistics stats_;
    ProgressCallback progress_callback_;
    MetricEngine engine_;
    std::vector<MetricKind> kinds_;

    void initialize_components();

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );

    void warn(const std::string& message);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Create default configuration (defaults overlaid with the environment)
 */
AnalysisConfig create_default_config();

/**
 * @brief Load configuration from file with fallback to environment
 *
 * An explicit path must exist and parse; otherwise .fcg_config.json in the
 * working directory is used when present, then the environment.
 */
AnalysisConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace fcg
