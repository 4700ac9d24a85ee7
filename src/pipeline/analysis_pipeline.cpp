#include "pipeline/analysis_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>

using json = nlohmann::json;

namespace {

std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_copy(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) items.push_back(to_lower_copy(item));
    }
    return items;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start
    ).count();
}

}  // namespace

namespace fcg {

// ============================================================================
// AnalysisConfig
// ============================================================================

AnalysisConfig AnalysisConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

AnalysisConfig AnalysisConfig::from_json(const json& j) {
    AnalysisConfig config;

    // Input columns
    if (j.contains("animal_column")) config.animal_column = j["animal_column"];
    if (j.contains("pair_column")) config.pair_column = j["pair_column"];
    if (j.contains("weight_column")) config.weight_column = j["weight_column"];

    // Metrics: array of names or a comma separated string
    if (j.contains("metrics")) {
        if (j["metrics"].is_string()) {
            config.metrics = split_list(j["metrics"].get<std::string>());
        } else {
            config.metrics = j["metrics"].get<std::vector<std::string>>();
        }
    }

    // Algorithm parameters
    if (j.contains("pagerank_damping")) config.pagerank_damping = j["pagerank_damping"];
    if (j.contains("pagerank_tolerance")) config.pagerank_tolerance = j["pagerank_tolerance"];
    if (j.contains("pagerank_max_iterations")) config.pagerank_max_iterations = j["pagerank_max_iterations"];
    if (j.contains("hits_tolerance")) config.hits_tolerance = j["hits_tolerance"];
    if (j.contains("hits_max_iterations")) config.hits_max_iterations = j["hits_max_iterations"];
    if (j.contains("eigenvector_tolerance")) config.eigenvector_tolerance = j["eigenvector_tolerance"];
    if (j.contains("eigenvector_max_iterations")) config.eigenvector_max_iterations = j["eigenvector_max_iterations"];
    if (j.contains("community_resolution")) config.community_resolution = j["community_resolution"];
    if (j.contains("community_max_levels")) config.community_max_levels = j["community_max_levels"];
    if (j.contains("efficiency_min_distance")) config.efficiency_min_distance = j["efficiency_min_distance"];

    // Output config
    if (j.contains("output_directory")) config.output_directory = j["output_directory"];
    if (j.contains("output_format")) config.output_format = j["output_format"];
    if (j.contains("write_json")) config.write_json = j["write_json"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

json AnalysisConfig::to_json() const {
    json j;

    j["animal_column"] = animal_column;
    j["pair_column"] = pair_column;
    j["weight_column"] = weight_column;

    j["metrics"] = metrics;

    j["pagerank_damping"] = pagerank_damping;
    j["pagerank_tolerance"] = pagerank_tolerance;
    j["pagerank_max_iterations"] = pagerank_max_iterations;
    j["hits_tolerance"] = hits_tolerance;
    j["hits_max_iterations"] = hits_max_iterations;
    j["eigenvector_tolerance"] = eigenvector_tolerance;
    j["eigenvector_max_iterations"] = eigenvector_max_iterations;
    j["community_resolution"] = community_resolution;
    j["community_max_levels"] = community_max_levels;
    j["efficiency_min_distance"] = efficiency_min_distance;

    j["output_directory"] = output_directory;
    j["output_format"] = output_format;
    j["write_json"] = write_json;
    j["verbose"] = verbose;

    return j;
}

void AnalysisConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

AnalysisConfig AnalysisConfig::from_environment() {
    AnalysisConfig config;

    const char* output_dir = std::getenv("FCG_OUTPUT_DIR");
    if (output_dir) config.output_directory = output_dir;

    const char* metrics = std::getenv("FCG_METRICS");
    if (metrics) {
        auto names = split_list(metrics);
        if (!names.empty()) config.metrics = names;
    }

    const char* verbose = std::getenv("FCG_VERBOSE");
    if (verbose) {
        std::string v = to_lower_copy(trim_copy(verbose));
        config.verbose = !(v == "0" || v == "false" || v == "no" || v == "off");
    }

    return config;
}

bool AnalysisConfig::validate(std::string& error_message) const {
    if (pair_column.empty() || weight_column.empty()) {
        error_message = "Pair and weight column names must not be empty";
        return false;
    }

    if (metrics.empty()) {
        error_message = "At least one metric must be selected";
        return false;
    }

    for (const auto& name : metrics) {
        MetricKind kind;
        if (name != "all" && !string_to_metric_kind(name, kind)) {
            error_message = "Unknown metric: " + name;
            return false;
        }
    }

    if (!(pagerank_damping > 0.0 && pagerank_damping < 1.0)) {
        error_message = "PageRank damping must be between 0.0 and 1.0 (exclusive)";
        return false;
    }

    if (!(pagerank_tolerance > 0.0) || !(hits_tolerance > 0.0) || !(eigenvector_tolerance > 0.0)) {
        error_message = "Convergence tolerances must be positive";
        return false;
    }

    if (pagerank_max_iterations <= 0 || hits_max_iterations <= 0 ||
        eigenvector_max_iterations <= 0) {
        error_message = "Iteration caps must be positive";
        return false;
    }

    if (!(community_resolution > 0.0)) {
        error_message = "Community resolution must be positive";
        return false;
    }

    if (community_max_levels <= 0) {
        error_message = "Community max levels must be positive";
        return false;
    }

    if (!(efficiency_min_distance > 0.0)) {
        error_message = "Efficiency minimum distance must be positive";
        return false;
    }

    if (output_format != "csv" && output_format != "tsv") {
        error_message = "Invalid output format: " + output_format;
        return false;
    }

    if (output_directory.empty()) {
        error_message = "Output directory must not be empty";
        return false;
    }

    return true;
}

MetricConfig AnalysisConfig::metric_config() const {
    MetricConfig mc;
    mc.pagerank_damping = pagerank_damping;
    mc.pagerank_tolerance = pagerank_tolerance;
    mc.pagerank_max_iterations = pagerank_max_iterations;
    mc.hits_tolerance = hits_tolerance;
    mc.hits_max_iterations = hits_max_iterations;
    mc.eigenvector_tolerance = eigenvector_tolerance;
    mc.eigenvector_max_iterations = eigenvector_max_iterations;
    mc.community_resolution = community_resolution;
    mc.community_max_levels = community_max_levels;
    mc.efficiency_min_distance = efficiency_min_distance;
    return mc;
}

EdgeTableColumns AnalysisConfig::edge_table_columns() const {
    EdgeTableColumns columns;
    columns.animal = animal_column;
    columns.pair = pair_column;
    columns.weight = weight_column;
    return columns;
}

std::vector<MetricKind> AnalysisConfig::metric_kinds() const {
    std::vector<MetricKind> kinds;
    auto push_unique = [&kinds](MetricKind kind) {
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) kinds.push_back(kind);
    };

    for (const auto& name : metrics) {
        if (name == "all") {
            for (MetricKind kind : all_metric_kinds()) push_unique(kind);
            continue;
        }
        MetricKind kind;
        if (!string_to_metric_kind(name, kind)) {
            throw std::invalid_argument("Unknown metric: " + name);
        }
        push_unique(kind);
    }
    return kinds;
}

// ============================================================================
// AnalysisStatistics
// ============================================================================

void AnalysisStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Analysis Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Input:\n";
    std::cout << "  Rows read: " << rows_read << "\n";
    std::cout << "  Records loaded: " << records_loaded << "\n";
    std::cout << "  Animals processed: " << animals_processed << "\n";
    if (records_dropped_for_efficiency > 0) {
        std::cout << "  Edges outside [0, 1] (efficiency only): "
                  << records_dropped_for_efficiency << "\n";
    }
    std::cout << "\n";

    std::cout << "Metrics:\n";
    for (const auto& [name, count] : metrics_computed) {
        std::cout << "  " << name << ": " << count << " computed";
        auto skipped = metrics_skipped.find(name);
        if (skipped != metrics_skipped.end()) {
            std::cout << ", " << skipped->second << " skipped";
        }
        auto lenient = metrics_not_converged.find(name);
        if (lenient != metrics_not_converged.end()) {
            std::cout << ", " << lenient->second << " not converged";
        }
        std::cout << "\n";
    }
    for (const auto& [name, count] : metrics_skipped) {
        if (metrics_computed.count(name) == 0) {
            std::cout << "  " << name << ": 0 computed, " << count << " skipped\n";
        }
    }
    std::cout << "\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Graph building: " << graph_building_time_seconds << " seconds\n";
    std::cout << "  Metrics: " << metric_time_seconds << " seconds\n";

    if (!warnings.empty()) {
        std::cout << "\nWarnings: " << warnings.size() << "\n";
    }

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json AnalysisStatistics::to_json() const {
    json j;

    j["rows_read"] = rows_read;
    j["records_loaded"] = records_loaded;
    j["animals_processed"] = animals_processed;
    j["records_dropped_for_efficiency"] = records_dropped_for_efficiency;

    j["metrics_computed"] = metrics_computed;
    j["metrics_skipped"] = metrics_skipped;
    j["metrics_not_converged"] = metrics_not_converged;
    j["warnings"] = warnings;

    j["total_time_seconds"] = total_time_seconds;
    j["graph_building_time_seconds"] = graph_building_time_seconds;
    j["metric_time_seconds"] = metric_time_seconds;

    return j;
}

// ============================================================================
// AnalysisPipeline
// ============================================================================

AnalysisPipeline::AnalysisPipeline(const AnalysisConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    initialize_components();
}

void AnalysisPipeline::initialize_components() {
    kinds_ = config_.metric_kinds();
    engine_ = MetricEngine(config_.metric_config());
    engine_.set_progress_callback([this](const std::string& stage, int current, int total) {
        if (progress_callback_) progress_callback_(stage, current, total, "");
    });
}

LoadedEdges AnalysisPipeline::load(const std::string& path) {
    auto start_time = std::chrono::high_resolution_clock::now();

    report_progress("Loading edge table", 0, 1, path);

    EdgeTableReader reader(config_.edge_table_columns());
    EdgeTable table = reader.read(path);

    LoadedEdges loaded;
    loaded.records = parse_edge_records(table.rows);
    loaded.has_animal_column = table.has_animal_column;
    loaded.rows_read = static_cast<int>(table.rows.size());

    stats_.rows_read += loaded.rows_read;
    stats_.total_time_seconds += seconds_since(start_time);

    if (config_.verbose) {
        std::cout << "Loaded " << loaded.records.size() << " edge records from " << path << "\n";
    }

    return loaded;
}

ResultSet AnalysisPipeline::process_file(const std::string& path) {
    LoadedEdges loaded = load(path);
    return process_records(loaded.records, loaded.has_animal_column);
}

ResultSet AnalysisPipeline::process_rows(const std::vector<RawEdgeRow>& rows, bool has_animal_column) {
    stats_.rows_read += static_cast<int>(rows.size());
    return process_records(parse_edge_records(rows), has_animal_column);
}

ResultSet AnalysisPipeline::process_records(const std::vector<EdgeRecord>& records,
                                            bool has_animal_column) {
    auto start_time = std::chrono::high_resolution_clock::now();
    stats_.records_loaded += static_cast<int>(records.size());

    bool need_directed = false;
    bool need_undirected = false;
    bool need_unit = false;
    for (MetricKind kind : kinds_) {
        if (kind == MetricKind::EFFICIENCY) need_unit = true;
        else if (metric_uses_directed_graph(kind)) need_directed = true;
        else need_undirected = true;
    }

    // Graphs per orientation; every build yields the same animal order
    auto graph_start = std::chrono::high_resolution_clock::now();
    std::vector<AnimalGraph> directed;
    std::vector<AnimalGraph> undirected;
    std::vector<AnimalGraph> unit;
    if (need_directed) directed = GraphBuilder::build(records, true);
    if (need_undirected) undirected = GraphBuilder::build(records, false);
    if (need_unit) unit = GraphBuilder::build(records, false, WeightFilter::UnitInterval);
    stats_.graph_building_time_seconds += seconds_since(graph_start);

    std::vector<AnimalId> animals = GraphBuilder::animals(records);
    ResultSet results(has_animal_column, kinds_);

    for (size_t i = 0; i < animals.size(); ++i) {
        const AnimalId& animal = animals[i];
        report_progress("Animal", static_cast<int>(i + 1), static_cast<int>(animals.size()), animal);

        if (need_unit) {
            stats_.records_dropped_for_efficiency += static_cast<int>(unit[i].dropped);
        }

        for (MetricKind kind : kinds_) {
            const std::string name = metric_kind_to_string(kind);
            const WeightedGraph& graph =
                kind == MetricKind::EFFICIENCY ? unit[i].graph
                : metric_uses_directed_graph(kind) ? directed[i].graph
                : undirected[i].graph;

            auto metric_start = std::chrono::high_resolution_clock::now();
            try {
                MetricResult result = engine_.run(kind, graph);
                result.animal = animal;
                if (!result.converged) {
                    stats_.metrics_not_converged[name]++;
                    warn(name + " did not converge for animal " + animal + " after " +
                         std::to_string(result.iterations) + " iterations");
                }
                stats_.metrics_computed[name]++;
                results.add(std::move(result));
            } catch (const ConvergenceError& e) {
                stats_.metrics_skipped[name]++;
                results.add_skipped(animal, kind, e.what());
                warn(name + " skipped for animal " + animal + ": " + e.what());
            }
            stats_.metric_time_seconds += seconds_since(metric_start);
        }

        stats_.animals_processed++;
    }

    stats_.total_time_seconds += seconds_since(start_time);
    return results;
}

std::vector<std::pair<AnimalGraph, Partition>> AnalysisPipeline::partition_records(
    const std::vector<EdgeRecord>& records) {
    auto start_time = std::chrono::high_resolution_clock::now();
    stats_.records_loaded += static_cast<int>(records.size());

    std::vector<AnimalGraph> graphs = GraphBuilder::build(records, false);

    std::vector<std::pair<AnimalGraph, Partition>> partitions;
    for (size_t i = 0; i < graphs.size(); ++i) {
        report_progress("Partitioning", static_cast<int>(i + 1),
                        static_cast<int>(graphs.size()), graphs[i].animal);
        Partition partition = engine_.compute_partition(graphs[i].graph);
        stats_.metrics_computed[metric_kind_to_string(MetricKind::COMMUNITY)]++;
        stats_.animals_processed++;
        partitions.emplace_back(std::move(graphs[i]), std::move(partition));
    }

    stats_.total_time_seconds += seconds_since(start_time);
    return partitions;
}

std::vector<std::string> AnalysisPipeline::save_results(const ResultSet& results) {
    std::vector<std::string> written =
        results.save(config_.output_directory, config_.output_format, config_.write_json);

    std::string stats_path = config_.output_directory + "/run_stats.json";
    std::ofstream file(stats_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + stats_path);
    }
    file << stats_.to_json().dump(2);
    written.push_back(stats_path);

    if (config_.verbose) {
        for (const auto& path : written) {
            std::cout << "Saved: " << path << "\n";
        }
    }
    return written;
}

void AnalysisPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void AnalysisPipeline::reset_statistics() {
    stats_ = AnalysisStatistics();
}

void AnalysisPipeline::set_config(const AnalysisConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    config_ = config;
    initialize_components();
}

void AnalysisPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

void AnalysisPipeline::warn(const std::string& message) {
    stats_.warnings.push_back(message);
    if (config_.verbose) {
        std::cerr << "Warning: " << message << "\n";
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

AnalysisConfig create_default_config() {
    return AnalysisConfig::from_environment();
}

AnalysisConfig load_config_with_fallback(const std::string& config_path) {
    // An explicitly requested file must load
    if (!config_path.empty()) {
        return AnalysisConfig::from_json_file(config_path);
    }

    const std::string local_config = ".fcg_config.json";
    if (file_exists(local_config)) {
        return AnalysisConfig::from_json_file(local_config);
    }

    // Fallback to environment
    return AnalysisConfig::from_environment();
}

} // namespace fcg
