#include "cli/cli.hpp"
#include "graph/weighted_graph.hpp"
#include "io/edge_table.hpp"
#include "metrics/metric_engine.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "render/partition_renderer.hpp"
#include "report/result_table.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

using namespace fcg;

// ============== Helper Functions ==============

// Animal ids end up in file names
std::string file_safe(const std::string& id) {
    std::string out;
    for (unsigned char c : id) {
        out.push_back(std::isalnum(c) || c == '-' || c == '_' || c == '.' ? static_cast<char>(c) : '_');
    }
    return out.empty() ? "animal" : out;
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

std::vector<std::string> lower_list(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    for (auto item : items) {
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.push_back(item);
    }
    return out;
}

// Load config and apply the overrides shared by every command
AnalysisConfig resolve_config(const Args& args) {
    AnalysisConfig config = load_config_with_fallback(args.get("config", "").value);
    if (args.has("quiet")) config.verbose = false;
    return config;
}

// ============== fcg metrics ==============
int cmd_metrics(const Args& args) {
    std::string input_path = args.require("input");
    auto start = std::chrono::steady_clock::now();

    AnalysisConfig config = resolve_config(args);
    if (args.has("output")) config.output_directory = args.get("output").value;
    if (args.has("metrics")) config.metrics = lower_list(args.get("metrics").as_list());
    if (args.has("format")) config.output_format = args.get("format").value;
    if (args.has("no-json")) config.write_json = false;

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    AnalysisPipeline pipeline(config);
    if (config.verbose) {
        pipeline.set_progress_callback(
            [](const std::string& stage, int current, int total, const std::string& message) {
                std::cout << "[" << stage << "] " << current << "/" << total;
                if (!message.empty()) std::cout << " " << message;
                std::cout << "\n";
            });
    }
    ResultSet results = pipeline.process_file(input_path);
    pipeline.save_results(results);

    auto stats = pipeline.get_statistics();
    if (config.verbose) {
        stats.print_summary();
    }

    std::cout << "Computed " << results.metrics().size() << " metric table(s) for "
              << stats.animals_processed << " animal(s) in "
              << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    std::cout << "Output: " << config.output_directory << "/\n";
    if (!stats.warnings.empty()) {
        std::cout << stats.warnings.size() << " warning(s), see run_stats.json\n";
    }
    return 0;
}

// ============== fcg partition ==============
int cmd_partition(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_dir = args.require("output");

    AnalysisConfig config = resolve_config(args);
    config.output_directory = output_dir;
    if (args.has("resolution")) config.community_resolution = args.get("resolution").as_double();

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    AnalysisPipeline pipeline(config);
    LoadedEdges loaded = pipeline.load(input_path);

    std::vector<EdgeRecord> records;
    if (args.has("animal")) {
        std::string wanted = args.get("animal").value;
        for (const auto& r : loaded.records) {
            if (r.animal == wanted) records.push_back(r);
        }
        if (records.empty()) {
            std::cerr << "No edges for animal: " << wanted << "\n";
            return 1;
        }
    } else {
        records = loaded.records;
    }

    auto partitions = pipeline.partition_records(records);

    ensure_directory(output_dir);
    ResultSet results(loaded.has_animal_column, {MetricKind::COMMUNITY});
    for (const auto& [animal_graph, partition] : partitions) {
        results.add(partition.to_result(animal_graph.animal));

        RenderPlan plan = build_render_plan(animal_graph.graph, partition, animal_graph.animal);
        std::string base = output_dir + "/partition_" + file_safe(animal_graph.animal);
        export_to_dot(plan, base + ".dot");

        std::ofstream plan_file(base + ".json");
        if (!plan_file.is_open()) {
            throw std::runtime_error("Failed to open output file: " + base + ".json");
        }
        plan_file << plan.to_json().dump(2);

        std::cout << "  " << animal_graph.animal << ": " << partition.community_count
                  << " communities, modularity " << format_number(partition.modularity)
                  << " -> " << base << ".dot\n";
    }

    ResultTable table = results.table(MetricKind::COMMUNITY);
    char delimiter = config.output_format == "tsv" ? '\t' : ',';
    table.write_delimited(output_dir + "/community." + config.output_format, delimiter);
    if (config.write_json) {
        std::ofstream file(output_dir + "/community.json");
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open output file: " + output_dir + "/community.json");
        }
        file << table.to_json().dump(2);
    }

    std::cout << "Partitioned " << partitions.size() << " animal(s) into " << output_dir << "/\n";
    return 0;
}

// ============== fcg stats ==============
int cmd_stats(const Args& args) {
    std::string input_path = args.require("input");

    AnalysisConfig config = resolve_config(args);
    EdgeTableReader reader(config.edge_table_columns());
    EdgeTable table = reader.read(input_path);
    std::vector<EdgeRecord> records = parse_edge_records(table.rows);

    std::cout << "\nEdge table: " << input_path << "\n";
    std::cout << "  Rows: " << table.rows.size() << "\n";
    std::cout << "  Animal column: " << (table.has_animal_column ? "yes" : "no") << "\n\n";

    auto graphs = GraphBuilder::build(records, false);

    std::cout << std::left << std::setw(20) << "Animal"
              << std::right << std::setw(8) << "Nodes"
              << std::setw(8) << "Edges"
              << std::setw(12) << "Components"
              << std::setw(14) << "Min weight"
              << std::setw(14) << "Max weight"
              << std::setw(12) << "Out of [0,1]" << "\n";
    std::cout << std::string(88, '-') << "\n";

    for (const auto& ag : graphs) {
        double min_w = std::numeric_limits<double>::infinity();
        double max_w = -std::numeric_limits<double>::infinity();
        int outside = 0;
        for (const auto& r : records) {
            if (r.animal != ag.animal) continue;
            min_w = std::min(min_w, r.weight);
            max_w = std::max(max_w, r.weight);
            if (r.weight < 0.0 || r.weight > 1.0) outside++;
        }

        std::cout << std::left << std::setw(20) << ag.animal
                  << std::right << std::setw(8) << ag.graph.num_nodes()
                  << std::setw(8) << ag.graph.num_edges()
                  << std::setw(12) << ag.graph.connected_components().size()
                  << std::setw(14) << format_number(min_w)
                  << std::setw(14) << format_number(max_w)
                  << std::setw(12) << outside << "\n";
    }
    std::cout << "\n";
    return 0;
}

// ============== fcg config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.require("output");

    AnalysisConfig config = resolve_config(args);
    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    config.to_json_file(output_path);
    std::cout << "Saved configuration: " << output_path << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("fcg", "1.0.0");

    // fcg metrics
    cli.register_command({
        "metrics",
        "Compute graph metrics for every animal in an edge table",
        {
            {"input", "i", "Input edge table (CSV/TSV)", "", true, false},
            {"output", "o", "Output directory for metric tables", "", false, false},
            {"metrics", "m", "Metrics: pagerank,clustering,degree,hits,eigenvector,community,efficiency (or 'all')", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"format", "f", "Table format: csv, tsv", "", false, false},
            {"no-json", "", "Do not mirror tables as JSON", "", false, true},
            {"quiet", "q", "Only print the final summary line", "", false, true}
        },
        cmd_metrics
    });

    // fcg partition
    cli.register_command({
        "partition",
        "Partition each animal's graph into communities and export DOT renders",
        {
            {"input", "i", "Input edge table (CSV/TSV)", "", true, false},
            {"output", "o", "Output directory", "", true, false},
            {"animal", "a", "Only this animal", "", false, false},
            {"resolution", "r", "Modularity resolution", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"quiet", "q", "Less console output", "", false, true}
        },
        cmd_partition
    });

    // fcg stats
    cli.register_command({
        "stats",
        "Print per-animal statistics about an edge table",
        {
            {"input", "i", "Input edge table (CSV/TSV)", "", true, false},
            {"config", "c", "Path to config file (optional, for column names)", "", false, false}
        },
        cmd_stats
    });

    // fcg config
    cli.register_command({
        "config",
        "Write the effective configuration as JSON",
        {
            {"output", "o", "Output path for the config file", "", true, false},
            {"config", "c", "Config file to start from (optional)", "", false, false}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
