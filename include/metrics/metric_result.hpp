#pragma once

#include "graph/edge_record.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace fcg {

// Metric kinds
enum class MetricKind {
    PAGERANK,
    CLUSTERING,
    DEGREE,
    HITS,
    EIGENVECTOR,
    COMMUNITY,
    EFFICIENCY
};

inline std::string metric_kind_to_string(MetricKind kind) {
    switch (kind) {
        case MetricKind::PAGERANK: return "pagerank";
        case MetricKind::CLUSTERING: return "clustering";
        case MetricKind::DEGREE: return "degree";
        case MetricKind::HITS: return "hits";
        case MetricKind::EIGENVECTOR: return "eigenvector";
        case MetricKind::COMMUNITY: return "community";
        case MetricKind::EFFICIENCY: return "efficiency";
        default: return "unknown";
    }
}

// Returns false for names that match no metric
inline bool string_to_metric_kind(const std::string& s, MetricKind& out) {
    if (s == "pagerank" || s == "page_rank") { out = MetricKind::PAGERANK; return true; }
    if (s == "clustering" || s == "clustering_coefficient") { out = MetricKind::CLUSTERING; return true; }
    if (s == "degree" || s == "degree_centrality") { out = MetricKind::DEGREE; return true; }
    if (s == "hits") { out = MetricKind::HITS; return true; }
    if (s == "eigenvector" || s == "eigenvector_centrality") { out = MetricKind::EIGENVECTOR; return true; }
    if (s == "community" || s == "modularity" || s == "leiden") { out = MetricKind::COMMUNITY; return true; }
    if (s == "efficiency") { out = MetricKind::EFFICIENCY; return true; }
    return false;
}

inline const std::vector<MetricKind>& all_metric_kinds() {
    static const std::vector<MetricKind> kinds = {
        MetricKind::PAGERANK, MetricKind::CLUSTERING, MetricKind::DEGREE, MetricKind::HITS,
        MetricKind::EIGENVECTOR, MetricKind::COMMUNITY, MetricKind::EFFICIENCY
    };
    return kinds;
}

// Per-node score columns a metric reports
inline std::vector<std::string> metric_score_columns(MetricKind kind) {
    switch (kind) {
        case MetricKind::PAGERANK: return {"PageRank"};
        case MetricKind::CLUSTERING: return {"Weighted Clustering Coefficient"};
        case MetricKind::DEGREE: return {"Weighted Degree", "Normalized Weighted Degree"};
        case MetricKind::HITS: return {"Hub Score", "Authority Score"};
        case MetricKind::EIGENVECTOR: return {"Eigenvector Centrality"};
        case MetricKind::COMMUNITY: return {"Community"};
        case MetricKind::EFFICIENCY: return {"Local Efficiency"};
        default: return {};
    }
}

// Graphs built for these metrics keep edge direction
inline bool metric_uses_directed_graph(MetricKind kind) {
    return kind == MetricKind::PAGERANK || kind == MetricKind::HITS;
}

struct NodeScores {
    NeuronId neuron;
    std::vector<double> values;          // Parallel to MetricResult::columns
};

// Per-animal output of one metric
struct MetricResult {
    AnimalId animal = kDefaultAnimal;
    MetricKind kind = MetricKind::PAGERANK;
    std::vector<std::string> columns;    // e.g. {"Hub Score", "Authority Score"}
    std::vector<NodeScores> rows;        // Graph node order
    std::map<std::string, double> summary; // Graph-level scalars
    bool converged = true;
    int iterations = 0;

    // Score of one neuron in one column, NaN when absent
    double value(const NeuronId& neuron, const std::string& column) const {
        size_t col = columns.size();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == column) { col = i; break; }
        }
        if (col < columns.size()) {
            for (const auto& row : rows) {
                if (row.neuron == neuron && col < row.values.size()) return row.values[col];
            }
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["animal"] = animal;
        j["metric"] = metric_kind_to_string(kind);
        j["columns"] = columns;
        j["converged"] = converged;
        j["iterations"] = iterations;
        j["summary"] = summary;

        nlohmann::json rows_arr = nlohmann::json::array();
        for (const auto& row : rows) {
            rows_arr.push_back({{"neuron", row.neuron}, {"values", row.values}});
        }
        j["rows"] = rows_arr;
        return j;
    }

    static MetricResult from_json(const nlohmann::json& j) {
        MetricResult result;
        result.animal = j.value("animal", kDefaultAnimal);
        if (!string_to_metric_kind(j.value("metric", ""), result.kind)) {
            throw std::runtime_error("Unknown metric in result: " + j.value("metric", ""));
        }
        result.columns = j.value("columns", std::vector<std::string>{});
        result.converged = j.value("converged", true);
        result.iterations = j.value("iterations", 0);
        if (j.contains("summary")) {
            result.summary = j["summary"].get<std::map<std::string, double>>();
        }
        if (j.contains("rows")) {
            for (const auto& row : j["rows"]) {
                NodeScores scores;
                scores.neuron = row.at("neuron").get<std::string>();
                scores.values = row.at("values").get<std::vector<double>>();
                result.rows.push_back(std::move(scores));
            }
        }
        return result;
    }
};

} // namespace fcg
