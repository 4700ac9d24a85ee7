#include "render/partition_renderer.hpp"
#include "report/result_table.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fcg {

namespace {

std::string escape_dot(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// Grey edge colour with alpha scaled by intensity
std::string edge_colour(double intensity) {
    static const char* hex = "0123456789abcdef";
    int alpha = static_cast<int>(std::lround(55.0 + 200.0 * intensity));
    alpha = std::max(0, std::min(255, alpha));
    std::string out = "#404040";
    out.push_back(hex[alpha / 16]);
    out.push_back(hex[alpha % 16]);
    return out;
}

} // namespace

const std::vector<std::string>& community_palette() {
    static const std::vector<std::string> palette = {
        "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd", "#8c564b",
        "#e377c2", "#bcbd22", "#17becf", "#aec7e8", "#ffbb78", "#98df8a"
    };
    return palette;
}

RenderPlan build_render_plan(const WeightedGraph& graph,
                             const Partition& partition,
                             const std::string& title,
                             const RenderOptions& options) {
    const size_t n = graph.num_nodes();
    if (partition.labels.size() != n || partition.neurons.size() != n) {
        throw std::invalid_argument("Partition does not match graph: " +
                                    std::to_string(partition.labels.size()) + " labels for " +
                                    std::to_string(n) + " nodes");
    }

    RenderPlan plan;
    plan.title = title;
    plan.directed = graph.directed();

    const auto& palette = community_palette();
    for (size_t v = 0; v < n; ++v) {
        if (partition.neurons[v] != graph.node_id(v)) {
            throw std::invalid_argument("Partition node order differs at " + graph.node_id(v));
        }

        RenderNode node;
        node.neuron = graph.node_id(v);
        node.community = partition.labels[v];

        bool has_neighbour = false;
        for (const auto& [u, _] : graph.neighbors(v)) {
            if (u != v) { has_neighbour = true; break; }
        }
        if (graph.directed() && !has_neighbour) {
            // Incoming arcs also count
            for (size_t u = 0; u < n && !has_neighbour; ++u) {
                if (u != v && graph.neighbors(u).count(v)) has_neighbour = true;
            }
        }

        node.degree_zero = !has_neighbour;
        if (node.degree_zero) {
            node.colour = options.isolated_colour;
        } else {
            node.colour_index = node.community % static_cast<int>(palette.size());
            node.colour = palette[node.colour_index];
        }
        plan.nodes.push_back(std::move(node));
    }

    // Undirected pairs appear once, lower index first
    for (size_t u = 0; u < n; ++u) {
        for (const auto& [v, w] : graph.neighbors(u)) {
            if (!graph.directed() && v < u) continue;
            RenderEdge edge;
            edge.source = graph.node_id(u);
            edge.target = graph.node_id(v);
            edge.weight = w;
            plan.edges.push_back(std::move(edge));
        }
    }

    std::vector<double> sorted;
    sorted.reserve(plan.edges.size());
    for (const auto& e : plan.edges) sorted.push_back(e.weight);
    std::sort(sorted.begin(), sorted.end());

    const double span = options.max_edge_width - options.min_edge_width;
    for (auto& e : plan.edges) {
        if (sorted.size() > 1) {
            size_t below = static_cast<size_t>(
                std::lower_bound(sorted.begin(), sorted.end(), e.weight) - sorted.begin());
            e.intensity = static_cast<double>(below) / static_cast<double>(sorted.size() - 1);
        } else {
            e.intensity = 1.0;
        }
        e.width = options.min_edge_width + span * e.intensity;
    }

    return plan;
}

nlohmann::json RenderPlan::to_json() const {
    nlohmann::json j;
    j["title"] = title;
    j["directed"] = directed;

    nlohmann::json nodes_arr = nlohmann::json::array();
    for (const auto& n : nodes) {
        nodes_arr.push_back(n.to_json());
    }
    j["nodes"] = nodes_arr;

    nlohmann::json edges_arr = nlohmann::json::array();
    for (const auto& e : edges) {
        edges_arr.push_back(e.to_json());
    }
    j["edges"] = edges_arr;
    return j;
}

std::string RenderPlan::to_dot() const {
    std::ostringstream out;
    const char* connector = directed ? " -> " : " -- ";

    out << (directed ? "digraph" : "graph") << " \"" << escape_dot(title) << "\" {\n";
    out << "  layout=neato;\n";
    out << "  node [shape=circle, style=filled, fontsize=10];\n\n";

    // Write nodes
    for (const auto& node : nodes) {
        out << "  \"" << escape_dot(node.neuron) << "\" [fillcolor=\"" << node.colour << "\"";
        if (node.degree_zero) {
            out << ", tooltip=\"isolated\"";
        } else {
            out << ", tooltip=\"community " << node.community << "\"";
        }
        out << "];\n";
    }

    out << "\n";

    // Write edges
    for (const auto& edge : edges) {
        out << "  \"" << escape_dot(edge.source) << "\"" << connector
            << "\"" << escape_dot(edge.target) << "\""
            << " [penwidth=" << format_number(edge.width)
            << ", color=\"" << edge_colour(edge.intensity) << "\""
            << ", tooltip=\"" << format_number(edge.weight) << "\"];\n";
    }

    out << "}\n";
    return out.str();
}

void export_to_dot(const RenderPlan& plan, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << plan.to_dot();
}

} // namespace fcg
