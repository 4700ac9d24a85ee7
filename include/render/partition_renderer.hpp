#pragma once

#include "graph/weighted_graph.hpp"
#include "metrics/metric_engine.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fcg {

// Drawing parameters
struct RenderOptions {
    double min_edge_width = 0.5;        // Width of the weakest edge
    double max_edge_width = 4.0;        // Width of the strongest edge
    std::string isolated_colour = "#d3d3d3";
};

// One neuron in the drawing
struct RenderNode {
    NeuronId neuron;
    int community = -1;
    int colour_index = -1;              // Palette slot, -1 for degree-zero nodes
    bool degree_zero = false;           // No edge to another neuron
    std::string colour;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["neuron"] = neuron;
        j["community"] = community;
        j["colour_index"] = colour_index;
        j["degree_zero"] = degree_zero;
        j["colour"] = colour;
        return j;
    }
};

// One edge in the drawing
struct RenderEdge {
    NeuronId source;
    NeuronId target;
    double weight = 0.0;
    double intensity = 0.0;             // Weight percentile among all edges, [0, 1]
    double width = 0.0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["source"] = source;
        j["target"] = target;
        j["weight"] = weight;
        j["intensity"] = intensity;
        j["width"] = width;
        return j;
    }
};

// Complete drawing instructions for one partitioned graph
struct RenderPlan {
    std::string title;
    bool directed = false;
    std::vector<RenderNode> nodes;
    std::vector<RenderEdge> edges;

    nlohmann::json to_json() const;

    /**
     * @brief Graphviz DOT text
     */
    std::string to_dot() const;
};

/**
 * @brief Fixed community colour palette
 */
const std::vector<std::string>& community_palette();

/**
 * @brief Turn a graph and its partition into drawing instructions
 *
 * Pure function: nodes follow graph order and take the palette colour of
 * their community; edges are listed once per stored pair and scaled by the
 * percentile rank of their weight (ties share the lowest rank).
 *
 * @throws std::invalid_argument if the partition does not label every node
 */
RenderPlan build_render_plan(const WeightedGraph& graph,
                             const Partition& partition,
                             const std::string& title = "partition",
                             const RenderOptions& options = RenderOptions{});

/**
 * @brief Write a plan as a .dot file
 */
void export_to_dot(const RenderPlan& plan, const std::string& filename);

} // namespace fcg
