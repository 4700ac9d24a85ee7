#include "graph/weighted_graph.hpp"
#include "metrics/metric_engine.hpp"
#include "render/partition_renderer.hpp"
#include "report/result_table.hpp"
#include <iostream>
#include <iomanip>

using namespace fcg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_result(const MetricResult& result) {
    std::cout << metric_kind_to_string(result.kind) << " (animal " << result.animal << ")\n";
    for (const auto& row : result.rows) {
        std::cout << "  neuron " << std::setw(4) << row.neuron;
        for (size_t i = 0; i < row.values.size(); ++i) {
            std::cout << "  " << result.columns[i] << "=" << format_number(row.values[i]);
        }
        std::cout << "\n";
    }
    for (const auto& [key, value] : result.summary) {
        std::cout << "  " << key << ": " << format_number(value) << "\n";
    }
    std::cout << "\n";
}

int main() {
    print_separator("Connectivity Example - Graph Metrics for Two Animals");

    // Rows as they appear in an exported connectivity table
    std::vector<RawEdgeRow> rows = {
        {"M1", "(1, 2)", "0.9", 1},
        {"M1", "(2, 3)", "0.8", 2},
        {"M1", "(1, 3)", "0.7", 3},
        {"M1", "(3, 4)", "0.1", 4},
        {"M1", "(4, 5)", "0.85", 5},
        {"M1", "(5, 6)", "0.9", 6},
        {"M1", "(4, 6)", "0.75", 7},
        {"M2", "(1, 2)", "0.5", 8},
        {"M2", "(2, 3)", "0.8", 9},
        {"M2", "(3, 1)", "0.4", 10},
    };

    std::vector<EdgeRecord> records = parse_edge_records(rows);
    std::cout << "Parsed " << records.size() << " edge records\n";

    MetricEngine engine;
    auto undirected = GraphBuilder::build(records, false);
    auto directed = GraphBuilder::build(records, true);

    for (size_t i = 0; i < undirected.size(); ++i) {
        const AnimalGraph& ag = undirected[i];
        print_separator("Animal " + ag.animal + ": " + std::to_string(ag.graph.num_nodes()) +
                        " neurons, " + std::to_string(ag.graph.num_edges()) + " edges");

        MetricResult pagerank = engine.compute_pagerank(directed[i].graph);
        pagerank.animal = ag.animal;
        print_result(pagerank);

        MetricResult degree = engine.compute_degree(ag.graph);
        degree.animal = ag.animal;
        print_result(degree);

        MetricResult efficiency = engine.compute_efficiency(ag.graph);
        efficiency.animal = ag.animal;
        print_result(efficiency);

        Partition partition = engine.compute_partition(ag.graph);
        print_result(partition.to_result(ag.animal));

        RenderPlan plan = build_render_plan(ag.graph, partition, ag.animal);
        std::cout << plan.to_dot() << "\n";
    }

    return 0;
}
