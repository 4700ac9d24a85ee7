#ifndef WEIGHTED_GRAPH_HPP
#define WEIGHTED_GRAPH_HPP

#include "graph/edge_record.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace fcg {

/**
 * @brief Weight admission rule applied while building a graph
 */
enum class WeightFilter {
    None,           ///< Keep every record
    UnitInterval    ///< Drop records with weight outside [0, 1]
};

/**
 * @brief Static weighted graph over one animal's neurons
 *
 * Nodes are indexed densely in order of first appearance; every algorithm
 * works on indices and maps back to NeuronId only when reporting. Adjacency
 * is an ordered map per node so iteration order is deterministic.
 *
 * In an undirected graph an edge (a, b, w) is stored under both endpoints.
 * Re-adding an existing (ordered, or for undirected graphs unordered) pair
 * overwrites its weight.
 */
class WeightedGraph {
public:
    using Adjacency = std::map<size_t, double>;

    explicit WeightedGraph(bool directed = false) : directed_(directed) {}

    /**
     * @brief Build a graph from records, ignoring their animal key
     */
    static WeightedGraph from_records(
        const std::vector<EdgeRecord>& records,
        bool directed,
        WeightFilter filter = WeightFilter::None
    );

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Add a node without edges, returns its index
     *
     * Existing nodes are left untouched.
     */
    size_t add_node(const NeuronId& id);

    /**
     * @brief Insert or overwrite the edge source -> target
     */
    void set_edge(const NeuronId& source, const NeuronId& target, double weight);

    // ==========================================
    // Queries
    // ==========================================

    bool directed() const { return directed_; }
    size_t num_nodes() const { return node_ids_.size(); }

    /**
     * @brief Number of stored edges (an undirected edge counts once)
     */
    size_t num_edges() const { return num_edges_; }

    bool empty() const { return node_ids_.empty(); }

    const std::vector<NeuronId>& node_ids() const { return node_ids_; }
    const NeuronId& node_id(size_t index) const { return node_ids_.at(index); }
    std::optional<size_t> index_of(const NeuronId& id) const;
    bool has_node(const NeuronId& id) const { return index_.count(id) > 0; }

    /**
     * @brief Outgoing adjacency (for undirected graphs: all neighbours)
     */
    const Adjacency& neighbors(size_t index) const { return adj_.at(index); }

    std::optional<double> edge_weight(const NeuronId& source, const NeuronId& target) const;

    /**
     * @brief Sum of outgoing weights of a node; a self loop counts once
     */
    double out_strength(size_t index) const;

    /**
     * @brief Largest edge weight, 0 for an edgeless graph
     */
    double max_weight() const;

    /**
     * @brief Connected components as node index lists
     *
     * Discovered by BFS seeded in node order; edge direction is ignored.
     * Components keep discovery order, they are not sorted by size.
     */
    std::vector<std::vector<size_t>> connected_components() const;

    /**
     * @brief Graph induced on the given node indices
     *
     * Node order of the result follows the order of `indices`.
     */
    WeightedGraph induced_subgraph(const std::vector<size_t>& indices) const;

    nlohmann::json to_json() const;

private:
    bool directed_;
    size_t num_edges_ = 0;
    std::vector<NeuronId> node_ids_;
    std::unordered_map<NeuronId, size_t> index_;
    std::vector<Adjacency> adj_;

    void insert_arc(size_t from, size_t to, double weight);
};

/**
 * @brief One animal's graph as produced by the builder
 */
struct AnimalGraph {
    AnimalId animal;
    WeightedGraph graph;
    size_t records = 0;                                // Records seen for this animal
    size_t dropped = 0;                                // Records rejected by the filter
};

/**
 * @brief Groups records by animal and builds one graph per animal
 */
class GraphBuilder {
public:
    /**
     * @brief Build one graph per animal
     * @param records Parsed edge records
     * @param directed Orientation of the resulting graphs
     * @param filter Weight admission rule
     * @return Graphs in order of each animal's first occurrence
     */
    static std::vector<AnimalGraph> build(
        const std::vector<EdgeRecord>& records,
        bool directed,
        WeightFilter filter = WeightFilter::None
    );

    /**
     * @brief Distinct animals in order of first occurrence
     */
    static std::vector<AnimalId> animals(const std::vector<EdgeRecord>& records);
};

} // namespace fcg

#endif // WEIGHTED_GRAPH_HPP
