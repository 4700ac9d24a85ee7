#include "graph/weighted_graph.hpp"
#include <algorithm>
#include <queue>
#include <stdexcept>

namespace fcg {

namespace {

bool admits(WeightFilter filter, double weight) {
    switch (filter) {
        case WeightFilter::UnitInterval: return weight >= 0.0 && weight <= 1.0;
        default: return true;
    }
}

} // namespace

// ==========================================
// WeightedGraph
// ==========================================

WeightedGraph WeightedGraph::from_records(
    const std::vector<EdgeRecord>& records,
    bool directed,
    WeightFilter filter
) {
    WeightedGraph graph(directed);
    for (const auto& record : records) {
        if (!admits(filter, record.weight)) continue;
        graph.set_edge(record.source, record.target, record.weight);
    }
    return graph;
}

size_t WeightedGraph::add_node(const NeuronId& id) {
    auto it = index_.find(id);
    if (it != index_.end()) return it->second;

    size_t idx = node_ids_.size();
    node_ids_.push_back(id);
    index_.emplace(id, idx);
    adj_.emplace_back();
    return idx;
}

void WeightedGraph::insert_arc(size_t from, size_t to, double weight) {
    adj_[from][to] = weight;
}

void WeightedGraph::set_edge(const NeuronId& source, const NeuronId& target, double weight) {
    size_t u = add_node(source);
    size_t v = add_node(target);

    bool is_new = adj_[u].find(v) == adj_[u].end();
    insert_arc(u, v, weight);
    if (!directed_ && u != v) {
        insert_arc(v, u, weight);
    }
    if (is_new) ++num_edges_;
}

std::optional<size_t> WeightedGraph::index_of(const NeuronId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::optional<double> WeightedGraph::edge_weight(const NeuronId& source, const NeuronId& target) const {
    auto u = index_of(source);
    auto v = index_of(target);
    if (!u || !v) return std::nullopt;

    const auto& nbrs = adj_[*u];
    auto it = nbrs.find(*v);
    if (it == nbrs.end()) return std::nullopt;
    return it->second;
}

double WeightedGraph::out_strength(size_t index) const {
    double sum = 0.0;
    for (const auto& [_, w] : adj_.at(index)) sum += w;
    return sum;
}

double WeightedGraph::max_weight() const {
    bool seen = false;
    double best = 0.0;
    for (const auto& nbrs : adj_) {
        for (const auto& [_, w] : nbrs) {
            if (!seen || w > best) {
                best = w;
                seen = true;
            }
        }
    }
    return best;
}

std::vector<std::vector<size_t>> WeightedGraph::connected_components() const {
    const size_t n = node_ids_.size();

    // Weak connectivity needs the reverse arcs of a directed graph
    std::vector<std::vector<size_t>> undirected_adj(n);
    for (size_t u = 0; u < n; ++u) {
        for (const auto& [v, _] : adj_[u]) {
            if (u == v) continue;
            undirected_adj[u].push_back(v);
            if (directed_) undirected_adj[v].push_back(u);
        }
    }

    std::vector<std::vector<size_t>> components;
    std::vector<bool> visited(n, false);

    for (size_t start = 0; start < n; ++start) {
        if (visited[start]) continue;

        std::vector<size_t> component;
        std::queue<size_t> queue;
        queue.push(start);
        visited[start] = true;

        while (!queue.empty()) {
            size_t current = queue.front();
            queue.pop();
            component.push_back(current);

            for (size_t next : undirected_adj[current]) {
                if (!visited[next]) {
                    visited[next] = true;
                    queue.push(next);
                }
            }
        }

        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }

    return components;
}

WeightedGraph WeightedGraph::induced_subgraph(const std::vector<size_t>& indices) const {
    WeightedGraph subgraph(directed_);

    std::unordered_map<size_t, bool> included;
    for (size_t idx : indices) {
        if (idx >= node_ids_.size()) {
            throw std::out_of_range("induced_subgraph: node index out of range");
        }
        subgraph.add_node(node_ids_[idx]);
        included[idx] = true;
    }

    for (size_t u : indices) {
        for (const auto& [v, w] : adj_[u]) {
            if (included.count(v) == 0) continue;
            // Undirected arcs are stored twice, copy each edge once
            if (!directed_ && v < u) continue;
            subgraph.set_edge(node_ids_[u], node_ids_[v], w);
        }
    }

    return subgraph;
}

nlohmann::json WeightedGraph::to_json() const {
    nlohmann::json j;
    j["directed"] = directed_;
    j["nodes"] = node_ids_;

    nlohmann::json edges = nlohmann::json::array();
    for (size_t u = 0; u < adj_.size(); ++u) {
        for (const auto& [v, w] : adj_[u]) {
            if (!directed_ && v < u) continue;
            edges.push_back({
                {"source", node_ids_[u]},
                {"target", node_ids_[v]},
                {"weight", w}
            });
        }
    }
    j["edges"] = edges;

    j["metadata"] = {
        {"num_nodes", node_ids_.size()},
        {"num_edges", num_edges_}
    };
    return j;
}

// ==========================================
// GraphBuilder
// ==========================================

std::vector<AnimalId> GraphBuilder::animals(const std::vector<EdgeRecord>& records) {
    std::vector<AnimalId> order;
    std::unordered_map<AnimalId, bool> seen;
    for (const auto& record : records) {
        if (seen.emplace(record.animal, true).second) {
            order.push_back(record.animal);
        }
    }
    return order;
}

std::vector<AnimalGraph> GraphBuilder::build(
    const std::vector<EdgeRecord>& records,
    bool directed,
    WeightFilter filter
) {
    std::vector<AnimalGraph> graphs;
    std::unordered_map<AnimalId, size_t> slot;

    for (const auto& record : records) {
        auto it = slot.find(record.animal);
        if (it == slot.end()) {
            it = slot.emplace(record.animal, graphs.size()).first;
            AnimalGraph entry{record.animal, WeightedGraph(directed), 0, 0};
            graphs.push_back(std::move(entry));
        }

        AnimalGraph& entry = graphs[it->second];
        entry.records++;
        if (!admits(filter, record.weight)) {
            entry.dropped++;
            continue;
        }
        entry.graph.set_edge(record.source, record.target, record.weight);
    }

    return graphs;
}

} // namespace fcg
