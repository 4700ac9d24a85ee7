#include "metrics/metric_engine.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <unordered_map>

namespace fcg {

namespace {

constexpr double kGainEpsilon = 1e-12;

// Symmetric weighted graph used at every aggregation level.
// The diagonal holds A_ii, i.e. twice the weight internal to a node.
struct LevelGraph {
    std::vector<std::map<size_t, double>> adj;
    std::vector<double> k;

    size_t size() const { return adj.size(); }
};

LevelGraph to_level_graph(const WeightedGraph& graph) {
    LevelGraph g;
    const size_t n = graph.num_nodes();
    g.adj.resize(n);
    g.k.assign(n, 0.0);
    for (size_t u = 0; u < n; ++u) {
        for (const auto& [v, w] : graph.neighbors(u)) {
            g.adj[u][v] += (u == v) ? 2.0 * w : w;
        }
    }
    for (size_t u = 0; u < n; ++u) {
        for (const auto& [_, w] : g.adj[u]) g.k[u] += w;
    }
    return g;
}

double total_strength(const LevelGraph& g) {
    double two_m = 0.0;
    for (double k : g.k) two_m += k;
    return two_m;
}

// Renumber labels densely in order of first occurrence
size_t renumber(std::vector<size_t>& labels) {
    std::unordered_map<size_t, size_t> remap;
    for (auto& c : labels) {
        auto it = remap.find(c);
        if (it == remap.end()) it = remap.emplace(c, remap.size()).first;
        c = it->second;
    }
    return remap.size();
}

// Local moving phase. Nodes are visited from a queue seeded in index order;
// a node moves to the neighbouring community with the strictly best gain,
// candidate communities are scanned in ascending id so ties resolve the same
// way on every run.
bool move_nodes(const LevelGraph& g, std::vector<size_t>& comm, double gamma, double two_m) {
    const size_t n = g.size();
    std::vector<double> tot(n, 0.0);
    std::vector<size_t> members(n, 0);
    for (size_t v = 0; v < n; ++v) {
        tot[comm[v]] += g.k[v];
        members[comm[v]]++;
    }
    std::set<size_t> empty_ids;
    for (size_t c = 0; c < n; ++c) {
        if (members[c] == 0) empty_ids.insert(c);
    }

    std::deque<size_t> queue;
    std::vector<bool> queued(n, true);
    for (size_t v = 0; v < n; ++v) queue.push_back(v);

    bool changed = false;
    while (!queue.empty()) {
        size_t v = queue.front();
        queue.pop_front();
        queued[v] = false;

        std::map<size_t, double> links;
        for (const auto& [u, w] : g.adj[v]) {
            if (u != v) links[comm[u]] += w;
        }

        size_t current = comm[v];
        tot[current] -= g.k[v];
        members[current]--;

        double own_links = 0.0;
        auto own = links.find(current);
        if (own != links.end()) own_links = own->second;

        size_t best = current;
        double best_gain = own_links - gamma * g.k[v] * tot[current] / two_m;
        for (const auto& [c, w] : links) {
            if (c == current) continue;
            double gain = w - gamma * g.k[v] * tot[c] / two_m;
            if (gain > best_gain + kGainEpsilon) {
                best_gain = gain;
                best = c;
            }
        }

        // Leaving for an empty community scores zero
        if (best_gain < -kGainEpsilon && members[current] > 0 && !empty_ids.empty()) {
            best = *empty_ids.begin();
            best_gain = 0.0;
        }

        tot[best] += g.k[v];
        members[best]++;
        if (members[current] == 0) empty_ids.insert(current);
        empty_ids.erase(best);

        if (best != current) {
            comm[v] = best;
            changed = true;
            for (const auto& [u, _] : g.adj[v]) {
                if (u != v && comm[u] != best && !queued[u]) {
                    queued[u] = true;
                    queue.push_back(u);
                }
            }
        }
    }

    return changed;
}

// Refinement phase. Within each community, singleton nodes that are well
// connected to the rest of the community merge greedily into a well connected
// sub-community; nodes are taken in index order.
std::vector<size_t> refine_partition(const LevelGraph& g, const std::vector<size_t>& comm,
                                     double gamma, double two_m) {
    const size_t n = g.size();
    std::vector<size_t> refined(n);
    std::vector<double> rtot(n, 0.0);
    std::vector<size_t> rsize(n, 1);
    std::vector<double> ctot(n, 0.0);
    std::vector<double> inside(n, 0.0);   // weight from v to the rest of its community
    std::vector<double> ext(n, 0.0);      // weight from a sub-community to the rest of its community

    for (size_t v = 0; v < n; ++v) {
        refined[v] = v;
        rtot[v] = g.k[v];
        ctot[comm[v]] += g.k[v];
        for (const auto& [u, w] : g.adj[v]) {
            if (u != v && comm[u] == comm[v]) inside[v] += w;
        }
        ext[v] = inside[v];
    }

    for (size_t v = 0; v < n; ++v) {
        size_t r_v = refined[v];
        if (rsize[r_v] != 1) continue;

        size_t c = comm[v];
        if (inside[v] < gamma * g.k[v] * (ctot[c] - g.k[v]) / two_m) continue;

        std::map<size_t, double> links;
        for (const auto& [u, w] : g.adj[v]) {
            if (u != v && comm[u] == c) links[refined[u]] += w;
        }

        size_t best = r_v;
        double best_gain = 0.0;
        double best_links = 0.0;
        for (const auto& [r, w] : links) {
            if (r == r_v) continue;
            if (ext[r] < gamma * rtot[r] * (ctot[c] - rtot[r]) / two_m) continue;
            double gain = w - gamma * g.k[v] * rtot[r] / two_m;
            if (gain > best_gain + kGainEpsilon) {
                best_gain = gain;
                best = r;
                best_links = w;
            }
        }

        if (best != r_v) {
            refined[v] = best;
            rtot[best] += g.k[v];
            rsize[best]++;
            rtot[r_v] = 0.0;
            rsize[r_v] = 0;
            ext[best] += inside[v] - 2.0 * best_links;
        }
    }

    return refined;
}

// Collapse each refined community into one node
LevelGraph aggregate(const LevelGraph& g, const std::vector<size_t>& refined, size_t count) {
    LevelGraph agg;
    agg.adj.resize(count);
    agg.k.assign(count, 0.0);
    for (size_t u = 0; u < g.size(); ++u) {
        size_t ru = refined[u];
        agg.k[ru] += g.k[u];
        for (const auto& [v, w] : g.adj[u]) {
            agg.adj[ru][refined[v]] += w;
        }
    }
    return agg;
}

} // namespace

// ============== COMMUNITY PARTITIONING (LEIDEN) ==============
Partition MetricEngine::compute_partition(const WeightedGraph& graph) const {
    Partition partition;
    partition.neurons = graph.node_ids();
    const size_t n = graph.num_nodes();
    if (n == 0) return partition;

    report_progress("Community detection", 0, 100);

    LevelGraph g = to_level_graph(graph);
    double two_m = total_strength(g);
    double gamma = config_.community_resolution;

    // Original node -> node of the current level
    std::vector<size_t> node_to_level(n);
    for (size_t i = 0; i < n; ++i) node_to_level[i] = i;

    std::vector<size_t> comm(n);
    for (size_t i = 0; i < n; ++i) comm[i] = i;

    if (two_m > 0.0) {
        while (true) {
            move_nodes(g, comm, gamma, two_m);
            size_t community_count = renumber(comm);
            if (community_count == g.size()) break;

            std::vector<size_t> refined = refine_partition(g, comm, gamma, two_m);
            size_t refined_count = renumber(refined);
            if (refined_count == g.size()) break;

            // The aggregate starts from the unrefined partition
            std::vector<size_t> next_comm(refined_count);
            for (size_t u = 0; u < g.size(); ++u) {
                next_comm[refined[u]] = comm[u];
            }
            for (size_t i = 0; i < n; ++i) {
                node_to_level[i] = refined[node_to_level[i]];
            }

            g = aggregate(g, refined, refined_count);
            comm = std::move(next_comm);
            partition.levels++;

            report_progress("Community detection",
                            std::min(90, 10 * partition.levels), 100);
            if (partition.levels >= config_.community_max_levels) break;
        }
    }

    std::vector<size_t> labels(n);
    for (size_t i = 0; i < n; ++i) labels[i] = comm[node_to_level[i]];
    partition.community_count = static_cast<int>(renumber(labels));

    partition.labels.reserve(n);
    for (size_t label : labels) partition.labels.push_back(static_cast<int>(label));
    partition.modularity = modularity(graph, partition.labels, gamma);

    report_progress("Community detection", 100, 100);
    return partition;
}

MetricResult Partition::to_result(const AnimalId& animal) const {
    MetricResult result;
    result.animal = animal;
    result.kind = MetricKind::COMMUNITY;
    result.columns = metric_score_columns(MetricKind::COMMUNITY);
    result.iterations = levels;
    for (size_t i = 0; i < neurons.size(); ++i) {
        result.rows.push_back({neurons[i], {static_cast<double>(labels[i])}});
    }
    result.summary["Modularity"] = modularity;
    result.summary["Communities"] = static_cast<double>(community_count);
    return result;
}

MetricResult MetricEngine::compute_community(const WeightedGraph& graph) const {
    return compute_partition(graph).to_result();
}

double MetricEngine::modularity(const WeightedGraph& graph, const std::vector<int>& labels,
                                double resolution) {
    if (labels.size() != graph.num_nodes()) {
        throw std::invalid_argument("modularity: one label per node required");
    }
    LevelGraph g = to_level_graph(graph);
    double two_m = total_strength(g);
    if (two_m <= 0.0) return 0.0;

    std::map<int, double> internal;
    std::map<int, double> totals;
    for (size_t u = 0; u < g.size(); ++u) {
        totals[labels[u]] += g.k[u];
        for (const auto& [v, w] : g.adj[u]) {
            if (labels[u] == labels[v]) internal[labels[u]] += w;
        }
    }

    double q = 0.0;
    for (const auto& [c, tot] : totals) {
        double frac = tot / two_m;
        q += internal[c] / two_m - resolution * frac * frac;
    }
    return q;
}

} // namespace fcg
