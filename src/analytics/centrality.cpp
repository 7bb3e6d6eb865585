#include "analytics/centrality.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <unordered_set>

namespace bsm {

namespace {

// Node adjacency through shared hyperedges, neighbors in first-seen order
std::vector<std::vector<size_t>> build_comembership(const Hypergraph& graph,
                                                    const std::unordered_map<std::string, size_t>& index) {
    std::vector<std::vector<size_t>> adj(index.size());
    std::unordered_set<std::string> linked;

    for (const auto& edge : graph.edges()) {
        const auto& members = edge.elements;
        for (size_t a = 0; a < members.size(); ++a) {
            for (size_t b = a + 1; b < members.size(); ++b) {
                size_t u = index.at(members[a]);
                size_t v = index.at(members[b]);
                if (!linked.insert(pair_key(members[a], members[b])).second) continue;
                adj[u].push_back(v);
                adj[v].push_back(u);
            }
        }
    }

    return adj;
}

// BFS shortest path; empty when target is unreachable
std::vector<size_t> bfs_path(const std::vector<std::vector<size_t>>& adj, size_t source, size_t target) {
    if (source == target) return {source};

    const size_t none = adj.size();
    std::vector<size_t> parent(adj.size(), none);
    std::vector<bool> visited(adj.size(), false);
    std::queue<size_t> queue;
    queue.push(source);
    visited[source] = true;

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop();

        for (size_t nb : adj[current]) {
            if (visited[nb]) continue;
            visited[nb] = true;
            parent[nb] = current;

            if (nb == target) {
                std::vector<size_t> path{target};
                size_t node = target;
                while (parent[node] != none) {
                    node = parent[node];
                    path.push_back(node);
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push(nb);
        }
    }

    return {};
}

} // namespace

// ==========================================
// Serialization
// ==========================================

nlohmann::json CentralityScores::to_json() const {
    nlohmann::json j;
    j["degree"] = degree;
    j["betweenness"] = betweenness;
    j["eigenvector"] = eigenvector;
    j["composite"] = composite;
    return j;
}

nlohmann::json CriticalNode::to_json() const {
    nlohmann::json j;
    j["uid"] = uid;
    j["name"] = name;
    j["type"] = type;
    j["composite"] = composite;
    j["degree"] = degree;
    j["betweenness"] = betweenness;
    j["eigenvector"] = eigenvector;
    j["reason"] = reason;
    return j;
}

// ==========================================
// Measures
// ==========================================

ScoreMap degree_centrality(const Hypergraph& graph) {
    ScoreMap scores;
    size_t max_degree = 0;
    for (const auto& node : graph.nodes()) {
        max_degree = std::max(max_degree, graph.degree(node.uid));
    }
    double denom = max_degree > 0 ? static_cast<double>(max_degree) : 1.0;

    for (const auto& node : graph.nodes()) {
        scores[node.uid] = graph.degree(node.uid) / denom;
    }
    return scores;
}

ScoreMap betweenness_centrality(const Hypergraph& graph, const PairSampler& sampler,
                                size_t max_samples, size_t attempt_factor) {
    ScoreMap scores;
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < graph.nodes().size(); ++i) {
        const auto& uid = graph.nodes()[i].uid;
        scores[uid] = 0.0;
        index[uid] = i;
    }

    auto ci_uids = graph.node_uids_of_type(NodeType::CI);
    size_t n = ci_uids.size();
    if (n < 2) {
        return scores;
    }

    auto adj = build_comembership(graph, index);

    size_t sample_count = std::min(max_samples, n * (n - 1) / 2);
    size_t max_attempts = sample_count * attempt_factor;
    std::unordered_set<std::string> sampled;
    size_t processed = 0;
    size_t attempts = 0;

    while (processed < sample_count && attempts < max_attempts) {
        auto [si, ti] = sampler.sample(attempts, n);
        attempts++;
        if (si >= n || ti >= n || si == ti) continue;

        std::string key = si < ti ? std::to_string(si) + ":" + std::to_string(ti)
                                  : std::to_string(ti) + ":" + std::to_string(si);
        if (!sampled.insert(key).second) continue;
        processed++;

        auto path = bfs_path(adj, index.at(ci_uids[si]), index.at(ci_uids[ti]));
        if (path.size() > 2) {
            for (size_t p = 1; p + 1 < path.size(); ++p) {
                scores[graph.nodes()[path[p]].uid] += 1.0;
            }
        }
    }

    normalize_scores(scores);
    return scores;
}

ScoreMap eigenvector_centrality(const Hypergraph& graph, int iterations) {
    ScoreMap scores;
    for (const auto& node : graph.nodes()) {
        scores[node.uid] = 0.0;
    }

    ProjectionGraph proj = build_ci_projection(graph);
    size_t n = proj.node_ids.size();
    if (n == 0) {
        return scores;
    }

    std::vector<double> vec(n, 1.0 / static_cast<double>(n));
    for (int iter = 0; iter < iterations; ++iter) {
        std::vector<double> next(n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            for (const auto& [j, w] : proj.adj[i]) {
                next[i] += w * vec[j];
            }
        }

        double norm = 0.0;
        for (double v : next) norm += v * v;
        norm = std::sqrt(norm);
        if (norm > 0.0) {
            for (double& v : next) v /= norm;
        }
        vec = std::move(next);
    }

    for (size_t i = 0; i < n; ++i) {
        scores[proj.node_ids[i]] = std::abs(vec[i]);
    }

    normalize_scores(scores);
    return scores;
}

CentralityScores compute_centrality(const Hypergraph& graph, const PairSampler& sampler,
                                    size_t max_samples, size_t attempt_factor, int iterations) {
    CentralityScores result;
    if (graph.nodes().empty()) {
        return result;
    }

    result.degree = degree_centrality(graph);
    result.betweenness = betweenness_centrality(graph, sampler, max_samples, attempt_factor);
    result.eigenvector = eigenvector_centrality(graph, iterations);

    for (const auto& [uid, d] : result.degree) {
        result.composite[uid] = 0.3 * d + 0.3 * result.betweenness[uid] + 0.4 * result.eigenvector[uid];
    }
    normalize_scores(result.composite);

    return result;
}

CentralityScores compute_centrality(const Hypergraph& graph, size_t max_samples,
                                    size_t attempt_factor, int iterations) {
    IndexMixingSampler sampler;
    return compute_centrality(graph, sampler, max_samples, attempt_factor, iterations);
}

// ==========================================
// Critical Nodes
// ==========================================

std::vector<CriticalNode> critical_nodes(const Hypergraph& graph, const CentralityScores& scores, size_t top_n) {
    std::vector<CriticalNode> entries;
    entries.reserve(graph.nodes().size());

    auto lookup = [](const ScoreMap& map, const std::string& uid) {
        auto it = map.find(uid);
        return it != map.end() ? it->second : 0.0;
    };

    for (const auto& node : graph.nodes()) {
        CriticalNode entry;
        entry.uid = node.uid;
        entry.name = node.name;
        entry.type = node_type_to_string(node.type);
        entry.degree = lookup(scores.degree, node.uid);
        entry.betweenness = lookup(scores.betweenness, node.uid);
        entry.eigenvector = lookup(scores.eigenvector, node.uid);
        entry.composite = lookup(scores.composite, node.uid);

        double max_metric = std::max({entry.degree, entry.betweenness, entry.eigenvector});
        if (max_metric <= 0.0) {
            entry.reason = "general importance";
        } else if (entry.betweenness == max_metric) {
            entry.reason = "bridge: lies on many shortest paths between CIs";
        } else if (entry.degree == max_metric) {
            entry.reason = "hub: participates in many change requests";
        } else {
            entry.reason = "connected to important nodes: high influence via neighbors";
        }

        entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(),
        [](const CriticalNode& a, const CriticalNode& b) { return a.composite > b.composite; });

    if (entries.size() > top_n) {
        entries.resize(top_n);
    }
    return entries;
}

std::vector<CriticalNode> critical_nodes(const Hypergraph& graph, size_t top_n) {
    return critical_nodes(graph, compute_centrality(graph), top_n);
}

} // namespace bsm
