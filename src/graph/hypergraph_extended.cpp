#include "graph/hypergraph.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace bsm {

// ==========================================
// Co-occurrence and Neighborhood Queries
// ==========================================

std::vector<CooccurrencePair> Hypergraph::cooccurrence(std::optional<NodeType> type_filter, size_t top_n) const {
    std::vector<CooccurrencePair> pairs;
    std::unordered_map<std::string, size_t> pair_index;  // "a|b" -> position in pairs

    for (const auto& edge : edges_) {
        std::vector<const std::string*> members;
        members.reserve(edge.elements.size());
        for (const auto& uid : edge.elements) {
            if (type_filter) {
                const auto* node = get_node(uid);
                if (!node || node->type != *type_filter) continue;
            }
            members.push_back(&uid);
        }
        if (members.size() < 2) continue;

        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                const std::string& lo = std::min(*members[i], *members[j]);
                const std::string& hi = std::max(*members[i], *members[j]);
                std::string key = lo + "|" + hi;

                auto it = pair_index.find(key);
                if (it == pair_index.end()) {
                    CooccurrencePair pair;
                    pair.a = lo;
                    pair.b = hi;
                    it = pair_index.emplace(key, pairs.size()).first;
                    pairs.push_back(std::move(pair));
                }
                auto& pair = pairs[it->second];
                pair.count++;
                pair.shared_edges.push_back(edge.uid);
            }
        }
    }

    std::stable_sort(pairs.begin(), pairs.end(),
        [](const CooccurrencePair& x, const CooccurrencePair& y) { return x.count > y.count; });

    if (pairs.size() > top_n) {
        pairs.resize(top_n);
    }
    return pairs;
}

std::vector<std::string> Hypergraph::neighbors(const std::string& uid) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;

    for (const auto* edge : get_incident_edges(uid)) {
        for (const auto& member : edge->elements) {
            if (member == uid) continue;
            if (seen.insert(member).second) {
                result.push_back(member);
            }
        }
    }

    return result;
}

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json Hypergraph::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["hyperedges"] = edges_json;

    j["is_transposed"] = transposed_;
    j["stats"] = compute_statistics().to_json();

    return j;
}

void Hypergraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

nlohmann::json Hypergraph::to_incidence_matrix() const {
    nlohmann::json j;

    std::vector<std::string> node_list;
    node_list.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        node_list.push_back(node.uid);
    }

    std::vector<std::string> edge_list;
    edge_list.reserve(edges_.size());
    for (const auto& edge : edges_) {
        edge_list.push_back(edge.uid);
    }

    std::vector<std::vector<int>> matrix(node_list.size(), std::vector<int>(edge_list.size(), 0));
    for (size_t j_idx = 0; j_idx < edges_.size(); ++j_idx) {
        for (const auto& member : edges_[j_idx].elements) {
            matrix[node_index_.at(member)][j_idx] = 1;
        }
    }

    j["nodes"] = node_list;
    j["edges"] = edge_list;
    j["matrix"] = matrix;

    return j;
}

Hypergraph Hypergraph::from_json(const nlohmann::json& j) {
    Hypergraph graph;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            graph.add_node(HyperNode::from_json(node_json));
        }
    }

    if (j.contains("hyperedges")) {
        for (const auto& edge_json : j["hyperedges"]) {
            graph.add_hyperedge(HyperEdge::from_json(edge_json));
        }
    }

    graph.transposed_ = j.value("is_transposed", false);
    return graph;
}

Hypergraph Hypergraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    file.close();

    return from_json(j);
}

} // namespace bsm
