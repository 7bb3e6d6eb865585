#include "analytics/graph_utils.hpp"
#include <algorithm>

namespace bsm {

std::string pair_key(const std::string& a, const std::string& b) {
    return a < b ? a + "|" + b : b + "|" + a;
}

void normalize_scores(ScoreMap& scores) {
    double max_score = 0.0;
    for (const auto& [uid, score] : scores) {
        max_score = std::max(max_score, score);
    }
    if (max_score <= 0.0) return;

    for (auto& [uid, score] : scores) {
        score /= max_score;
    }
}

ProjectionGraph build_ci_projection(const Hypergraph& graph) {
    ProjectionGraph proj;
    proj.node_ids = graph.node_uids_of_type(NodeType::CI);
    for (size_t i = 0; i < proj.node_ids.size(); ++i) {
        proj.node_index[proj.node_ids[i]] = i;
    }
    proj.adj.resize(proj.node_ids.size());

    for (const auto& edge : graph.edges()) {
        std::vector<size_t> members;
        members.reserve(edge.size());
        for (const auto& uid : edge.elements) {
            auto it = proj.node_index.find(uid);
            if (it != proj.node_index.end()) {
                members.push_back(it->second);
            }
        }
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                proj.adj[members[i]][members[j]] += 1.0;
                proj.adj[members[j]][members[i]] += 1.0;
            }
        }
    }

    return proj;
}

double jaccard_overlap(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;

    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger = a.size() <= b.size() ? b : a;
    size_t inter = 0;
    for (const auto& item : smaller) {
        if (larger.count(item)) inter++;
    }
    size_t uni = a.size() + b.size() - inter;
    return uni > 0 ? static_cast<double>(inter) / uni : 0.0;
}

std::string node_name(const Hypergraph& graph, const std::string& uid) {
    const auto* node = graph.get_node(uid);
    return node ? node->name : uid;
}

std::unordered_map<std::string, const ChangeSummary*> index_changes(const std::vector<ChangeSummary>& changes) {
    std::unordered_map<std::string, const ChangeSummary*> index;
    for (const auto& chg : changes) {
        index.emplace(chg.number, &chg);
    }
    return index;
}

} // namespace bsm
