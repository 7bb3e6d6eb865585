#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace bsm {

struct CommunitySummary {
    int id = 0;
    size_t size = 0;
    std::string dominant_class;
    std::string dominant_service;

    nlohmann::json to_json() const;
};

struct CommunityResult {
    std::map<std::string, int> assignments;            // CI uid -> community id
    std::map<int, std::vector<std::string>> communities;
    double modularity = 0.0;
    std::vector<CommunitySummary> summary;             // Largest first

    nlohmann::json to_json() const;
};

/**
 * @brief Louvain-style local moving on the weighted CI projection
 * @param max_passes Upper bound on full passes over the nodes
 *
 * Community ids are numbered in order of first appearance in node order,
 * so identical graphs always produce identical assignments. With zero
 * total edge weight every CI is its own community and Q = 0.
 */
CommunityResult detect_communities(const Hypergraph& graph, int max_passes = 50);

} // namespace bsm
