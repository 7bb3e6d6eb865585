#pragma once

#include "graph/hypergraph.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bsm {

// uid -> score
using ScoreMap = std::map<std::string, double>;

// Weighted clique expansion restricted to CI nodes
struct ProjectionGraph {
    std::vector<std::string> node_ids;                  // CI uids in node order
    std::unordered_map<std::string, size_t> node_index;
    std::vector<std::map<size_t, double>> adj;          // weight = shared hyperedges
};

/**
 * @brief Canonical "min|max" key for an unordered pair
 */
std::string pair_key(const std::string& a, const std::string& b);

/**
 * @brief Divide every score by the maximum; all-zero maps are left untouched
 */
void normalize_scores(ScoreMap& scores);

/**
 * @brief Project the hypergraph onto its CI nodes
 */
ProjectionGraph build_ci_projection(const Hypergraph& graph);

/**
 * @brief |a ∩ b| / |a ∪ b|, or 0 when both sets are empty
 */
double jaccard_overlap(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b);

/**
 * @brief Display name of a node, falling back to the uid
 */
std::string node_name(const Hypergraph& graph, const std::string& uid);

/**
 * @brief Change summaries keyed by change number
 */
std::unordered_map<std::string, const ChangeSummary*> index_changes(const std::vector<ChangeSummary>& changes);

} // namespace bsm
