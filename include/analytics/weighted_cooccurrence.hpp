#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bsm {

struct WeightedPair {
    std::string a;
    std::string b;
    size_t raw_count = 0;
    double risk_weighted = 0.0;                        // Sum of risk multipliers
    double recency_weighted = 0.0;                     // Sum of exponential decay weights
    size_t diversity = 0;                              // Distinct assignment groups
    double jaccard = 0.0;                              // Overlap of hyperedge memberships
    double composite = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Multi-factor co-occurrence score for CI pairs
 * @param graph Original-view hypergraph
 * @param changes Change list supplying creation times
 * @param top_n Pairs returned
 * @param half_life_days Recency half-life, measured from the newest change
 *
 * Each signal is normalized by its own maximum, then
 * composite = 0.25 raw + 0.25 risk + 0.2 recency + 0.15 diversity + 0.15 jaccard.
 */
std::vector<WeightedPair> weighted_cooccurrence(
    const Hypergraph& graph,
    const std::vector<ChangeSummary>& changes,
    size_t top_n = 30,
    double half_life_days = 30.0
);

} // namespace bsm
