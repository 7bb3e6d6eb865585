#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bsm {

struct ImpactPrediction {
    std::string ci;
    std::string name;
    double probability = 0.0;

    // Normalized signals before weighting
    double cooccurrence = 0.0;
    double cascade = 0.0;
    double shared_service = 0.0;
    double proximity = 0.0;

    std::string reason;

    nlohmann::json to_json() const;
};

struct LinkPrediction {
    std::string a;
    std::string b;
    std::string name_a;
    std::string name_b;
    double score = 0.0;                                // Adamic-Adar index

    nlohmann::json to_json() const;
};

/**
 * @brief Rank CIs likely to be affected when target_uid changes
 * @param graph Original-view hypergraph
 * @param changes Change list supplying creation times
 * @param target_uid CI about to change
 * @param window_days Cascade window (target change followed by candidate change)
 *
 * probability = 0.35 cooccurrence + 0.25 cascade + 0.2 shared_service + 0.2 proximity.
 * Candidates with probability 0 are omitted; an unknown target yields an empty list.
 */
std::vector<ImpactPrediction> predict_impact(
    const Hypergraph& graph,
    const std::vector<ChangeSummary>& changes,
    const std::string& target_uid,
    int window_days = 7
);

/**
 * @brief Adamic-Adar scores for CI pairs that never co-occur
 *
 * Common neighbors of projected degree <= 1 contribute nothing. Only
 * positive scores are returned.
 */
std::vector<LinkPrediction> link_prediction(const Hypergraph& graph, size_t top_n = 20);

} // namespace bsm
