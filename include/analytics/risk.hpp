#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bsm {

struct RiskFactors {
    size_t change_frequency = 0;
    double emergency_ratio = 0.0;
    size_t incident_rate = 0;
    size_t coupling_density = 0;                       // Distinct co-changed CIs
};

struct RiskEntry {
    std::string ci;
    std::string name;
    int risk_score = 0;                                // 0..100
    RiskFactors factors;

    nlohmann::json to_json() const;
};

/**
 * @brief Multi-factor per-CI risk score
 *
 * raw = 0.3 change_frequency + 0.25 emergency_ratio + 0.25 incident_rate
 * + 0.2 coupling_density, each factor divided by its maximum. Scores are
 * rescaled so the riskiest CI gets exactly 100 and then rounded. Sorted
 * descending by score.
 */
std::vector<RiskEntry> risk_heatmap(
    const Hypergraph& graph,
    const std::vector<ChangeSummary>& changes,
    const std::vector<IncidentRecord>& incidents
);

} // namespace bsm
