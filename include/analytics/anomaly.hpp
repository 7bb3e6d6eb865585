#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bsm {

struct OrphanCI {
    std::string uid;
    std::string name;
    size_t degree = 0;
    std::string reason;

    nlohmann::json to_json() const;
};

// Pair co-occurring far more often than its CI classes predict
struct UnexpectedPair {
    std::string a;
    std::string b;
    std::string name_a;
    std::string name_b;
    std::string class_a;
    std::string class_b;
    size_t actual = 0;
    double expected = 0.0;
    double ratio = 0.0;

    nlohmann::json to_json() const;
};

struct OverCoupledPair {
    std::string a;
    std::string b;
    std::string name_a;
    std::string name_b;
    double jaccard = 0.0;
    size_t shared_changes = 0;

    nlohmann::json to_json() const;
};

struct UnderCoupledPair {
    std::string a;
    std::string b;
    std::string name_a;
    std::string name_b;
    std::string shared_service;
    std::string reason;

    nlohmann::json to_json() const;
};

struct AnomalyReport {
    std::vector<UnexpectedPair> unexpected_pairs;
    std::vector<OrphanCI> orphans;
    std::vector<OverCoupledPair> over_coupled;
    std::vector<UnderCoupledPair> under_coupled;

    nlohmann::json to_json() const;
};

/**
 * @brief Structural and statistical anomalies among CIs
 * @param unexpected_ratio Flag pairs whose count exceeds ratio * expected
 * @param overcoupling_jaccard Flag pairs whose membership Jaccard exceeds this
 *
 * Expected counts assume CI classes appear in hyperedges independently.
 * Under-coupled pairs share a business service across changes but never
 * appear in the same change.
 */
AnomalyReport detect_anomalies(
    const Hypergraph& graph,
    double unexpected_ratio = 2.0,
    double overcoupling_jaccard = 0.5
);

} // namespace bsm
