#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace bsm {

/**
 * @brief Source of candidate (source, target) index pairs for sampled betweenness
 *
 * Implementations must be deterministic so repeated runs over the same
 * graph credit the same paths.
 */
class PairSampler {
public:
    virtual ~PairSampler() = default;

    /**
     * @brief Produce the candidate pair for one attempt
     * @param attempt Zero-based attempt counter
     * @param n Number of CI nodes (> 1)
     * @return Indices in [0, n); equal indices are skipped by the caller
     */
    virtual std::pair<size_t, size_t> sample(size_t attempt, size_t n) const = 0;
};

// si = (attempt*7 + 13) mod n, ti = (attempt*11 + 23) mod n
class IndexMixingSampler : public PairSampler {
public:
    std::pair<size_t, size_t> sample(size_t attempt, size_t n) const override {
        return {(attempt * 7 + 13) % n, (attempt * 11 + 23) % n};
    }
};

struct CentralityScores {
    ScoreMap degree;
    ScoreMap betweenness;
    ScoreMap eigenvector;
    ScoreMap composite;                                // 0.3 degree + 0.3 betweenness + 0.4 eigenvector

    nlohmann::json to_json() const;
};

struct CriticalNode {
    std::string uid;
    std::string name;
    std::string type;
    double composite = 0.0;
    double degree = 0.0;
    double betweenness = 0.0;
    double eigenvector = 0.0;
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Incidence degree divided by the maximum degree
 */
ScoreMap degree_centrality(const Hypergraph& graph);

/**
 * @brief Sampled shortest-path betweenness over CI pairs
 * @param sampler Pair generator
 * @param max_samples Upper bound on distinct pairs evaluated
 * @param attempt_factor Attempts allowed per requested sample
 *
 * Paths run over the co-membership graph of all nodes; every strictly
 * intermediate node on the BFS path is credited once.
 */
ScoreMap betweenness_centrality(
    const Hypergraph& graph,
    const PairSampler& sampler,
    size_t max_samples = 200,
    size_t attempt_factor = 10
);

/**
 * @brief Power iteration on the CI projection; non-CI nodes score 0
 */
ScoreMap eigenvector_centrality(const Hypergraph& graph, int iterations = 20);

/**
 * @brief All three measures plus the composite, each normalized to [0, 1]
 */
CentralityScores compute_centrality(
    const Hypergraph& graph,
    size_t max_samples = 200,
    size_t attempt_factor = 10,
    int iterations = 20
);

CentralityScores compute_centrality(
    const Hypergraph& graph,
    const PairSampler& sampler,
    size_t max_samples = 200,
    size_t attempt_factor = 10,
    int iterations = 20
);

/**
 * @brief Top nodes by composite score with the dominant reason
 */
std::vector<CriticalNode> critical_nodes(const Hypergraph& graph, const CentralityScores& scores, size_t top_n = 10);

std::vector<CriticalNode> critical_nodes(const Hypergraph& graph, size_t top_n = 10);

} // namespace bsm
