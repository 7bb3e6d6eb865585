#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace bsm {

// Analytics configuration
struct AnalyticsConfig {
    // Plain co-occurrence ranking
    size_t cooccurrence_top_n = 20;

    // Centrality
    size_t betweenness_max_samples = 200;     // Sampled CI pairs
    size_t betweenness_attempt_factor = 10;   // Attempts per sample before giving up
    int eigenvector_iterations = 20;          // Power iteration rounds
    size_t critical_nodes_top_n = 10;

    // Temporal
    int cascade_window_days = 7;
    size_t cascade_top_n = 30;
    int velocity_bucket_days = 7;
    double velocity_trend_threshold = 0.25;   // Relative change between halves

    // Weighted co-occurrence
    size_t weighted_cooccurrence_top_n = 30;
    double recency_half_life_days = 30.0;

    // Anomalies
    double anomaly_unexpected_ratio = 2.0;    // Flag actual > ratio * expected
    double anomaly_overcoupling_jaccard = 0.5;

    // Communities
    int community_max_passes = 50;

    // Prediction
    int impact_window_days = 7;
    std::string impact_target;                // CI uid; impact is skipped when empty
    size_t link_prediction_top_n = 20;

    // Incidents
    int fault_propagation_window_hours = 24;
    size_t concentrated_max_cis = 3;          // Fingerprint "concentrated" cutoff

    // Global
    bool parallel = false;                    // Run modules concurrently

    nlohmann::json to_json() const;

    /**
     * @brief Overlay keys present in j on top of the defaults
     */
    static AnalyticsConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from a JSON file
     * @throws std::runtime_error if the file cannot be opened
     */
    static AnalyticsConfig load_from_file(const std::string& path);
};

} // namespace bsm
