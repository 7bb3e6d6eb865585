#include "analytics/analytics_config.hpp"
#include <fstream>
#include <stdexcept>

namespace bsm {

nlohmann::json AnalyticsConfig::to_json() const {
    nlohmann::json j;
    j["cooccurrence_top_n"] = cooccurrence_top_n;
    j["betweenness_max_samples"] = betweenness_max_samples;
    j["betweenness_attempt_factor"] = betweenness_attempt_factor;
    j["eigenvector_iterations"] = eigenvector_iterations;
    j["critical_nodes_top_n"] = critical_nodes_top_n;
    j["cascade_window_days"] = cascade_window_days;
    j["cascade_top_n"] = cascade_top_n;
    j["velocity_bucket_days"] = velocity_bucket_days;
    j["velocity_trend_threshold"] = velocity_trend_threshold;
    j["weighted_cooccurrence_top_n"] = weighted_cooccurrence_top_n;
    j["recency_half_life_days"] = recency_half_life_days;
    j["anomaly_unexpected_ratio"] = anomaly_unexpected_ratio;
    j["anomaly_overcoupling_jaccard"] = anomaly_overcoupling_jaccard;
    j["community_max_passes"] = community_max_passes;
    j["impact_window_days"] = impact_window_days;
    j["impact_target"] = impact_target;
    j["link_prediction_top_n"] = link_prediction_top_n;
    j["fault_propagation_window_hours"] = fault_propagation_window_hours;
    j["concentrated_max_cis"] = concentrated_max_cis;
    j["parallel"] = parallel;
    return j;
}

AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json& j) {
    AnalyticsConfig cfg;
    cfg.cooccurrence_top_n = j.value("cooccurrence_top_n", cfg.cooccurrence_top_n);
    cfg.betweenness_max_samples = j.value("betweenness_max_samples", cfg.betweenness_max_samples);
    cfg.betweenness_attempt_factor = j.value("betweenness_attempt_factor", cfg.betweenness_attempt_factor);
    cfg.eigenvector_iterations = j.value("eigenvector_iterations", cfg.eigenvector_iterations);
    cfg.critical_nodes_top_n = j.value("critical_nodes_top_n", cfg.critical_nodes_top_n);
    cfg.cascade_window_days = j.value("cascade_window_days", cfg.cascade_window_days);
    cfg.cascade_top_n = j.value("cascade_top_n", cfg.cascade_top_n);
    cfg.velocity_bucket_days = j.value("velocity_bucket_days", cfg.velocity_bucket_days);
    cfg.velocity_trend_threshold = j.value("velocity_trend_threshold", cfg.velocity_trend_threshold);
    cfg.weighted_cooccurrence_top_n = j.value("weighted_cooccurrence_top_n", cfg.weighted_cooccurrence_top_n);
    cfg.recency_half_life_days = j.value("recency_half_life_days", cfg.recency_half_life_days);
    cfg.anomaly_unexpected_ratio = j.value("anomaly_unexpected_ratio", cfg.anomaly_unexpected_ratio);
    cfg.anomaly_overcoupling_jaccard = j.value("anomaly_overcoupling_jaccard", cfg.anomaly_overcoupling_jaccard);
    cfg.community_max_passes = j.value("community_max_passes", cfg.community_max_passes);
    cfg.impact_window_days = j.value("impact_window_days", cfg.impact_window_days);
    cfg.impact_target = j.value("impact_target", cfg.impact_target);
    cfg.link_prediction_top_n = j.value("link_prediction_top_n", cfg.link_prediction_top_n);
    cfg.fault_propagation_window_hours = j.value("fault_propagation_window_hours", cfg.fault_propagation_window_hours);
    cfg.concentrated_max_cis = j.value("concentrated_max_cis", cfg.concentrated_max_cis);
    cfg.parallel = j.value("parallel", cfg.parallel);
    return cfg;
}

AnalyticsConfig AnalyticsConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return from_json(j);
}

} // namespace bsm
