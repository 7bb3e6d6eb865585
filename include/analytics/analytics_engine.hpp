#pragma once

#include "analytics/analytics_config.hpp"
#include "analytics/anomaly.hpp"
#include "analytics/centrality.hpp"
#include "analytics/community.hpp"
#include "analytics/incident.hpp"
#include "analytics/prediction.hpp"
#include "analytics/risk.hpp"
#include "analytics/temporal.hpp"
#include "analytics/weighted_cooccurrence.hpp"
#include "graph/hypergraph.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace bsm {

/**
 * @brief Output of one engine run
 */
struct AnalyticsReport {
    std::string run_id;
    std::string created_utc;
    std::string source;
    std::vector<std::string> modules;                  // Modules that produced results
    std::vector<std::string> skipped;                  // Unknown names or modules lacking input
    HypergraphStatistics graph_stats;
    nlohmann::json results = nlohmann::json::object(); // module name -> result

    nlohmann::json to_json() const;

    /**
     * @brief Write the report as indented JSON
     * @throws std::runtime_error if the file cannot be opened
     */
    void save_to_json(const std::string& path) const;
};

// Progress callback
using AnalyticsProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

class AnalyticsEngine {
public:
    AnalyticsEngine(const Hypergraph& graph, const RecordSet& records);

    // Set configuration
    void set_config(const AnalyticsConfig& config) { config_ = config; }
    const AnalyticsConfig& config() const { return config_; }
    void set_run_id(const std::string& run_id) { run_id_ = run_id; }
    void set_source(const std::string& source) { source_ = source; }
    void set_progress_callback(AnalyticsProgressCallback cb) { progress_cb_ = std::move(cb); }

    // Individual modules
    CentralityScores centrality() const;
    std::vector<CriticalNode> critical() const;
    std::vector<CascadePair> cascades() const;
    std::map<std::string, VelocityProfile> velocity() const;
    std::vector<CooccurrencePair> cooccurrence() const;
    std::vector<WeightedPair> weighted() const;
    AnomalyReport anomalies() const;
    CommunityResult communities() const;
    std::vector<ImpactPrediction> impact(const std::string& target_uid) const;
    std::vector<LinkPrediction> links() const;
    IncidentCorrelation incidents() const;
    std::vector<RiskEntry> risk() const;

    /**
     * @brief Canonical module name for a name or alias, empty when unknown
     */
    static std::string canonical_module(const std::string& name);

    // All canonical module names in run order
    static const std::vector<std::string>& module_names();

    /**
     * @brief Run one module and return its JSON result
     * @return null when the name is unknown or the module lacks required input
     */
    nlohmann::json run_module(const std::string& name) const;

    // Run multiple modules; "all" expands to every module
    AnalyticsReport run_modules(const std::vector<std::string>& modules);

    // Run all modules
    AnalyticsReport run_all();

private:
    const Hypergraph& graph_;
    const RecordSet& records_;
    std::vector<ChangeSummary> changes_;
    AnalyticsConfig config_;
    std::string run_id_;
    std::string source_;
    AnalyticsProgressCallback progress_cb_;

    // Helper: report progress
    void report_progress(const std::string& stage, int current, int total);
};

} // namespace bsm
