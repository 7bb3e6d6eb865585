#include "analytics/analytics_engine.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bsm {

namespace {

template <typename T>
nlohmann::json list_to_json(const std::vector<T>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back(item.to_json());
    }
    return arr;
}

} // namespace

// ==========================================
// AnalyticsReport
// ==========================================

nlohmann::json AnalyticsReport::to_json() const {
    nlohmann::json j;
    j["meta"] = {
        {"run_id", run_id},
        {"created_utc", created_utc},
        {"source", source},
        {"modules", modules},
        {"skipped", skipped}
    };
    j["graph_stats"] = graph_stats.to_json();
    j["results"] = results;
    return j;
}

void AnalyticsReport::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

// ==========================================
// AnalyticsEngine
// ==========================================

AnalyticsEngine::AnalyticsEngine(const Hypergraph& graph, const RecordSet& records)
    : graph_(graph), records_(records), changes_(build_change_list(records.change_records)) {
    // Generate default run_id
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "run_" << std::put_time(std::gmtime(&time), "%Y%m%d_%H%M%S");
    run_id_ = ss.str();
}

void AnalyticsEngine::report_progress(const std::string& stage, int current, int total) {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

CentralityScores AnalyticsEngine::centrality() const {
    return compute_centrality(graph_, config_.betweenness_max_samples,
                              config_.betweenness_attempt_factor, config_.eigenvector_iterations);
}

std::vector<CriticalNode> AnalyticsEngine::critical() const {
    return critical_nodes(graph_, centrality(), config_.critical_nodes_top_n);
}

std::vector<CascadePair> AnalyticsEngine::cascades() const {
    return temporal_cascades(changes_, config_.cascade_window_days, config_.cascade_top_n);
}

std::map<std::string, VelocityProfile> AnalyticsEngine::velocity() const {
    return change_velocity(changes_, config_.velocity_bucket_days, config_.velocity_trend_threshold);
}

std::vector<CooccurrencePair> AnalyticsEngine::cooccurrence() const {
    return graph_.cooccurrence(NodeType::CI, config_.cooccurrence_top_n);
}

std::vector<WeightedPair> AnalyticsEngine::weighted() const {
    return weighted_cooccurrence(graph_, changes_, config_.weighted_cooccurrence_top_n,
                                 config_.recency_half_life_days);
}

AnomalyReport AnalyticsEngine::anomalies() const {
    return detect_anomalies(graph_, config_.anomaly_unexpected_ratio, config_.anomaly_overcoupling_jaccard);
}

CommunityResult AnalyticsEngine::communities() const {
    return detect_communities(graph_, config_.community_max_passes);
}

std::vector<ImpactPrediction> AnalyticsEngine::impact(const std::string& target_uid) const {
    return predict_impact(graph_, changes_, target_uid, config_.impact_window_days);
}

std::vector<LinkPrediction> AnalyticsEngine::links() const {
    return link_prediction(graph_, config_.link_prediction_top_n);
}

IncidentCorrelation AnalyticsEngine::incidents() const {
    return correlate_incidents(records_.incidents, graph_, config_.fault_propagation_window_hours,
                               config_.concentrated_max_cis);
}

std::vector<RiskEntry> AnalyticsEngine::risk() const {
    return risk_heatmap(graph_, changes_, records_.incidents);
}

// ==========================================
// Dispatch
// ==========================================

const std::vector<std::string>& AnalyticsEngine::module_names() {
    static const std::vector<std::string> names = {
        "centrality", "critical_nodes", "cascades", "velocity", "cooccurrence",
        "weighted_cooccurrence", "anomalies", "communities", "impact",
        "link_prediction", "incidents", "risk"
    };
    return names;
}

std::string AnalyticsEngine::canonical_module(const std::string& name) {
    if (name == "centrality") {
        return "centrality";
    } else if (name == "critical_nodes" || name == "critical-nodes" || name == "critical") {
        return "critical_nodes";
    } else if (name == "cascades" || name == "cascade" || name == "temporal_cascades") {
        return "cascades";
    } else if (name == "velocity" || name == "change_velocity") {
        return "velocity";
    } else if (name == "cooccurrence" || name == "co-occurrence") {
        return "cooccurrence";
    } else if (name == "weighted_cooccurrence" || name == "weighted-cooccurrence" || name == "weighted") {
        return "weighted_cooccurrence";
    } else if (name == "anomalies" || name == "anomaly") {
        return "anomalies";
    } else if (name == "communities" || name == "community" || name == "community_detection") {
        return "communities";
    } else if (name == "impact" || name == "impact_prediction") {
        return "impact";
    } else if (name == "link_prediction" || name == "link-prediction" || name == "links") {
        return "link_prediction";
    } else if (name == "incidents" || name == "incident" || name == "incident_correlation") {
        return "incidents";
    } else if (name == "risk" || name == "risk_heatmap" || name == "heatmap") {
        return "risk";
    }
    return "";
}

nlohmann::json AnalyticsEngine::run_module(const std::string& name) const {
    std::string module = canonical_module(name);

    if (module == "centrality") {
        return centrality().to_json();
    } else if (module == "critical_nodes") {
        return list_to_json(critical());
    } else if (module == "cascades") {
        return list_to_json(cascades());
    } else if (module == "velocity") {
        return velocity_to_json(velocity());
    } else if (module == "cooccurrence") {
        return list_to_json(cooccurrence());
    } else if (module == "weighted_cooccurrence") {
        return list_to_json(weighted());
    } else if (module == "anomalies") {
        return anomalies().to_json();
    } else if (module == "communities") {
        return communities().to_json();
    } else if (module == "impact") {
        if (config_.impact_target.empty()) return nullptr;
        nlohmann::json j;
        j["target"] = config_.impact_target;
        j["predictions"] = list_to_json(impact(config_.impact_target));
        return j;
    } else if (module == "link_prediction") {
        return list_to_json(links());
    } else if (module == "incidents") {
        return incidents().to_json();
    } else if (module == "risk") {
        return list_to_json(risk());
    }
    return nullptr;
}

AnalyticsReport AnalyticsEngine::run_modules(const std::vector<std::string>& modules) {
    AnalyticsReport report;
    report.run_id = run_id_;
    report.created_utc = utc_now_string();
    report.source = source_;
    report.graph_stats = graph_.compute_statistics();

    // Resolve names, expanding "all" and dropping duplicates
    std::vector<std::string> selected;
    auto select = [&](const std::string& module) {
        if (std::find(selected.begin(), selected.end(), module) == selected.end()) {
            selected.push_back(module);
        }
    };
    for (const auto& name : modules) {
        if (name == "all") {
            for (const auto& m : module_names()) select(m);
            continue;
        }
        std::string module = canonical_module(name);
        if (module.empty()) {
            report.skipped.push_back(name);
        } else {
            select(module);
        }
    }

    const int total = static_cast<int>(selected.size());
    std::vector<nlohmann::json> outputs(selected.size());

    if (config_.parallel) {
        std::vector<std::future<nlohmann::json>> futures;
        futures.reserve(selected.size());
        for (const auto& module : selected) {
            futures.push_back(std::async(std::launch::async, [this, module]() { return run_module(module); }));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            outputs[i] = futures[i].get();
            report_progress("Finished " + selected[i], static_cast<int>(i) + 1, total);
        }
    } else {
        for (size_t i = 0; i < selected.size(); ++i) {
            report_progress("Running " + selected[i], static_cast<int>(i), total);
            outputs[i] = run_module(selected[i]);
        }
        report_progress("Done", total, total);
    }

    for (size_t i = 0; i < selected.size(); ++i) {
        if (outputs[i].is_null()) {
            report.skipped.push_back(selected[i]);
            continue;
        }
        report.modules.push_back(selected[i]);
        report.results[selected[i]] = std::move(outputs[i]);
    }

    return report;
}

AnalyticsReport AnalyticsEngine::run_all() {
    return run_modules(module_names());
}

} // namespace bsm
