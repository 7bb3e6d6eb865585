#include "analytics/prediction.hpp"
#include <algorithm>
#include <cmath>

namespace bsm {

nlohmann::json ImpactPrediction::to_json() const {
    nlohmann::json j;
    j["ci"] = ci;
    j["name"] = name;
    j["probability"] = probability;
    j["signals"] = {
        {"cooccurrence", cooccurrence},
        {"cascade", cascade},
        {"shared_service", shared_service},
        {"proximity", proximity}
    };
    j["reason"] = reason;
    return j;
}

nlohmann::json LinkPrediction::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["name_a"] = name_a;
    j["name_b"] = name_b;
    j["score"] = score;
    return j;
}

// ==========================================
// Impact Prediction
// ==========================================

std::vector<ImpactPrediction> predict_impact(const Hypergraph& graph, const std::vector<ChangeSummary>& changes,
                                             const std::string& target_uid, int window_days) {
    std::vector<ImpactPrediction> results;
    if (target_uid.empty() || !graph.has_node(target_uid)) {
        return results;
    }

    auto ci_uids = graph.node_uids_of_type(NodeType::CI);
    std::unordered_set<std::string> ci_set(ci_uids.begin(), ci_uids.end());
    auto target_edges = graph.get_incident_edges(target_uid);

    // Co-occurrence with the target
    std::unordered_map<std::string, double> cooccur;
    for (const auto* edge : target_edges) {
        for (const auto& uid : edge->elements) {
            if (uid != target_uid && ci_set.count(uid)) cooccur[uid] += 1.0;
        }
    }

    // Target change followed by candidate change within the window
    std::unordered_map<std::string, double> cascades;
    {
        const int64_t window_ms = static_cast<int64_t>(window_days) * MS_PER_DAY;
        std::vector<int64_t> target_times;
        std::unordered_map<std::string, std::vector<int64_t>> other_times;

        for (const auto& chg : changes) {
            if (chg.created_at_ms == 0) continue;
            bool has_target = std::find(chg.ci_uids.begin(), chg.ci_uids.end(), target_uid) != chg.ci_uids.end();
            if (has_target) target_times.push_back(chg.created_at_ms);
            for (const auto& uid : chg.ci_uids) {
                if (uid != target_uid && ci_set.count(uid)) other_times[uid].push_back(chg.created_at_ms);
            }
        }

        for (const auto& [uid, times] : other_times) {
            size_t count = 0;
            for (int64_t tt : target_times) {
                for (int64_t to : times) {
                    int64_t lag = to - tt;
                    if (lag > 0 && lag <= window_ms) count++;
                }
            }
            if (count > 0) cascades[uid] = static_cast<double>(count);
        }
    }

    // Shared business services
    std::unordered_set<std::string> target_services;
    std::unordered_map<std::string, std::unordered_set<std::string>> ci_services;
    for (const auto& edge : graph.edges()) {
        std::string service_uid;
        bool has_target = false;
        std::vector<std::string> edge_cis;
        for (const auto& uid : edge.elements) {
            const auto* node = graph.get_node(uid);
            if (uid == target_uid) has_target = true;
            if (node && node->type == NodeType::SERVICE) service_uid = uid;
            if (uid != target_uid && ci_set.count(uid)) edge_cis.push_back(uid);
        }
        if (service_uid.empty()) continue;
        if (has_target) target_services.insert(service_uid);
        for (const auto& uid : edge_cis) {
            ci_services[uid].insert(service_uid);
        }
    }

    std::unordered_map<std::string, double> shared_service;
    for (const auto& [uid, services] : ci_services) {
        size_t shared = 0;
        for (const auto& s : services) {
            if (target_services.count(s)) shared++;
        }
        if (shared > 0) shared_service[uid] = static_cast<double>(shared);
    }

    // Neighbor-set proximity
    auto target_neighbors_list = graph.neighbors(target_uid);
    std::unordered_set<std::string> target_neighbors(target_neighbors_list.begin(), target_neighbors_list.end());

    auto get = [](const std::unordered_map<std::string, double>& map, const std::string& uid) {
        auto it = map.find(uid);
        return it != map.end() ? it->second : 0.0;
    };

    double max_cooccur = 0.0, max_cascade = 0.0, max_service = 0.0;
    for (const auto& uid : ci_uids) {
        max_cooccur = std::max(max_cooccur, get(cooccur, uid));
        max_cascade = std::max(max_cascade, get(cascades, uid));
        max_service = std::max(max_service, get(shared_service, uid));
    }

    for (const auto& uid : ci_uids) {
        if (uid == target_uid) continue;

        auto neighbor_list = graph.neighbors(uid);
        std::unordered_set<std::string> neighbors(neighbor_list.begin(), neighbor_list.end());

        ImpactPrediction pred;
        pred.ci = uid;
        pred.name = node_name(graph, uid);
        pred.cooccurrence = max_cooccur > 0.0 ? get(cooccur, uid) / max_cooccur : 0.0;
        pred.cascade = max_cascade > 0.0 ? get(cascades, uid) / max_cascade : 0.0;
        pred.shared_service = max_service > 0.0 ? get(shared_service, uid) / max_service : 0.0;
        pred.proximity = jaccard_overlap(neighbors, target_neighbors);

        pred.probability = 0.35 * pred.cooccurrence + 0.25 * pred.cascade +
                           0.2 * pred.shared_service + 0.2 * pred.proximity;
        if (pred.probability <= 0.0) continue;

        double max_signal = std::max({pred.cooccurrence, pred.cascade, pred.shared_service, pred.proximity});
        if (pred.cooccurrence == max_signal && pred.cooccurrence > 0.0) {
            pred.reason = "frequently co-occurs in change requests";
        } else if (pred.cascade == max_signal && pred.cascade > 0.0) {
            pred.reason = "temporal cascade pattern detected";
        } else if (pred.shared_service == max_signal && pred.shared_service > 0.0) {
            pred.reason = "shared business service membership";
        } else {
            pred.reason = "network proximity";
        }

        results.push_back(std::move(pred));
    }

    std::stable_sort(results.begin(), results.end(),
        [](const ImpactPrediction& x, const ImpactPrediction& y) { return x.probability > y.probability; });
    return results;
}

// ==========================================
// Link Prediction
// ==========================================

std::vector<LinkPrediction> link_prediction(const Hypergraph& graph, size_t top_n) {
    std::vector<LinkPrediction> results;

    ProjectionGraph proj = build_ci_projection(graph);
    size_t n = proj.node_ids.size();
    if (n < 2) {
        return results;
    }

    std::vector<size_t> degree(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& [j, w] : proj.adj[i]) {
            if (w > 0.0) degree[i]++;
        }
    }

    for (size_t u = 0; u < n; ++u) {
        for (size_t v = u + 1; v < n; ++v) {
            auto existing = proj.adj[u].find(v);
            if (existing != proj.adj[u].end() && existing->second > 0.0) continue;

            double score = 0.0;
            for (const auto& [w, weight] : proj.adj[u]) {
                if (weight <= 0.0) continue;
                auto shared = proj.adj[v].find(w);
                if (shared == proj.adj[v].end() || shared->second <= 0.0) continue;
                if (degree[w] > 1) {
                    score += 1.0 / std::log(static_cast<double>(degree[w]));
                }
            }

            if (score > 0.0) {
                LinkPrediction link;
                link.a = proj.node_ids[u];
                link.b = proj.node_ids[v];
                link.name_a = node_name(graph, link.a);
                link.name_b = node_name(graph, link.b);
                link.score = score;
                results.push_back(std::move(link));
            }
        }
    }

    std::stable_sort(results.begin(), results.end(),
        [](const LinkPrediction& x, const LinkPrediction& y) { return x.score > y.score; });

    if (results.size() > top_n) {
        results.resize(top_n);
    }
    return results;
}

} // namespace bsm
