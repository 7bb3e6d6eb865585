#include "analytics/incident.hpp"
#include <algorithm>

namespace bsm {

nlohmann::json FaultPropagation::to_json() const {
    return {{"source", source}, {"target", target}, {"count", count}, {"avg_lag_hours", avg_lag_hours}};
}

nlohmann::json IncidentHotspot::to_json() const {
    nlohmann::json j;
    j["ci"] = ci;
    j["name"] = name;
    j["incident_count"] = incident_count;
    j["avg_priority"] = avg_priority;
    j["mtbf_hours"] = mtbf_hours;
    return j;
}

nlohmann::json ServiceFingerprint::to_json() const {
    nlohmann::json j;
    j["affected_cis"] = affected_cis;
    j["pattern"] = pattern;
    j["avg_resolution_hours"] = avg_resolution_hours;
    j["incident_count"] = incident_count;
    return j;
}

nlohmann::json IncidentCorrelation::to_json() const {
    nlohmann::json j;

    nlohmann::json prop = nlohmann::json::array();
    for (const auto& p : fault_propagation) prop.push_back(p.to_json());
    j["fault_propagation"] = prop;

    nlohmann::json hs = nlohmann::json::array();
    for (const auto& h : hotspots) hs.push_back(h.to_json());
    j["hotspots"] = hs;

    nlohmann::json fps = nlohmann::json::object();
    for (const auto& [uid, fp] : service_fingerprints) fps[uid] = fp.to_json();
    j["service_fingerprints"] = fps;
    return j;
}

IncidentCorrelation correlate_incidents(const std::vector<IncidentRecord>& incidents, const Hypergraph& graph,
                                        int window_hours, size_t concentrated_max) {
    IncidentCorrelation result;
    if (incidents.empty()) {
        return result;
    }

    // Per-CI incident timelines, CIs in first-seen order
    std::vector<std::string> ci_order;
    std::unordered_map<std::string, std::vector<int64_t>> ci_times;
    std::unordered_map<std::string, int> priority_sum;

    for (const auto& inc : incidents) {
        if (inc.affected_ci.id.empty()) continue;
        std::string uid = "ci:" + inc.affected_ci.id;
        if (ci_times.find(uid) == ci_times.end()) ci_order.push_back(uid);
        ci_times[uid].push_back(parse_timestamp(inc.created_at));
        priority_sum[uid] += inc.priority;
    }

    // ==========================================
    // Fault propagation
    // ==========================================

    const int64_t window_ms = static_cast<int64_t>(window_hours) * MS_PER_HOUR;
    for (const auto& src : ci_order) {
        for (const auto& tgt : ci_order) {
            if (src == tgt) continue;

            size_t count = 0;
            int64_t total_lag = 0;
            for (int64_t ts : ci_times[src]) {
                if (ts == 0) continue;
                for (int64_t tt : ci_times[tgt]) {
                    if (tt == 0) continue;
                    int64_t lag = tt - ts;
                    if (lag > 0 && lag <= window_ms) {
                        count++;
                        total_lag += lag;
                    }
                }
            }

            if (count > 0) {
                FaultPropagation fp;
                fp.source = src;
                fp.target = tgt;
                fp.count = count;
                fp.avg_lag_hours = static_cast<double>(total_lag) / count / MS_PER_HOUR;
                result.fault_propagation.push_back(std::move(fp));
            }
        }
    }
    std::stable_sort(result.fault_propagation.begin(), result.fault_propagation.end(),
        [](const FaultPropagation& a, const FaultPropagation& b) { return a.count > b.count; });

    // ==========================================
    // Hotspots
    // ==========================================

    for (const auto& uid : ci_order) {
        const auto& all_times = ci_times[uid];

        IncidentHotspot hs;
        hs.ci = uid;
        hs.name = node_name(graph, uid);
        hs.incident_count = all_times.size();
        hs.avg_priority = static_cast<double>(priority_sum[uid]) / all_times.size();

        std::vector<int64_t> times;
        for (int64_t t : all_times) {
            if (t > 0) times.push_back(t);
        }
        std::sort(times.begin(), times.end());
        if (times.size() > 1) {
            int64_t total_gap = times.back() - times.front();
            hs.mtbf_hours = static_cast<double>(total_gap) / (times.size() - 1) / MS_PER_HOUR;
        }

        result.hotspots.push_back(std::move(hs));
    }
    std::stable_sort(result.hotspots.begin(), result.hotspots.end(),
        [](const IncidentHotspot& a, const IncidentHotspot& b) { return a.incident_count > b.incident_count; });

    // ==========================================
    // Service fingerprints
    // ==========================================

    std::map<std::string, std::vector<int64_t>> resolution_times;
    for (const auto& inc : incidents) {
        if (inc.business_service.id.empty()) continue;
        std::string svc_uid = "service:" + inc.business_service.id;

        auto& fp = result.service_fingerprints[svc_uid];
        auto& durations = resolution_times[svc_uid];
        fp.incident_count++;

        if (!inc.affected_ci.id.empty()) {
            std::string ci_uid = "ci:" + inc.affected_ci.id;
            if (std::find(fp.affected_cis.begin(), fp.affected_cis.end(), ci_uid) == fp.affected_cis.end()) {
                fp.affected_cis.push_back(ci_uid);
            }
        }

        int64_t created = parse_timestamp(inc.created_at);
        int64_t resolved = parse_timestamp(inc.resolved_at);
        if (created > 0 && resolved > 0 && resolved > created) {
            durations.push_back(resolved - created);
        }
    }

    for (auto& [svc_uid, fp] : result.service_fingerprints) {
        const auto& durations = resolution_times[svc_uid];
        if (!durations.empty()) {
            int64_t total = 0;
            for (int64_t d : durations) total += d;
            fp.avg_resolution_hours = static_cast<double>(total) / durations.size() / MS_PER_HOUR;
        }
        fp.pattern = fp.affected_cis.size() <= concentrated_max ? "concentrated" : "distributed";
    }

    return result;
}

} // namespace bsm
