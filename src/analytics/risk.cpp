#include "analytics/risk.hpp"
#include <algorithm>
#include <cmath>

namespace bsm {

nlohmann::json RiskEntry::to_json() const {
    nlohmann::json j;
    j["ci"] = ci;
    j["name"] = name;
    j["risk_score"] = risk_score;
    j["factors"] = {
        {"change_frequency", factors.change_frequency},
        {"emergency_ratio", factors.emergency_ratio},
        {"incident_rate", factors.incident_rate},
        {"coupling_density", factors.coupling_density}
    };
    return j;
}

std::vector<RiskEntry> risk_heatmap(const Hypergraph& graph, const std::vector<ChangeSummary>& changes,
                                    const std::vector<IncidentRecord>& incidents) {
    std::vector<RiskEntry> results;

    auto ci_uids = graph.node_uids_of_type(NodeType::CI);
    if (ci_uids.empty()) {
        return results;
    }

    struct CiStats {
        size_t change_count = 0;
        size_t emergency_count = 0;
        std::unordered_set<std::string> coupled;
    };
    std::unordered_map<std::string, CiStats> stats;
    for (const auto& uid : ci_uids) stats[uid];

    for (const auto& chg : changes) {
        bool emergency = chg.change_type == "Emergency";
        for (const auto& uid : chg.ci_uids) {
            auto it = stats.find(uid);
            if (it == stats.end()) continue;
            it->second.change_count++;
            if (emergency) it->second.emergency_count++;
            for (const auto& other : chg.ci_uids) {
                if (other != uid) it->second.coupled.insert(other);
            }
        }
    }

    std::unordered_map<std::string, size_t> incident_counts;
    for (const auto& inc : incidents) {
        if (!inc.affected_ci.id.empty()) incident_counts["ci:" + inc.affected_ci.id]++;
    }

    double max_cf = 0.0, max_er = 0.0, max_ir = 0.0, max_cd = 0.0;
    for (const auto& uid : ci_uids) {
        const auto& s = stats[uid];

        RiskEntry entry;
        entry.ci = uid;
        entry.name = node_name(graph, uid);
        entry.factors.change_frequency = s.change_count;
        entry.factors.emergency_ratio = s.change_count > 0
            ? static_cast<double>(s.emergency_count) / s.change_count : 0.0;
        auto inc = incident_counts.find(uid);
        entry.factors.incident_rate = inc != incident_counts.end() ? inc->second : 0;
        entry.factors.coupling_density = s.coupled.size();

        max_cf = std::max(max_cf, static_cast<double>(entry.factors.change_frequency));
        max_er = std::max(max_er, entry.factors.emergency_ratio);
        max_ir = std::max(max_ir, static_cast<double>(entry.factors.incident_rate));
        max_cd = std::max(max_cd, static_cast<double>(entry.factors.coupling_density));
        results.push_back(std::move(entry));
    }

    auto ratio = [](double value, double max) { return max > 0.0 ? value / max : 0.0; };

    std::vector<double> raw;
    raw.reserve(results.size());
    double max_raw = 0.0;
    for (const auto& entry : results) {
        double r = 0.3 * ratio(entry.factors.change_frequency, max_cf) +
                   0.25 * ratio(entry.factors.emergency_ratio, max_er) +
                   0.25 * ratio(entry.factors.incident_rate, max_ir) +
                   0.2 * ratio(entry.factors.coupling_density, max_cd);
        raw.push_back(r);
        max_raw = std::max(max_raw, r);
    }

    for (size_t i = 0; i < results.size(); ++i) {
        results[i].risk_score = static_cast<int>(std::lround(ratio(raw[i], max_raw) * 100.0));
    }

    std::stable_sort(results.begin(), results.end(),
        [](const RiskEntry& a, const RiskEntry& b) { return a.risk_score > b.risk_score; });
    return results;
}

} // namespace bsm
