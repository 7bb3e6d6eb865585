#include "analytics/weighted_cooccurrence.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace bsm {

nlohmann::json WeightedPair::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["raw_count"] = raw_count;
    j["risk_weighted"] = risk_weighted;
    j["recency_weighted"] = recency_weighted;
    j["diversity"] = diversity;
    j["jaccard"] = jaccard;
    j["composite"] = composite;
    return j;
}

std::vector<WeightedPair> weighted_cooccurrence(const Hypergraph& graph, const std::vector<ChangeSummary>& changes,
                                                size_t top_n, double half_life_days) {
    std::vector<WeightedPair> results;
    if (graph.edges().empty()) {
        return results;
    }

    int64_t now = 0;
    for (const auto& chg : changes) {
        now = std::max(now, chg.created_at_ms);
    }
    const double half_life_ms = half_life_days * static_cast<double>(MS_PER_DAY);
    const double ln2 = std::log(2.0);
    auto by_number = index_changes(changes);

    std::unordered_map<std::string, std::unordered_set<std::string>> ci_edges;
    std::unordered_map<std::string, size_t> pair_index;
    std::vector<std::set<std::string>> pair_groups;

    for (const auto& edge : graph.edges()) {
        std::vector<std::string> members;
        for (const auto& uid : edge.elements) {
            const auto* node = graph.get_node(uid);
            if (node && node->type == NodeType::CI) {
                members.push_back(uid);
                ci_edges[uid].insert(edge.uid);
            }
        }

        auto chg_it = by_number.find(edge.property("number"));
        const ChangeSummary* chg = chg_it != by_number.end() ? chg_it->second : nullptr;

        double risk_w = risk_weight(edge.property("risk", "Low"));
        double age = (chg && chg->created_at_ms > 0) ? static_cast<double>(now - chg->created_at_ms) : 0.0;
        double recency_w = half_life_ms > 0.0 ? std::exp(-ln2 * age / half_life_ms) : 1.0;
        std::string group = edge.property("assignmentGroup");
        if (group.empty() && chg) group = chg->assignment_group;

        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                std::string key = pair_key(members[i], members[j]);
                auto it = pair_index.find(key);
                if (it == pair_index.end()) {
                    WeightedPair pair;
                    pair.a = std::min(members[i], members[j]);
                    pair.b = std::max(members[i], members[j]);
                    it = pair_index.emplace(key, results.size()).first;
                    results.push_back(std::move(pair));
                    pair_groups.emplace_back();
                }

                auto& pair = results[it->second];
                pair.raw_count++;
                pair.risk_weighted += risk_w;
                pair.recency_weighted += recency_w;
                if (!group.empty()) pair_groups[it->second].insert(group);
            }
        }
    }

    if (results.empty()) {
        return results;
    }

    double max_raw = 0.0, max_risk = 0.0, max_recency = 0.0, max_div = 0.0, max_jac = 0.0;
    for (size_t i = 0; i < results.size(); ++i) {
        auto& pair = results[i];
        pair.diversity = pair_groups[i].size();
        pair.jaccard = jaccard_overlap(ci_edges[pair.a], ci_edges[pair.b]);

        max_raw = std::max(max_raw, static_cast<double>(pair.raw_count));
        max_risk = std::max(max_risk, pair.risk_weighted);
        max_recency = std::max(max_recency, pair.recency_weighted);
        max_div = std::max(max_div, static_cast<double>(pair.diversity));
        max_jac = std::max(max_jac, pair.jaccard);
    }

    auto scaled = [](double v, double max_v) { return max_v > 0.0 ? v / max_v : 0.0; };
    for (auto& pair : results) {
        pair.composite = 0.25 * scaled(static_cast<double>(pair.raw_count), max_raw) +
                         0.25 * scaled(pair.risk_weighted, max_risk) +
                         0.2 * scaled(pair.recency_weighted, max_recency) +
                         0.15 * scaled(static_cast<double>(pair.diversity), max_div) +
                         0.15 * scaled(pair.jaccard, max_jac);
    }

    std::stable_sort(results.begin(), results.end(),
        [](const WeightedPair& x, const WeightedPair& y) { return x.composite > y.composite; });

    if (results.size() > top_n) {
        results.resize(top_n);
    }
    return results;
}

} // namespace bsm
