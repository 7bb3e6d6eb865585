#include "analytics/anomaly.hpp"
#include <algorithm>

namespace bsm {

namespace {

std::string class_of(const HyperNode* node) {
    return (node && !node->class_name.empty()) ? node->class_name : "unknown";
}

} // namespace

// ==========================================
// Serialization
// ==========================================

nlohmann::json OrphanCI::to_json() const {
    return {{"uid", uid}, {"name", name}, {"degree", degree}, {"reason", reason}};
}

nlohmann::json UnexpectedPair::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["name_a"] = name_a;
    j["name_b"] = name_b;
    j["class_a"] = class_a;
    j["class_b"] = class_b;
    j["actual"] = actual;
    j["expected"] = expected;
    j["ratio"] = ratio;
    return j;
}

nlohmann::json OverCoupledPair::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["name_a"] = name_a;
    j["name_b"] = name_b;
    j["jaccard"] = jaccard;
    j["shared_changes"] = shared_changes;
    return j;
}

nlohmann::json UnderCoupledPair::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["name_a"] = name_a;
    j["name_b"] = name_b;
    j["shared_service"] = shared_service;
    j["reason"] = reason;
    return j;
}

nlohmann::json AnomalyReport::to_json() const {
    nlohmann::json j;
    auto to_array = [](const auto& items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items) arr.push_back(item.to_json());
        return arr;
    };
    j["unexpected_pairs"] = to_array(unexpected_pairs);
    j["orphans"] = to_array(orphans);
    j["over_coupled"] = to_array(over_coupled);
    j["under_coupled"] = to_array(under_coupled);
    return j;
}

// ==========================================
// Detection
// ==========================================

AnomalyReport detect_anomalies(const Hypergraph& graph, double unexpected_ratio, double overcoupling_jaccard) {
    AnomalyReport report;

    // Orphans
    for (const auto& uid : graph.node_uids_of_type(NodeType::CI)) {
        size_t deg = graph.degree(uid);
        if (deg > 1) continue;

        OrphanCI orphan;
        orphan.uid = uid;
        orphan.name = node_name(graph, uid);
        orphan.degree = deg;
        orphan.reason = deg == 0 ? "no changes reference this CI" : "only 1 change references this CI";
        report.orphans.push_back(std::move(orphan));
    }

    // Class frequencies and pair counts
    std::unordered_map<std::string, size_t> class_count;   // class -> hyperedges containing it
    std::vector<std::pair<std::string, std::string>> pairs;
    std::unordered_map<std::string, size_t> pair_count;
    std::unordered_map<std::string, std::unordered_set<std::string>> ci_edges;

    std::vector<std::string> service_order;
    std::unordered_map<std::string, std::vector<std::string>> service_members;
    std::unordered_map<std::string, std::unordered_set<std::string>> service_seen;

    for (const auto& edge : graph.edges()) {
        std::vector<std::string> members;
        std::unordered_set<std::string> classes;
        std::string service_uid;

        for (const auto& uid : edge.elements) {
            const auto* node = graph.get_node(uid);
            if (!node) continue;
            if (node->type == NodeType::SERVICE) {
                service_uid = uid;
            } else if (node->type == NodeType::CI) {
                members.push_back(uid);
                classes.insert(class_of(node));
                ci_edges[uid].insert(edge.uid);
            }
        }

        for (const auto& cls : classes) {
            class_count[cls]++;
        }

        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                std::string key = pair_key(members[i], members[j]);
                if (pair_count[key]++ == 0) {
                    pairs.emplace_back(std::min(members[i], members[j]), std::max(members[i], members[j]));
                }
            }
        }

        if (!service_uid.empty()) {
            if (service_members.find(service_uid) == service_members.end()) {
                service_order.push_back(service_uid);
                service_members[service_uid];
            }
            for (const auto& uid : members) {
                if (service_seen[service_uid].insert(uid).second) {
                    service_members[service_uid].push_back(uid);
                }
            }
        }
    }

    // Unexpected pairs and over-coupling
    const double total_edges = static_cast<double>(graph.num_edges());
    const double denom = std::max(total_edges, 1.0);

    for (const auto& [a, b] : pairs) {
        const auto* node_a = graph.get_node(a);
        const auto* node_b = graph.get_node(b);
        size_t actual = pair_count[pair_key(a, b)];

        std::string class_a = class_of(node_a);
        std::string class_b = class_of(node_b);
        double freq_a = class_count[class_a] / denom;
        double freq_b = class_count[class_b] / denom;
        double expected = freq_a * freq_b * total_edges;

        if (expected > 0.0 && actual > unexpected_ratio * expected) {
            UnexpectedPair up;
            up.a = a;
            up.b = b;
            up.name_a = node_name(graph, a);
            up.name_b = node_name(graph, b);
            up.class_a = class_a;
            up.class_b = class_b;
            up.actual = actual;
            up.expected = expected;
            up.ratio = actual / expected;
            report.unexpected_pairs.push_back(std::move(up));
        }

        const auto& edges_a = ci_edges[a];
        const auto& edges_b = ci_edges[b];
        double jaccard = jaccard_overlap(edges_a, edges_b);
        if (jaccard > overcoupling_jaccard) {
            OverCoupledPair oc;
            oc.a = a;
            oc.b = b;
            oc.name_a = node_name(graph, a);
            oc.name_b = node_name(graph, b);
            oc.jaccard = jaccard;
            for (const auto& e : edges_a) {
                if (edges_b.count(e)) oc.shared_changes++;
            }
            report.over_coupled.push_back(std::move(oc));
        }
    }

    std::stable_sort(report.unexpected_pairs.begin(), report.unexpected_pairs.end(),
        [](const UnexpectedPair& x, const UnexpectedPair& y) { return x.ratio > y.ratio; });
    std::stable_sort(report.over_coupled.begin(), report.over_coupled.end(),
        [](const OverCoupledPair& x, const OverCoupledPair& y) { return x.jaccard > y.jaccard; });

    // Under-coupling within each service
    for (const auto& service_uid : service_order) {
        const auto& members = service_members[service_uid];
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                if (pair_count.count(pair_key(members[i], members[j]))) continue;

                UnderCoupledPair uc;
                uc.a = members[i];
                uc.b = members[j];
                uc.name_a = node_name(graph, members[i]);
                uc.name_b = node_name(graph, members[j]);
                uc.shared_service = service_uid;
                uc.reason = "share business service but never appear in the same change";
                report.under_coupled.push_back(std::move(uc));
            }
        }
    }

    return report;
}

} // namespace bsm
