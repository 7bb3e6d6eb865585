#include "analytics/community.hpp"
#include <algorithm>
#include <numeric>

namespace bsm {

namespace {

// Most frequent key; ties go to the first key seen
std::string dominant(const std::vector<std::string>& order, const std::unordered_map<std::string, size_t>& counts) {
    std::string best = "unknown";
    size_t best_count = 0;
    for (const auto& key : order) {
        size_t c = counts.at(key);
        if (c > best_count) {
            best_count = c;
            best = key;
        }
    }
    return best;
}

std::vector<CommunitySummary> summarize(const Hypergraph& graph,
                                        const std::map<int, std::vector<std::string>>& communities) {
    std::vector<CommunitySummary> result;

    for (const auto& [cid, members] : communities) {
        std::vector<std::string> class_order, service_order;
        std::unordered_map<std::string, size_t> class_counts, service_counts;

        for (const auto& uid : members) {
            const auto* node = graph.get_node(uid);
            if (!node) continue;

            std::string cls = node->class_name.empty() ? node_type_to_string(node->type) : node->class_name;
            if (class_counts[cls]++ == 0) class_order.push_back(cls);

            for (const auto* edge : graph.get_incident_edges(uid)) {
                std::string service = edge->property("businessService");
                if (service.empty()) continue;
                if (service_counts[service]++ == 0) service_order.push_back(service);
            }
        }

        CommunitySummary summary;
        summary.id = cid;
        summary.size = members.size();
        summary.dominant_class = dominant(class_order, class_counts);
        summary.dominant_service = dominant(service_order, service_counts);
        result.push_back(std::move(summary));
    }

    std::stable_sort(result.begin(), result.end(),
        [](const CommunitySummary& a, const CommunitySummary& b) { return a.size > b.size; });
    return result;
}

} // namespace

nlohmann::json CommunitySummary::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["size"] = size;
    j["dominant_class"] = dominant_class;
    j["dominant_service"] = dominant_service;
    return j;
}

nlohmann::json CommunityResult::to_json() const {
    nlohmann::json j;
    j["assignments"] = assignments;

    nlohmann::json groups = nlohmann::json::object();
    for (const auto& [cid, members] : communities) {
        groups[std::to_string(cid)] = members;
    }
    j["communities"] = groups;
    j["modularity"] = modularity;

    nlohmann::json summary_arr = nlohmann::json::array();
    for (const auto& s : summary) {
        summary_arr.push_back(s.to_json());
    }
    j["summary"] = summary_arr;
    return j;
}

CommunityResult detect_communities(const Hypergraph& graph, int max_passes) {
    CommunityResult result;

    ProjectionGraph proj = build_ci_projection(graph);
    size_t n = proj.node_ids.size();
    if (n == 0) {
        return result;
    }

    std::vector<int> community(n);
    std::iota(community.begin(), community.end(), 0);

    std::vector<double> k(n, 0.0);
    double m2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (const auto& [_, w] : proj.adj[i]) sum += w;
        k[i] = sum;
        m2 += sum;
    }
    const double m = m2 / 2.0;

    if (m > 0.0) {
        std::vector<double> tot(k);

        auto neigh_comm_weights = [&](size_t i) {
            std::map<int, double> weights;
            for (const auto& [j, w] : proj.adj[i]) {
                weights[community[j]] += w;
            }
            return weights;
        };

        auto modularity_gain = [&](size_t i, double ki_in, double totc) {
            return ki_in / m - (totc * k[i]) / (2.0 * m * m);
        };

        bool improved = true;
        int passes = 0;
        while (improved && passes < max_passes) {
            improved = false;
            passes++;

            for (size_t i = 0; i < n; ++i) {
                int ci = community[i];
                auto neigh = neigh_comm_weights(i);

                auto own = neigh.find(ci);
                double sigma_in = own != neigh.end() ? own->second : 0.0;
                double remove_gain = modularity_gain(i, sigma_in, tot[ci] - k[i]);

                int best_c = ci;
                double best_gain = 0.0;
                for (const auto& [c, ki_in] : neigh) {
                    if (c == ci) continue;
                    double delta_q = modularity_gain(i, ki_in, tot[c]) - remove_gain;
                    if (delta_q > best_gain) {
                        best_gain = delta_q;
                        best_c = c;
                    }
                }

                if (best_c != ci && best_gain > 0.0) {
                    tot[ci] -= k[i];
                    tot[best_c] += k[i];
                    community[i] = best_c;
                    improved = true;
                }
            }
        }

        double q = 0.0;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                if (community[i] != community[j]) continue;
                auto it = proj.adj[i].find(j);
                double a_ij = it != proj.adj[i].end() ? it->second : 0.0;
                q += a_ij - (k[i] * k[j]) / (2.0 * m);
            }
        }
        result.modularity = q / (2.0 * m);
    }

    std::unordered_map<int, int> remap;
    int next_id = 0;
    for (size_t i = 0; i < n; ++i) {
        int c = community[i];
        if (remap.find(c) == remap.end()) remap[c] = next_id++;
        int cid = remap[c];
        result.assignments[proj.node_ids[i]] = cid;
        result.communities[cid].push_back(proj.node_ids[i]);
    }

    result.summary = summarize(graph, result.communities);
    return result;
}

} // namespace bsm
