#include "graph/hypergraph.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace bsm {

// ==========================================
// HyperNode Implementation
// ==========================================

nlohmann::json HyperNode::to_json() const {
    nlohmann::json j;
    j["uid"] = uid;
    j["type"] = node_type_to_string(type);
    j["name"] = name;
    if (!class_name.empty()) {
        j["class"] = class_name;
    }
    j["properties"] = properties;
    return j;
}

HyperNode HyperNode::from_json(const nlohmann::json& j) {
    HyperNode node;
    node.uid = j.at("uid").get<std::string>();
    node.type = string_to_node_type(j.value("type", "ci"));
    node.name = j.value("name", node.uid);
    node.class_name = j.value("class", "");

    if (j.contains("properties")) {
        node.properties = j["properties"].get<std::map<std::string, std::string>>();
    }

    return node;
}

// ==========================================
// HyperEdge Implementation
// ==========================================

bool HyperEdge::contains_node(const std::string& node_uid) const {
    return std::find(elements.begin(), elements.end(), node_uid) != elements.end();
}

std::string HyperEdge::property(const std::string& key, const std::string& fallback) const {
    auto it = properties.find(key);
    return it != properties.end() ? it->second : fallback;
}

nlohmann::json HyperEdge::to_json() const {
    nlohmann::json j;
    j["uid"] = uid;
    j["elements"] = elements;
    j["properties"] = properties;
    if (has_origin()) {
        j["origin"] = {{"type", origin_type}, {"name", origin_name}, {"class", origin_class}};
    }
    return j;
}

HyperEdge HyperEdge::from_json(const nlohmann::json& j) {
    HyperEdge edge;
    edge.uid = j.at("uid").get<std::string>();
    edge.elements = j.at("elements").get<std::vector<std::string>>();

    if (j.contains("properties")) {
        edge.properties = j["properties"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("origin")) {
        const auto& origin = j["origin"];
        edge.origin_type = origin.value("type", "");
        edge.origin_name = origin.value("name", "");
        edge.origin_class = origin.value("class", "");
    }

    return edge;
}

// ==========================================
// Statistics Implementation
// ==========================================

nlohmann::json HypergraphStatistics::to_json() const {
    nlohmann::json j;
    j["total_nodes"] = total_nodes;
    j["total_edges"] = total_edges;
    j["incidence_count"] = incidence_count;
    j["density"] = density;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["min_degree"] = min_degree;
    j["avg_edge_size"] = avg_edge_size;
    j["max_edge_size"] = max_edge_size;
    j["min_edge_size"] = min_edge_size;
    return j;
}

nlohmann::json CooccurrencePair::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    j["count"] = count;
    j["shared_edges"] = shared_edges;
    return j;
}

// ==========================================
// Construction
// ==========================================

Hypergraph Hypergraph::build(const std::vector<ChangeRecord>& records) {
    Hypergraph graph;

    // Change number -> member uids, in first-seen order
    std::vector<std::string> change_order;
    std::unordered_map<std::string, HyperEdge> pending;

    for (const auto& rec : records) {
        if (rec.change_number.empty() || rec.entity_id.empty()) {
            continue;
        }

        auto it = pending.find(rec.change_number);
        if (it == pending.end()) {
            HyperEdge edge;
            edge.uid = "change:" + rec.change_number;
            edge.properties["number"] = rec.change_number;
            edge.properties["risk"] = rec.risk;
            edge.properties["changeType"] = rec.change_type;
            edge.properties["impact"] = rec.impact;
            edge.properties["region"] = rec.region;
            edge.properties["assignmentGroup"] = rec.assignment_group;
            edge.properties["businessService"] = rec.business_service;
            edge.properties["createdAt"] = rec.created_at;

            if (!rec.assignment_group.empty()) {
                HyperNode group;
                group.uid = "group:" + rec.assignment_group;
                group.type = NodeType::GROUP;
                group.name = rec.assignment_group;
                graph.add_node(group);
                edge.elements.push_back(group.uid);
            }
            if (!rec.business_service.empty()) {
                HyperNode service;
                service.uid = "service:" + rec.business_service;
                service.type = NodeType::SERVICE;
                service.name = rec.business_service;
                graph.add_node(service);
                edge.elements.push_back(service.uid);
            }

            change_order.push_back(rec.change_number);
            it = pending.emplace(rec.change_number, std::move(edge)).first;
        }

        HyperNode entity;
        entity.uid = rec.entity_uid();
        entity.type = rec.is_ci() ? NodeType::CI : string_to_node_type(rec.entity_type);
        entity.name = rec.entity_name.empty() ? rec.entity_id : rec.entity_name;
        if (entity.type == NodeType::CI) {
            entity.class_name = rec.entity_class;
        }
        entity.properties = rec.entity_attributes;
        graph.add_node(entity);

        auto& elements = it->second.elements;
        if (std::find(elements.begin(), elements.end(), entity.uid) == elements.end()) {
            elements.push_back(entity.uid);
        }
    }

    for (const auto& number : change_order) {
        graph.add_hyperedge(pending.at(number));
    }

    return graph;
}

Hypergraph Hypergraph::transpose() const {
    Hypergraph dual;
    dual.transposed_ = !transposed_;

    // Former hyperedges become nodes
    for (const auto& edge : edges_) {
        HyperNode node;
        node.uid = edge.uid;
        if (edge.has_origin()) {
            node.type = string_to_node_type(edge.origin_type);
            node.name = edge.origin_name;
            node.class_name = edge.origin_class;
        } else {
            node.type = NodeType::CHANGE;
            node.name = edge.property("number", edge.uid);
        }
        node.properties = edge.properties;
        dual.add_node(node);
    }

    // Former nodes become hyperedges over the changes that touched them
    for (const auto& node : nodes_) {
        auto it = node_edges_.find(node.uid);
        if (it == node_edges_.end() || it->second.empty()) {
            continue;
        }

        HyperEdge edge;
        edge.uid = node.uid;
        edge.elements.reserve(it->second.size());
        for (size_t pos : it->second) {
            edge.elements.push_back(edges_[pos].uid);
        }
        edge.properties = node.properties;
        edge.origin_type = node_type_to_string(node.type);
        edge.origin_name = node.name;
        edge.origin_class = node.class_name;
        dual.add_hyperedge(edge);
    }

    return dual;
}

bool Hypergraph::add_node(const HyperNode& node) {
    if (node.uid.empty() || has_node(node.uid)) {
        return false;
    }

    node_index_[node.uid] = nodes_.size();
    nodes_.push_back(node);
    incidence_[node.uid];
    return true;
}

bool Hypergraph::add_hyperedge(const HyperEdge& edge) {
    if (edge.uid.empty() || has_edge(edge.uid)) {
        return false;
    }

    HyperEdge new_edge;
    new_edge.uid = edge.uid;
    new_edge.properties = edge.properties;
    new_edge.origin_type = edge.origin_type;
    new_edge.origin_name = edge.origin_name;
    new_edge.origin_class = edge.origin_class;

    std::unordered_set<std::string> seen;
    for (const auto& member : edge.elements) {
        if (!has_node(member)) continue;          // dangling reference
        if (!seen.insert(member).second) continue;
        new_edge.elements.push_back(member);
    }

    size_t pos = edges_.size();
    for (const auto& member : new_edge.elements) {
        incidence_[member].insert(new_edge.uid);
        node_edges_[member].push_back(pos);
    }

    edge_index_[new_edge.uid] = pos;
    edges_.push_back(std::move(new_edge));
    return true;
}

// ==========================================
// Accessors
// ==========================================

const HyperNode* Hypergraph::get_node(const std::string& uid) const {
    auto it = node_index_.find(uid);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

const HyperEdge* Hypergraph::get_hyperedge(const std::string& uid) const {
    auto it = edge_index_.find(uid);
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

bool Hypergraph::has_node(const std::string& uid) const {
    return node_index_.find(uid) != node_index_.end();
}

bool Hypergraph::has_edge(const std::string& uid) const {
    return edge_index_.find(uid) != edge_index_.end();
}

size_t Hypergraph::degree(const std::string& uid) const {
    auto it = incidence_.find(uid);
    return it != incidence_.end() ? it->second.size() : 0;
}

std::vector<const HyperEdge*> Hypergraph::get_incident_edges(const std::string& uid) const {
    std::vector<const HyperEdge*> result;
    auto it = node_edges_.find(uid);
    if (it == node_edges_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (size_t pos : it->second) {
        result.push_back(&edges_[pos]);
    }
    return result;
}

std::vector<std::string> Hypergraph::node_uids_of_type(NodeType type) const {
    std::vector<std::string> result;
    for (const auto& node : nodes_) {
        if (node.type == type) {
            result.push_back(node.uid);
        }
    }
    return result;
}

HypergraphStatistics Hypergraph::compute_statistics() const {
    HypergraphStatistics stats;

    stats.total_nodes = nodes_.size();
    stats.total_edges = edges_.size();

    // Node degree statistics
    if (!nodes_.empty()) {
        size_t total_degree = 0;
        stats.min_degree = std::numeric_limits<size_t>::max();

        for (const auto& node : nodes_) {
            size_t deg = degree(node.uid);
            total_degree += deg;
            stats.max_degree = std::max(stats.max_degree, deg);
            stats.min_degree = std::min(stats.min_degree, deg);
        }

        stats.incidence_count = total_degree;
        stats.avg_degree = static_cast<double>(total_degree) / nodes_.size();
    }

    // Edge size statistics
    if (!edges_.empty()) {
        size_t total_edge_size = 0;
        stats.min_edge_size = std::numeric_limits<size_t>::max();

        for (const auto& edge : edges_) {
            size_t size = edge.size();
            total_edge_size += size;
            stats.max_edge_size = std::max(stats.max_edge_size, size);
            stats.min_edge_size = std::min(stats.min_edge_size, size);
        }

        stats.avg_edge_size = static_cast<double>(total_edge_size) / edges_.size();
    }

    size_t max_possible = stats.total_nodes * stats.total_edges;
    if (max_possible > 0) {
        stats.density = static_cast<double>(stats.incidence_count) / max_possible;
    }

    return stats;
}

} // namespace bsm
