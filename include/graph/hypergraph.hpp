#ifndef BSM_HYPERGRAPH_HPP
#define BSM_HYPERGRAPH_HPP

#include "graph/records.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace bsm {

// Entity kinds that can appear as hypergraph nodes
enum class NodeType {
    CI,
    GROUP,
    SERVICE,
    CHANGE
};

inline std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::CI: return "ci";
        case NodeType::GROUP: return "group";
        case NodeType::SERVICE: return "service";
        case NodeType::CHANGE: return "change";
        default: return "ci";
    }
}

inline NodeType string_to_node_type(const std::string& s) {
    if (s == "group") return NodeType::GROUP;
    if (s == "service") return NodeType::SERVICE;
    if (s == "change") return NodeType::CHANGE;
    return NodeType::CI; // default
}

/**
 * @brief Represents an entity in the hypergraph
 *
 * Configuration items, assignment groups and business services in the
 * original view; change requests in the transposed view. The uid is
 * prefixed with the type ("ci:web01", "group:Network").
 */
struct HyperNode {
    std::string uid;                                   // Type-prefixed unique identifier
    NodeType type = NodeType::CI;
    std::string name;                                  // Human-readable name
    std::string class_name;                            // CI class (empty for non-CI nodes)
    std::map<std::string, std::string> properties;     // Additional metadata

    /**
     * @brief Convert node to JSON representation
     */
    nlohmann::json to_json() const;

    /**
     * @brief Create node from JSON
     */
    static HyperNode from_json(const nlohmann::json& j);
};

/**
 * @brief Represents an undirected hyperedge over an ordered set of entities
 *
 * In the original view each hyperedge is one change request and its
 * elements are the group, service and CIs it touched.
 */
struct HyperEdge {
    std::string uid;                                   // Unique identifier ("change:CHG0001")
    std::vector<std::string> elements;                 // Member node uids, no duplicates
    std::map<std::string, std::string> properties;     // number, risk, assignmentGroup, ...

    // Entity this hyperedge stands for in a transposed view; empty otherwise
    std::string origin_type;
    std::string origin_name;
    std::string origin_class;

    bool has_origin() const { return !origin_type.empty(); }

    /**
     * @brief Get the size of this hyperedge (number of nodes)
     */
    size_t size() const { return elements.size(); }

    /**
     * @brief Check if this hyperedge contains a specific node
     */
    bool contains_node(const std::string& node_uid) const;

    /**
     * @brief Look up a property, returning fallback when absent
     */
    std::string property(const std::string& key, const std::string& fallback = "") const;

    nlohmann::json to_json() const;
    static HyperEdge from_json(const nlohmann::json& j);
};

// node uid -> set of hyperedge uids containing it
using IncidenceMap = std::unordered_map<std::string, std::unordered_set<std::string>>;

/**
 * @brief Statistics about the hypergraph structure
 */
struct HypergraphStatistics {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t incidence_count = 0;
    double density = 0.0;                              // incidence_count / (nodes * edges)

    double avg_degree = 0.0;
    size_t max_degree = 0;
    size_t min_degree = 0;

    double avg_edge_size = 0.0;
    size_t max_edge_size = 0;
    size_t min_edge_size = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief A ranked pair of nodes sharing hyperedges
 */
struct CooccurrencePair {
    std::string a;
    std::string b;
    size_t count = 0;
    std::vector<std::string> shared_edges;

    nlohmann::json to_json() const;
};

/**
 * @brief Transposable incidence hypergraph of change requests and entities
 *
 * Key features:
 * - Built once from flat change/entity join rows
 * - Bidirectionally consistent incidence map (node -> edges, edge -> nodes)
 * - Lossless transpose that swaps the role of nodes and hyperedges
 * - Pairwise co-occurrence and neighborhood queries
 * - JSON and incidence matrix export
 *
 * A Hypergraph is read-only for the analytics modules; rebuild it whenever
 * the record set changes.
 */
class Hypergraph {
public:
    Hypergraph() = default;

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Build the original view from change/entity join rows
     * @param records One row per change/entity pairing
     * @return Hypergraph with one hyperedge per change number
     *
     * Each change also references group:<assignmentGroup> and
     * service:<businessService> when those fields are set.
     */
    static Hypergraph build(const std::vector<ChangeRecord>& records);

    /**
     * @brief Swap nodes and hyperedges
     *
     * Every hyperedge becomes a node of type change; every node with at
     * least one incident hyperedge becomes a hyperedge over those changes.
     * Entity type, name and class travel in the hyperedge origin fields,
     * apart from its properties, so that transposing twice restores the
     * original nodes including their attributes.
     */
    Hypergraph transpose() const;

    /**
     * @brief Add a node
     * @return false if a node with the same uid already exists
     */
    bool add_node(const HyperNode& node);

    /**
     * @brief Add a hyperedge
     * @return false if the uid is empty or already present
     *
     * Elements that are not existing nodes, and repeated elements, are
     * dropped. The incidence map is updated for every kept element.
     */
    bool add_hyperedge(const HyperEdge& edge);

    // ==========================================
    // Accessors
    // ==========================================

    const HyperNode* get_node(const std::string& uid) const;
    const HyperEdge* get_hyperedge(const std::string& uid) const;

    bool has_node(const std::string& uid) const;
    bool has_edge(const std::string& uid) const;

    const std::vector<HyperNode>& nodes() const { return nodes_; }
    const std::vector<HyperEdge>& edges() const { return edges_; }
    const IncidenceMap& incidence() const { return incidence_; }

    /**
     * @brief Number of hyperedges containing the node (0 for unknown uids)
     */
    size_t degree(const std::string& uid) const;

    /**
     * @brief Hyperedges containing the node, in hyperedge insertion order
     */
    std::vector<const HyperEdge*> get_incident_edges(const std::string& uid) const;

    /**
     * @brief Uids of all nodes of one type, in node insertion order
     */
    std::vector<std::string> node_uids_of_type(NodeType type) const;

    /**
     * @brief Statistics derived from the current structure
     */
    HypergraphStatistics compute_statistics() const;

    bool is_transposed() const { return transposed_; }
    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty() && edges_.empty(); }

    // ==========================================
    // Queries
    // ==========================================

    /**
     * @brief Rank node pairs by the number of hyperedges they share
     * @param type_filter Only count members of this type
     * @param top_n Maximum number of pairs returned
     *
     * Pairs use the canonical order (a < b). Ties keep first-seen order.
     */
    std::vector<CooccurrencePair> cooccurrence(
        std::optional<NodeType> type_filter = std::nullopt,
        size_t top_n = 20
    ) const;

    /**
     * @brief All other members of every hyperedge containing uid
     * @return Empty for unknown or isolated nodes
     */
    std::vector<std::string> neighbors(const std::string& uid) const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @brief Export to JSON file
     */
    void export_to_json(const std::string& filename) const;

    /**
     * @brief Export incidence matrix (nodes x hyperedges)
     */
    nlohmann::json to_incidence_matrix() const;

    static Hypergraph from_json(const nlohmann::json& j);

    /**
     * @brief Load hypergraph from JSON file
     */
    static Hypergraph load_from_json(const std::string& filename);

private:
    std::vector<HyperNode> nodes_;
    std::vector<HyperEdge> edges_;
    std::unordered_map<std::string, size_t> node_index_;   // uid -> position in nodes_
    std::unordered_map<std::string, size_t> edge_index_;   // uid -> position in edges_
    IncidenceMap incidence_;
    std::unordered_map<std::string, std::vector<size_t>> node_edges_;  // uid -> ordered edge positions
    bool transposed_ = false;
};

} // namespace bsm

#endif // BSM_HYPERGRAPH_HPP
