#include <gtest/gtest.h>
#include "graph/hypergraph.hpp"
#include "test_fixtures.hpp"
#include <algorithm>
#include <set>

using namespace bsm;
using namespace bsm::fixtures;

class HypergraphTest : public ::testing::Test {
protected:
    Hypergraph graph;

    void SetUp() override {
        std::vector<ChangeRecord> rows = {
            ci_row("CHG1", "web01", "2024-03-01T10:00:00Z", "server", "Billing", "Ops"),
            ci_row("CHG1", "db01", "2024-03-01T10:00:00Z", "database", "Billing", "Ops"),
            ci_row("CHG2", "web01", "2024-03-02T10:00:00Z", "server", "Billing", "Ops"),
            ci_row("CHG2", "lb01", "2024-03-02T10:00:00Z", "loadbalancer", "Billing", "Ops"),
            ci_row("CHG3", "db01", "2024-03-05T10:00:00Z", "database", "Payroll", "DBA"),
        };
        rows[0].entity_attributes["os"] = "linux";
        graph = Hypergraph::build(rows);
    }
};

// ==========================================
// Build Tests
// ==========================================

TEST_F(HypergraphTest, BuildCreatesOneEdgePerChange) {
    EXPECT_EQ(graph.num_edges(), 3);
    EXPECT_TRUE(graph.has_edge("change:CHG1"));
    EXPECT_TRUE(graph.has_edge("change:CHG3"));
}

TEST_F(HypergraphTest, BuildDeduplicatesEntities) {
    // web01, db01, lb01, group:Ops, group:DBA, service:Billing, service:Payroll
    EXPECT_EQ(graph.num_nodes(), 7);
    EXPECT_EQ(graph.node_uids_of_type(NodeType::CI).size(), 3);
    EXPECT_EQ(graph.node_uids_of_type(NodeType::GROUP).size(), 2);
    EXPECT_EQ(graph.node_uids_of_type(NodeType::SERVICE).size(), 2);
}

TEST_F(HypergraphTest, ElementOrderIsGroupServiceThenEntities) {
    const auto* edge = graph.get_hyperedge("change:CHG1");
    ASSERT_NE(edge, nullptr);
    ASSERT_EQ(edge->size(), 4);
    EXPECT_EQ(edge->elements[0], "group:Ops");
    EXPECT_EQ(edge->elements[1], "service:Billing");
    EXPECT_EQ(edge->elements[2], "ci:web01");
    EXPECT_EQ(edge->elements[3], "ci:db01");
}

TEST_F(HypergraphTest, EdgeCarriesChangeAttributes) {
    const auto* edge = graph.get_hyperedge("change:CHG3");
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->property("number"), "CHG3");
    EXPECT_EQ(edge->property("risk"), "Low");
    EXPECT_EQ(edge->property("assignmentGroup"), "DBA");
    EXPECT_EQ(edge->property("businessService"), "Payroll");
    EXPECT_EQ(edge->property("missing", "fallback"), "fallback");
}

TEST_F(HypergraphTest, NodeCarriesClassAndAttributes) {
    const auto* node = graph.get_node("ci:web01");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->type, NodeType::CI);
    EXPECT_EQ(node->name, "web01");
    EXPECT_EQ(node->class_name, "server");
    EXPECT_EQ(node->properties.at("os"), "linux");

    const auto* group = graph.get_node("group:Ops");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->type, NodeType::GROUP);
    EXPECT_TRUE(group->class_name.empty());
}

TEST(HypergraphBuildTest, RowsWithoutIdentifiersAreSkipped) {
    std::vector<ChangeRecord> rows = {
        ci_row("", "A"),
        ci_row("CHG1", ""),
        ci_row("CHG2", "B"),
    };
    Hypergraph graph = Hypergraph::build(rows);
    EXPECT_EQ(graph.num_edges(), 1);
    EXPECT_EQ(graph.num_nodes(), 1);
}

TEST(HypergraphBuildTest, EntityTypePrefixesUid) {
    ChangeRecord rec = ci_row("CHG1", "Ops");
    rec.entity_type = "group";
    ChangeRecord app = ci_row("CHG1", "app7");
    app.entity_type = "application";

    Hypergraph graph = Hypergraph::build({rec, app});
    EXPECT_TRUE(graph.has_node("group:Ops"));
    // Unknown entity types are configuration items
    const auto* node = graph.get_node("ci:app7");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->type, NodeType::CI);
}

// ==========================================
// Incidence Tests
// ==========================================

TEST_F(HypergraphTest, IncidenceIsConsistentBothWays) {
    for (const auto& edge : graph.edges()) {
        for (const auto& uid : edge.elements) {
            ASSERT_TRUE(graph.incidence().count(uid));
            EXPECT_TRUE(graph.incidence().at(uid).count(edge.uid));
        }
    }
    for (const auto& [uid, edge_uids] : graph.incidence()) {
        for (const auto& eid : edge_uids) {
            const auto* edge = graph.get_hyperedge(eid);
            ASSERT_NE(edge, nullptr);
            EXPECT_TRUE(edge->contains_node(uid));
        }
    }
}

TEST_F(HypergraphTest, DegreeCountsIncidentEdges) {
    EXPECT_EQ(graph.degree("ci:web01"), 2);
    EXPECT_EQ(graph.degree("ci:lb01"), 1);
    EXPECT_EQ(graph.degree("group:Ops"), 2);
    EXPECT_EQ(graph.degree("ci:unknown"), 0);
}

TEST_F(HypergraphTest, IncidentEdgesFollowInsertionOrder) {
    auto edges = graph.get_incident_edges("ci:db01");
    ASSERT_EQ(edges.size(), 2);
    EXPECT_EQ(edges[0]->uid, "change:CHG1");
    EXPECT_EQ(edges[1]->uid, "change:CHG3");
}

TEST(HypergraphEditTest, AddHyperedgeDropsDanglingAndDuplicateElements) {
    Hypergraph graph;
    EXPECT_TRUE(graph.add_node({"ci:A", NodeType::CI, "A", "server", {}}));
    EXPECT_TRUE(graph.add_node({"ci:B", NodeType::CI, "B", "server", {}}));
    EXPECT_FALSE(graph.add_node({"ci:A", NodeType::CI, "A", "server", {}}));

    HyperEdge edge;
    edge.uid = "change:X";
    edge.elements = {"ci:A", "ci:ghost", "ci:B", "ci:A"};
    EXPECT_TRUE(graph.add_hyperedge(edge));
    EXPECT_FALSE(graph.add_hyperedge(edge));

    const auto* stored = graph.get_hyperedge("change:X");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->elements, (std::vector<std::string>{"ci:A", "ci:B"}));
    EXPECT_FALSE(graph.has_node("ci:ghost"));
    EXPECT_EQ(graph.degree("ci:A"), 1);
}

// ==========================================
// Statistics Tests
// ==========================================

TEST_F(HypergraphTest, ComputeStatistics) {
    auto stats = graph.compute_statistics();
    EXPECT_EQ(stats.total_nodes, 7);
    EXPECT_EQ(stats.total_edges, 3);
    // CHG1: 4 members, CHG2: 4, CHG3: 3
    EXPECT_EQ(stats.incidence_count, 11);
    EXPECT_EQ(stats.max_edge_size, 4);
    EXPECT_EQ(stats.min_edge_size, 3);
    EXPECT_EQ(stats.max_degree, 2);
    EXPECT_EQ(stats.min_degree, 1);
    EXPECT_NEAR(stats.density, 11.0 / 21.0, 1e-12);
}

TEST_F(HypergraphTest, StatisticsFollowEdits) {
    HyperNode extra{"ci:new", NodeType::CI, "new", "server", {}};
    graph.add_node(extra);
    HyperEdge edge;
    edge.uid = "change:CHG9";
    edge.elements = {"ci:new", "ci:web01"};
    graph.add_hyperedge(edge);

    auto stats = graph.compute_statistics();
    EXPECT_EQ(stats.total_nodes, 8);
    EXPECT_EQ(stats.total_edges, 4);
    EXPECT_EQ(stats.max_degree, 3);
}

// ==========================================
// Transpose Tests
// ==========================================

TEST_F(HypergraphTest, TransposeSwapsRoles) {
    Hypergraph dual = graph.transpose();
    EXPECT_TRUE(dual.is_transposed());
    EXPECT_EQ(dual.num_nodes(), graph.num_edges());
    EXPECT_EQ(dual.num_edges(), graph.num_nodes());

    const auto* change = dual.get_node("change:CHG1");
    ASSERT_NE(change, nullptr);
    EXPECT_EQ(change->type, NodeType::CHANGE);
    EXPECT_EQ(change->name, "CHG1");

    const auto* web = dual.get_hyperedge("ci:web01");
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->elements, (std::vector<std::string>{"change:CHG1", "change:CHG2"}));
    EXPECT_EQ(web->origin_type, "ci");
    EXPECT_EQ(web->origin_name, "web01");
    EXPECT_EQ(web->origin_class, "server");
    EXPECT_EQ(web->property("os"), "linux");
}

TEST_F(HypergraphTest, TransposeIsAnInvolution) {
    Hypergraph twice = graph.transpose().transpose();
    EXPECT_FALSE(twice.is_transposed());
    ASSERT_EQ(twice.num_nodes(), graph.num_nodes());
    ASSERT_EQ(twice.num_edges(), graph.num_edges());

    for (const auto& node : graph.nodes()) {
        const auto* restored = twice.get_node(node.uid);
        ASSERT_NE(restored, nullptr) << node.uid;
        EXPECT_EQ(restored->type, node.type);
        EXPECT_EQ(restored->name, node.name);
        EXPECT_EQ(restored->class_name, node.class_name);
    }

    for (const auto& edge : graph.edges()) {
        const auto* restored = twice.get_hyperedge(edge.uid);
        ASSERT_NE(restored, nullptr) << edge.uid;
        std::set<std::string> original(edge.elements.begin(), edge.elements.end());
        std::set<std::string> round_trip(restored->elements.begin(), restored->elements.end());
        EXPECT_EQ(original, round_trip);
        EXPECT_EQ(restored->property("number"), edge.property("number"));
    }
}

TEST(HypergraphTransposeTest, AttributesNamedLikeIdentityFieldsSurvive) {
    std::vector<ChangeRecord> rows = {
        ci_row("CHG1", "web01", "", "server"),
        ci_row("CHG1", "db01", "", ""),
        ci_row("CHG1", "CHG0", ""),
    };
    rows[0].entity_attributes = {{"type", "virtual"}, {"os", "linux"}, {"name", "alias"}};
    rows[1].entity_attributes = {{"class", "legacy"}};
    rows[2].entity_type = "change";
    rows[2].entity_name = "Parent change";
    Hypergraph graph = Hypergraph::build(rows);

    Hypergraph twice = graph.transpose().transpose();

    const auto* web = twice.get_node("ci:web01");
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->type, NodeType::CI);
    EXPECT_EQ(web->name, "web01");
    EXPECT_EQ(web->class_name, "server");
    EXPECT_EQ(web->properties, graph.get_node("ci:web01")->properties);

    const auto* db = twice.get_node("ci:db01");
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->class_name, "");
    EXPECT_EQ(db->properties.at("class"), "legacy");

    const auto* parent = twice.get_node("change:CHG0");
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(parent->type, NodeType::CHANGE);
    EXPECT_EQ(parent->name, "Parent change");
}

TEST(HypergraphTransposeTest, OriginSurvivesJsonRoundTrip) {
    Hypergraph dual = Hypergraph::build(triangle_rows()).transpose();
    Hypergraph loaded = Hypergraph::from_json(dual.to_json());

    const auto* a = loaded.get_hyperedge("ci:A");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->origin_type, "ci");
    EXPECT_EQ(a->origin_name, "A");
    EXPECT_EQ(loaded.transpose().get_node("ci:A")->class_name, "server");
}

TEST(HypergraphTransposeTest, IsolatedNodesAreSkipped) {
    Hypergraph graph;
    graph.add_node({"ci:A", NodeType::CI, "A", "server", {}});
    graph.add_node({"ci:lonely", NodeType::CI, "lonely", "server", {}});
    HyperEdge edge;
    edge.uid = "change:1";
    edge.elements = {"ci:A"};
    graph.add_hyperedge(edge);

    Hypergraph dual = graph.transpose();
    EXPECT_EQ(dual.num_edges(), 1);
    EXPECT_FALSE(dual.has_edge("ci:lonely"));
}

// ==========================================
// Query Tests
// ==========================================

TEST(CooccurrenceTest, RanksSharedPairsFirst) {
    Hypergraph graph = Hypergraph::build(triangle_rows());
    auto pairs = graph.cooccurrence(NodeType::CI);

    ASSERT_EQ(pairs.size(), 2);
    EXPECT_EQ(pairs[0].a, "ci:A");
    EXPECT_EQ(pairs[0].b, "ci:B");
    EXPECT_EQ(pairs[0].count, 2);
    EXPECT_EQ(pairs[0].shared_edges, (std::vector<std::string>{"change:CHG1", "change:CHG2"}));
    EXPECT_EQ(pairs[1].a, "ci:A");
    EXPECT_EQ(pairs[1].b, "ci:C");
    EXPECT_EQ(pairs[1].count, 1);
}

TEST(CooccurrenceTest, TiesKeepFirstSeenOrder) {
    Hypergraph graph = Hypergraph::build({
        ci_row("CHG1", "Z"),
        ci_row("CHG1", "Y"),
        ci_row("CHG2", "A"),
        ci_row("CHG2", "B"),
    });
    auto pairs = graph.cooccurrence(NodeType::CI);

    ASSERT_EQ(pairs.size(), 2);
    EXPECT_EQ(pairs[0].a, "ci:Y");
    EXPECT_EQ(pairs[0].b, "ci:Z");
    EXPECT_EQ(pairs[1].a, "ci:A");
    EXPECT_EQ(pairs[1].b, "ci:B");
    EXPECT_EQ(pairs[0].count, pairs[1].count);

    auto limited = graph.cooccurrence(NodeType::CI, 1);
    ASSERT_EQ(limited.size(), 1);
    EXPECT_EQ(limited[0].a, "ci:Y");
}

TEST_F(HypergraphTest, CooccurrenceTypeFilterAndLimit) {
    auto all = graph.cooccurrence(std::nullopt, 100);
    auto ci_only = graph.cooccurrence(NodeType::CI, 100);
    EXPECT_GT(all.size(), ci_only.size());
    for (const auto& pair : ci_only) {
        EXPECT_EQ(pair.a.rfind("ci:", 0), 0u);
        EXPECT_EQ(pair.b.rfind("ci:", 0), 0u);
        EXPECT_LT(pair.a, pair.b);
    }
    EXPECT_EQ(graph.cooccurrence(std::nullopt, 1).size(), 1);
}

TEST_F(HypergraphTest, NeighborsSpanAllIncidentEdges) {
    auto neighbors = graph.neighbors("ci:web01");
    std::set<std::string> got(neighbors.begin(), neighbors.end());
    std::set<std::string> expected = {"group:Ops", "service:Billing", "ci:db01", "ci:lb01"};
    EXPECT_EQ(got, expected);
    EXPECT_EQ(neighbors.size(), got.size());
    EXPECT_TRUE(graph.neighbors("ci:missing").empty());
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(HypergraphTest, JsonRoundTrip) {
    nlohmann::json j = graph.to_json();
    EXPECT_EQ(j["nodes"].size(), 7);
    EXPECT_EQ(j["hyperedges"].size(), 3);
    EXPECT_FALSE(j["is_transposed"].get<bool>());

    Hypergraph restored = Hypergraph::from_json(j);
    EXPECT_EQ(restored.num_nodes(), graph.num_nodes());
    EXPECT_EQ(restored.num_edges(), graph.num_edges());
    EXPECT_EQ(restored.degree("ci:db01"), 2);
    EXPECT_EQ(restored.get_node("ci:db01")->class_name, "database");
}

TEST_F(HypergraphTest, IncidenceMatrixMatchesMembership) {
    nlohmann::json m = graph.to_incidence_matrix();
    const auto& nodes = m["nodes"];
    const auto& edges = m["edges"];
    const auto& matrix = m["matrix"];
    ASSERT_EQ(matrix.size(), nodes.size());

    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t k = 0; k < edges.size(); ++k) {
            const auto* edge = graph.get_hyperedge(edges[k].get<std::string>());
            int expected = edge->contains_node(nodes[i].get<std::string>()) ? 1 : 0;
            EXPECT_EQ(matrix[i][k].get<int>(), expected);
        }
    }
}

TEST(HypergraphIoTest, LoadMissingFileThrows) {
    EXPECT_THROW(Hypergraph::load_from_json("/nonexistent/graph.json"), std::runtime_error);
}

// ==========================================
// Edge Cases
// ==========================================

TEST(EdgeCaseTest, EmptyGraph) {
    Hypergraph empty = Hypergraph::build({});

    EXPECT_EQ(empty.num_nodes(), 0);
    EXPECT_EQ(empty.num_edges(), 0);
    EXPECT_TRUE(empty.empty());
    EXPECT_TRUE(empty.cooccurrence().empty());
    EXPECT_TRUE(empty.transpose().empty());

    auto stats = empty.compute_statistics();
    EXPECT_EQ(stats.total_nodes, 0);
    EXPECT_DOUBLE_EQ(stats.density, 0.0);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
