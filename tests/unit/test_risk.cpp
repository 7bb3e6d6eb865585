#include <gtest/gtest.h>
#include "analytics/risk.hpp"
#include "test_fixtures.hpp"
#include <stdexcept>

using namespace bsm;
using namespace bsm::fixtures;

class RiskHeatmapTest : public ::testing::Test {
protected:
    Hypergraph graph;
    std::vector<ChangeSummary> changes;
    std::vector<IncidentRecord> incidents;

    void SetUp() override {
        auto rows = triangle_rows();
        rows[0].change_type = "Emergency";
        rows[1].change_type = "Emergency";
        graph = Hypergraph::build(rows);
        changes = build_change_list(rows);
        incidents = {
            incident("INC1", "C", "2024-01-11T00:00:00Z"),
            incident("INC2", "C", "2024-01-12T00:00:00Z"),
        };
    }

    const RiskEntry& find(const std::vector<RiskEntry>& entries, const std::string& uid) {
        for (const auto& e : entries) {
            if (e.ci == uid) return e;
        }
        throw std::runtime_error("missing " + uid);
    }
};

// ==========================================
// Scoring
// ==========================================

TEST_F(RiskHeatmapTest, ScoresAreRankedAndBounded) {
    auto entries = risk_heatmap(graph, changes, incidents);
    ASSERT_EQ(entries.size(), 3);

    EXPECT_EQ(entries[0].ci, "ci:A");
    EXPECT_EQ(entries[0].risk_score, 100);
    EXPECT_EQ(entries[1].ci, "ci:B");
    EXPECT_EQ(entries[2].ci, "ci:C");
    for (const auto& e : entries) {
        EXPECT_GE(e.risk_score, 0);
        EXPECT_LE(e.risk_score, 100);
    }
    EXPECT_GT(entries[1].risk_score, entries[2].risk_score);
}

TEST_F(RiskHeatmapTest, FactorsCarryRawValues) {
    auto entries = risk_heatmap(graph, changes, incidents);

    const auto& a = find(entries, "ci:A");
    EXPECT_EQ(a.factors.change_frequency, 3);
    EXPECT_NEAR(a.factors.emergency_ratio, 1.0 / 3.0, 1e-12);
    EXPECT_EQ(a.factors.coupling_density, 2);

    const auto& b = find(entries, "ci:B");
    EXPECT_DOUBLE_EQ(b.factors.emergency_ratio, 0.5);

    const auto& c = find(entries, "ci:C");
    EXPECT_EQ(c.factors.incident_rate, 2);
    EXPECT_DOUBLE_EQ(c.factors.emergency_ratio, 0.0);
}

TEST_F(RiskHeatmapTest, IncidentsOutsideGraphIgnored) {
    incidents.push_back(incident("INC3", "Z", "2024-01-12T00:00:00Z"));
    incidents.push_back(incident("INC4", "Z", "2024-01-13T00:00:00Z"));
    incidents.push_back(incident("INC5", "Z", "2024-01-14T00:00:00Z"));
    auto entries = risk_heatmap(graph, changes, incidents);
    ASSERT_EQ(entries.size(), 3);
    // C still holds the maximum incident rate
    EXPECT_EQ(find(entries, "ci:C").factors.incident_rate, 2);
}

TEST_F(RiskHeatmapTest, NoIncidentsOrEmergencies) {
    auto rows = triangle_rows();
    auto plain_changes = build_change_list(rows);
    auto entries = risk_heatmap(graph, plain_changes, {});
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries[0].risk_score, 100);
    for (const auto& e : entries) {
        EXPECT_DOUBLE_EQ(e.factors.emergency_ratio, 0.0);
        EXPECT_EQ(e.factors.incident_rate, 0);
    }
}

TEST_F(RiskHeatmapTest, EmptyGraph) {
    Hypergraph empty;
    EXPECT_TRUE(risk_heatmap(empty, changes, incidents).empty());
}

TEST_F(RiskHeatmapTest, SerializesFactors) {
    auto entries = risk_heatmap(graph, changes, incidents);
    nlohmann::json j = entries[0].to_json();
    EXPECT_EQ(j["ci"], "ci:A");
    EXPECT_EQ(j["risk_score"], 100);
    EXPECT_TRUE(j["factors"].contains("coupling_density"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
