#include <gtest/gtest.h>
#include "analytics/incident.hpp"
#include "test_fixtures.hpp"

using namespace bsm;
using namespace bsm::fixtures;

class IncidentCorrelationTest : public ::testing::Test {
protected:
    Hypergraph graph;
    std::vector<IncidentRecord> incidents;

    void SetUp() override {
        graph = Hypergraph::build(triangle_rows());
        incidents = {
            incident("INC1", "A", "2024-01-01T00:00:00Z", "Web", 1, "2024-01-01T04:00:00Z"),
            incident("INC2", "B", "2024-01-01T06:00:00Z", "Web", 3, "2024-01-01T08:00:00Z"),
            incident("INC3", "A", "2024-01-03T00:00:00Z", "Web", 2),
            incident("INC4", "C", "2024-01-10T00:00:00Z", "DB", 4),
        };
    }
};

// ==========================================
// Fault Propagation
// ==========================================

TEST_F(IncidentCorrelationTest, PropagationWithinWindow) {
    auto result = correlate_incidents(incidents, graph);
    ASSERT_EQ(result.fault_propagation.size(), 1);

    const auto& fp = result.fault_propagation[0];
    EXPECT_EQ(fp.source, "ci:A");
    EXPECT_EQ(fp.target, "ci:B");
    EXPECT_EQ(fp.count, 1);
    EXPECT_NEAR(fp.avg_lag_hours, 6.0, 1e-9);
}

TEST_F(IncidentCorrelationTest, WiderWindowAddsReversePropagation) {
    // B at day 1 06:00 precedes the second A incident by 42 hours
    auto result = correlate_incidents(incidents, graph, 48);
    ASSERT_EQ(result.fault_propagation.size(), 2);
    EXPECT_EQ(result.fault_propagation[1].source, "ci:B");
    EXPECT_EQ(result.fault_propagation[1].target, "ci:A");
    EXPECT_NEAR(result.fault_propagation[1].avg_lag_hours, 42.0, 1e-9);
}

TEST_F(IncidentCorrelationTest, MissingTimestampsIgnoredForPropagation) {
    incidents.push_back(incident("INC5", "D", "", "Web"));
    auto result = correlate_incidents(incidents, graph);
    EXPECT_EQ(result.fault_propagation.size(), 1);
    EXPECT_EQ(result.hotspots.size(), 4);
}

// ==========================================
// Hotspots
// ==========================================

TEST_F(IncidentCorrelationTest, HotspotsRankedByCount) {
    auto result = correlate_incidents(incidents, graph);
    ASSERT_EQ(result.hotspots.size(), 3);

    const auto& a = result.hotspots[0];
    EXPECT_EQ(a.ci, "ci:A");
    EXPECT_EQ(a.name, "A");
    EXPECT_EQ(a.incident_count, 2);
    EXPECT_DOUBLE_EQ(a.avg_priority, 1.5);
    EXPECT_NEAR(a.mtbf_hours, 48.0, 1e-9);

    EXPECT_EQ(result.hotspots[1].ci, "ci:B");
    EXPECT_DOUBLE_EQ(result.hotspots[1].mtbf_hours, 0.0);
    EXPECT_EQ(result.hotspots[2].ci, "ci:C");
}

TEST_F(IncidentCorrelationTest, UnknownCiFallsBackToUid) {
    incidents.push_back(incident("INC5", "Z", "2024-02-01T00:00:00Z"));
    auto result = correlate_incidents(incidents, graph);
    EXPECT_EQ(result.hotspots.back().name, "ci:Z");
}

// ==========================================
// Service Fingerprints
// ==========================================

TEST_F(IncidentCorrelationTest, FingerprintsPerService) {
    auto result = correlate_incidents(incidents, graph);
    ASSERT_EQ(result.service_fingerprints.size(), 2);

    const auto& web = result.service_fingerprints.at("service:Web");
    EXPECT_EQ(web.affected_cis, (std::vector<std::string>{"ci:A", "ci:B"}));
    EXPECT_EQ(web.incident_count, 3);
    EXPECT_EQ(web.pattern, "concentrated");
    // 4h and 2h; INC3 has no resolution
    EXPECT_NEAR(web.avg_resolution_hours, 3.0, 1e-9);

    const auto& db = result.service_fingerprints.at("service:DB");
    EXPECT_EQ(db.incident_count, 1);
    EXPECT_DOUBLE_EQ(db.avg_resolution_hours, 0.0);
}

TEST_F(IncidentCorrelationTest, DistributedPatternAboveCutoff) {
    auto result = correlate_incidents(incidents, graph, 24, 1);
    EXPECT_EQ(result.service_fingerprints.at("service:Web").pattern, "distributed");
    EXPECT_EQ(result.service_fingerprints.at("service:DB").pattern, "concentrated");
}

TEST_F(IncidentCorrelationTest, ResolutionBeforeCreationIgnored) {
    incidents = {incident("INC1", "A", "2024-01-02T00:00:00Z", "Web", 3, "2024-01-01T00:00:00Z")};
    auto result = correlate_incidents(incidents, graph);
    EXPECT_DOUBLE_EQ(result.service_fingerprints.at("service:Web").avg_resolution_hours, 0.0);
}

TEST_F(IncidentCorrelationTest, EmptyFeed) {
    auto result = correlate_incidents({}, graph);
    EXPECT_TRUE(result.fault_propagation.empty());
    EXPECT_TRUE(result.hotspots.empty());
    EXPECT_TRUE(result.service_fingerprints.empty());

    nlohmann::json j = result.to_json();
    EXPECT_TRUE(j["fault_propagation"].is_array());
    EXPECT_TRUE(j["hotspots"].is_array());
    EXPECT_TRUE(j["service_fingerprints"].is_object());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
