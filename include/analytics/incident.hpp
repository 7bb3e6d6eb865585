#pragma once

#include "analytics/graph_utils.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace bsm {

// Incident on source followed by an incident on target within the window
struct FaultPropagation {
    std::string source;
    std::string target;
    size_t count = 0;
    double avg_lag_hours = 0.0;

    nlohmann::json to_json() const;
};

struct IncidentHotspot {
    std::string ci;
    std::string name;
    size_t incident_count = 0;
    double avg_priority = 4.0;
    double mtbf_hours = 0.0;                           // 0 with fewer than two timestamped incidents

    nlohmann::json to_json() const;
};

struct ServiceFingerprint {
    std::vector<std::string> affected_cis;
    std::string pattern;                               // "concentrated" or "distributed"
    double avg_resolution_hours = 0.0;
    size_t incident_count = 0;

    nlohmann::json to_json() const;
};

struct IncidentCorrelation {
    std::vector<FaultPropagation> fault_propagation;   // Descending by count
    std::vector<IncidentHotspot> hotspots;             // Descending by incident count
    std::map<std::string, ServiceFingerprint> service_fingerprints;  // keyed by service uid

    nlohmann::json to_json() const;
};

/**
 * @brief Relate the incident feed to the change graph
 * @param incidents Incident rows; affected CIs map to "ci:<id>", services to "service:<id>"
 * @param graph Supplies display names for hotspot CIs
 * @param window_hours Fault propagation window
 * @param concentrated_max Services touching at most this many CIs are "concentrated"
 *
 * Incidents without a parseable creation time are ignored for propagation
 * and MTBF. Resolution time only counts when both timestamps parse and the
 * resolution comes after creation.
 */
IncidentCorrelation correlate_incidents(
    const std::vector<IncidentRecord>& incidents,
    const Hypergraph& graph,
    int window_hours = 24,
    size_t concentrated_max = 3
);

} // namespace bsm
