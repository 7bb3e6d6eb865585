#pragma once

#include "graph/records.hpp"
#include <string>
#include <vector>

namespace bsm {
namespace fixtures {

// One change/CI join row
inline ChangeRecord ci_row(const std::string& change, const std::string& ci,
                           const std::string& created_at = "",
                           const std::string& cls = "server",
                           const std::string& service = "",
                           const std::string& group = "") {
    ChangeRecord rec;
    rec.change_number = change;
    rec.entity_id = ci;
    rec.entity_class = cls;
    rec.created_at = created_at;
    rec.business_service = service;
    rec.assignment_group = group;
    return rec;
}

inline IncidentRecord incident(const std::string& number, const std::string& ci,
                               const std::string& created_at,
                               const std::string& service = "",
                               int priority = 3,
                               const std::string& resolved_at = "") {
    IncidentRecord inc;
    inc.number = number;
    inc.priority = priority;
    inc.affected_ci = {ci, ci};
    inc.business_service = {service, service};
    inc.created_at = created_at;
    inc.resolved_at = resolved_at;
    return inc;
}

// e1:[A,B], e2:[A,B], e3:[A,C]
inline std::vector<ChangeRecord> triangle_rows() {
    return {
        ci_row("CHG1", "A", "2024-01-01T00:00:00Z"),
        ci_row("CHG1", "B", "2024-01-01T00:00:00Z"),
        ci_row("CHG2", "A", "2024-01-05T00:00:00Z"),
        ci_row("CHG2", "B", "2024-01-05T00:00:00Z"),
        ci_row("CHG3", "A", "2024-01-10T00:00:00Z"),
        ci_row("CHG3", "C", "2024-01-10T00:00:00Z"),
    };
}

// Two dense CI groups joined by a single change through X
inline std::vector<ChangeRecord> two_cluster_rows() {
    std::vector<ChangeRecord> rows;
    const std::vector<std::string> left = {"L1", "L2", "L3"};
    const std::vector<std::string> right = {"R1", "R2", "R3"};

    for (int i = 0; i < 3; ++i) {
        std::string chg = "CHGL" + std::to_string(i);
        for (const auto& ci : left) rows.push_back(ci_row(chg, ci, "", "server", "Billing", "Ops"));
    }
    for (int i = 0; i < 3; ++i) {
        std::string chg = "CHGR" + std::to_string(i);
        for (const auto& ci : right) rows.push_back(ci_row(chg, ci, "", "database", "Payroll", "DBA"));
    }
    rows.push_back(ci_row("CHGX1", "L1", "", "server", "Billing", "Ops"));
    rows.push_back(ci_row("CHGX1", "X", "", "router", "Billing", "Ops"));
    rows.push_back(ci_row("CHGX2", "X", "", "router", "Payroll", "DBA"));
    rows.push_back(ci_row("CHGX2", "R1", "", "database", "Payroll", "DBA"));
    return rows;
}

} // namespace fixtures
} // namespace bsm
