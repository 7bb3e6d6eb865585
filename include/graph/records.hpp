#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bsm {

/**
 * @brief One row of the change/entity join feed
 *
 * Each row pairs a change request with one entity it touches. Rows sharing
 * a change_number collapse into a single hyperedge; rows sharing an
 * entity uid collapse into a single node.
 */
struct ChangeRecord {
    std::string change_number;
    std::string created_at;                            // ISO-8601
    std::string risk = "Low";
    std::string change_type = "Standard";
    std::string impact = "3 - Low";
    std::string region;
    std::string assignment_group;
    std::string business_service;

    std::string entity_id;
    std::string entity_type = "ci";
    std::string entity_class = "unknown";
    std::string entity_name;
    std::map<std::string, std::string> entity_attributes;

    // Anything that is not a group, service or change row is a configuration item
    bool is_ci() const {
        return entity_type != "group" && entity_type != "service" && entity_type != "change";
    }

    std::string entity_uid() const { return (is_ci() ? std::string("ci") : entity_type) + ":" + entity_id; }

    nlohmann::json to_json() const;
    static ChangeRecord from_json(const nlohmann::json& j);
};

struct ItemRef {
    std::string id;
    std::string name;
};

/**
 * @brief Incident row consumed by the incident correlation module
 */
struct IncidentRecord {
    std::string number;
    int priority = 4;                                  // 1 (critical) .. 4 (low)
    ItemRef affected_ci;
    ItemRef business_service;
    ItemRef assignment_group;
    std::string created_at;
    std::string resolved_at;

    nlohmann::json to_json() const;
    static IncidentRecord from_json(const nlohmann::json& j);
};

/**
 * @brief Complete input snapshot: change join rows plus the incident feed
 */
struct RecordSet {
    std::vector<ChangeRecord> change_records;
    std::vector<IncidentRecord> incidents;

    nlohmann::json to_json() const;
    static RecordSet from_json(const nlohmann::json& j);

    /**
     * @brief Load records from a JSON file
     * @throws std::runtime_error if the file cannot be opened
     */
    static RecordSet load_from_json(const std::string& path);
};

/**
 * @brief Per-change view with a parsed timestamp
 */
struct ChangeSummary {
    std::string number;
    int64_t created_at_ms = 0;
    std::string risk;
    std::string change_type;
    std::string impact;
    std::string region;
    std::string assignment_group;
    std::string business_service;
    std::vector<std::string> ci_uids;
};

/**
 * @brief Group change rows by change number, sorted ascending by creation time
 *
 * Only configuration-item rows contribute to ci_uids.
 */
std::vector<ChangeSummary> build_change_list(const std::vector<ChangeRecord>& records);

/**
 * @brief Parse an ISO-8601 or "YYYY-MM-DD HH:MM:SS" timestamp to UTC epoch ms
 * @return 0 when the string is empty or cannot be parsed, including
 *         calendar dates past the end of the month and leap seconds
 */
int64_t parse_timestamp(const std::string& text);

/**
 * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string utc_now_string();

/**
 * @brief Multiplier for a change risk level (Critical=4 .. Low/unknown=1)
 */
double risk_weight(const std::string& risk);

constexpr int64_t MS_PER_HOUR = 60LL * 60LL * 1000LL;
constexpr int64_t MS_PER_DAY = 24LL * MS_PER_HOUR;

} // namespace bsm
