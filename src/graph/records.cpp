#include "graph/records.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace bsm {

namespace {

// Read a string field, tolerating nulls and non-string scalars
std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (it->is_string()) {
        std::string value = it->get<std::string>();
        return value.empty() ? fallback : value;
    }
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    if (it->is_number()) return std::to_string(it->get<double>());
    return fallback;
}

ItemRef ref_field(const nlohmann::json& j, const char* key) {
    ItemRef ref;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return ref;
    if (it->is_object()) {
        ref.id = string_field(*it, "id");
        ref.name = string_field(*it, "name");
    } else if (it->is_string()) {
        ref.id = it->get<std::string>();
        ref.name = ref.id;
    }
    return ref;
}

nlohmann::json ref_to_json(const ItemRef& ref) {
    return {{"id", ref.id}, {"name", ref.name}};
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int days_in_month(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : lengths[month - 1];
}

} // namespace

// ==========================================
// ChangeRecord
// ==========================================

nlohmann::json ChangeRecord::to_json() const {
    nlohmann::json j;
    j["changeNumber"] = change_number;
    j["createdAt"] = created_at;
    j["risk"] = risk;
    j["changeType"] = change_type;
    j["impact"] = impact;
    j["region"] = region;
    j["assignmentGroup"] = assignment_group;
    j["businessService"] = business_service;
    j["entityId"] = entity_id;
    j["entityType"] = entity_type;
    j["entityClass"] = entity_class;
    j["entityName"] = entity_name;
    if (!entity_attributes.empty()) {
        j["entityAttributes"] = entity_attributes;
    }
    return j;
}

ChangeRecord ChangeRecord::from_json(const nlohmann::json& j) {
    ChangeRecord rec;
    rec.change_number = string_field(j, "changeNumber");
    rec.created_at = string_field(j, "createdAt");
    rec.risk = string_field(j, "risk", "Low");
    rec.change_type = string_field(j, "changeType", "Standard");
    rec.impact = string_field(j, "impact", "3 - Low");
    rec.region = string_field(j, "region");
    rec.assignment_group = string_field(j, "assignmentGroup");
    rec.business_service = string_field(j, "businessService");
    rec.entity_id = string_field(j, "entityId");
    rec.entity_type = string_field(j, "entityType", "ci");
    rec.entity_class = string_field(j, "entityClass", "unknown");
    rec.entity_name = string_field(j, "entityName", rec.entity_id);

    auto attrs = j.find("entityAttributes");
    if (attrs != j.end() && attrs->is_object()) {
        for (auto it = attrs->begin(); it != attrs->end(); ++it) {
            if (it->is_string()) {
                rec.entity_attributes[it.key()] = it->get<std::string>();
            }
        }
    }
    return rec;
}

// ==========================================
// IncidentRecord
// ==========================================

nlohmann::json IncidentRecord::to_json() const {
    nlohmann::json j;
    j["number"] = number;
    j["priority"] = priority;
    j["affectedCI"] = ref_to_json(affected_ci);
    j["businessService"] = ref_to_json(business_service);
    j["assignmentGroup"] = ref_to_json(assignment_group);
    j["createdAt"] = created_at;
    j["resolvedAt"] = resolved_at;
    return j;
}

IncidentRecord IncidentRecord::from_json(const nlohmann::json& j) {
    IncidentRecord inc;
    inc.number = string_field(j, "number");
    auto prio = j.find("priority");
    if (prio != j.end() && prio->is_number_integer()) {
        inc.priority = prio->get<int>();
    } else if (prio != j.end() && prio->is_string()) {
        // ServiceNow display values look like "2 - High"
        const std::string& text = prio->get_ref<const std::string&>();
        if (!text.empty() && text[0] >= '1' && text[0] <= '4') {
            inc.priority = text[0] - '0';
        }
    }
    if (inc.priority < 1 || inc.priority > 4) inc.priority = 4;
    inc.affected_ci = ref_field(j, "affectedCI");
    inc.business_service = ref_field(j, "businessService");
    inc.assignment_group = ref_field(j, "assignmentGroup");
    inc.created_at = string_field(j, "createdAt");
    inc.resolved_at = string_field(j, "resolvedAt");
    return inc;
}

// ==========================================
// RecordSet
// ==========================================

nlohmann::json RecordSet::to_json() const {
    nlohmann::json j;
    nlohmann::json changes = nlohmann::json::array();
    for (const auto& rec : change_records) {
        changes.push_back(rec.to_json());
    }
    nlohmann::json incs = nlohmann::json::array();
    for (const auto& inc : incidents) {
        incs.push_back(inc.to_json());
    }
    j["changeRecords"] = changes;
    j["incidents"] = incs;
    return j;
}

RecordSet RecordSet::from_json(const nlohmann::json& j) {
    RecordSet set;

    const nlohmann::json* changes = nullptr;
    if (j.is_array()) {
        changes = &j;
    } else if (j.contains("changeRecords")) {
        changes = &j["changeRecords"];
    }

    if (changes && changes->is_array()) {
        for (const auto& row : *changes) {
            if (!row.is_object()) continue;
            auto rec = ChangeRecord::from_json(row);
            if (rec.change_number.empty() || rec.entity_id.empty()) continue;
            set.change_records.push_back(std::move(rec));
        }
    }

    if (j.is_object() && j.contains("incidents")) {
        const auto& incs = j["incidents"];
        if (incs.is_array()) {
            for (const auto& row : incs) {
                if (row.is_object()) set.incidents.push_back(IncidentRecord::from_json(row));
            }
        } else if (incs.is_object()) {
            // Keyed by incident number
            for (auto it = incs.begin(); it != incs.end(); ++it) {
                if (it->is_object()) set.incidents.push_back(IncidentRecord::from_json(*it));
            }
        }
    }

    return set;
}

RecordSet RecordSet::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open records file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return from_json(j);
}

// ==========================================
// Change list
// ==========================================

std::vector<ChangeSummary> build_change_list(const std::vector<ChangeRecord>& records) {
    std::vector<ChangeSummary> list;
    std::unordered_map<std::string, size_t> by_number;

    for (const auto& rec : records) {
        auto it = by_number.find(rec.change_number);
        if (it == by_number.end()) {
            ChangeSummary chg;
            chg.number = rec.change_number;
            chg.created_at_ms = parse_timestamp(rec.created_at);
            chg.risk = rec.risk;
            chg.change_type = rec.change_type;
            chg.impact = rec.impact;
            chg.region = rec.region;
            chg.assignment_group = rec.assignment_group;
            chg.business_service = rec.business_service;
            it = by_number.emplace(rec.change_number, list.size()).first;
            list.push_back(std::move(chg));
        }
        if (rec.is_ci()) {
            auto& uids = list[it->second].ci_uids;
            std::string uid = rec.entity_uid();
            if (std::find(uids.begin(), uids.end(), uid) == uids.end()) {
                uids.push_back(std::move(uid));
            }
        }
    }

    std::stable_sort(list.begin(), list.end(),
        [](const ChangeSummary& a, const ChangeSummary& b) { return a.created_at_ms < b.created_at_ms; });
    return list;
}

// ==========================================
// Helpers
// ==========================================

int64_t parse_timestamp(const std::string& text) {
    if (text.size() < 10) return 0;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 || consumed != 10) {
        return 0;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) return 0;

    size_t pos = 10;
    int64_t millis = 0;
    int64_t offset_minutes = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        int time_consumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &time_consumed) != 3 ||
            time_consumed != 8) {
            return 0;
        }
        if (hour > 23 || minute > 59 || second > 59) return 0;
        pos += 9;

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 3) millis = millis * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits) millis *= 10;
        }

        if (pos < text.size()) {
            char tz = text[pos];
            if (tz == 'Z' || tz == 'z') {
                ++pos;
            } else if (tz == '+' || tz == '-') {
                int oh = 0, om = 0;
                if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return 0;
                offset_minutes = (tz == '+' ? 1 : -1) * (oh * 60 + om);
                pos += 6;
            }
        }
    }

    if (pos != text.size()) return 0;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    int64_t ms = seconds * 1000 + millis;
    return ms > 0 ? ms : 0;
}

std::string utc_now_string() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

double risk_weight(const std::string& risk) {
    if (risk == "Critical") return 4.0;
    if (risk == "High") return 3.0;
    if (risk == "Medium") return 2.0;
    return 1.0;
}

} // namespace bsm
