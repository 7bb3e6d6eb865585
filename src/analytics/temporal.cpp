#include "analytics/temporal.hpp"
#include "analytics/graph_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace bsm {

namespace {

// CI uid -> timestamps of its changes, CIs in first-seen order
struct Timeline {
    std::vector<std::string> uids;
    std::unordered_map<std::string, std::vector<int64_t>> times;
};

Timeline build_timeline(const std::vector<ChangeSummary>& changes) {
    Timeline timeline;
    for (const auto& chg : changes) {
        for (const auto& uid : chg.ci_uids) {
            auto it = timeline.times.find(uid);
            if (it == timeline.times.end()) {
                timeline.uids.push_back(uid);
                it = timeline.times.emplace(uid, std::vector<int64_t>{}).first;
            }
            it->second.push_back(chg.created_at_ms);
        }
    }
    for (auto& [uid, list] : timeline.times) {
        std::sort(list.begin(), list.end());
    }
    return timeline;
}

} // namespace

nlohmann::json CascadePair::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["count"] = count;
    j["a_to_b"] = a_to_b;
    j["b_to_a"] = b_to_a;
    j["avg_lag_days"] = avg_lag_days;
    j["direction"] = direction;
    return j;
}

nlohmann::json VelocityProfile::to_json() const {
    nlohmann::json j;
    j["weeks"] = weeks;
    j["avg"] = avg;
    j["max"] = max;
    j["trend"] = trend;
    return j;
}

nlohmann::json velocity_to_json(const std::map<std::string, VelocityProfile>& velocity) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [uid, profile] : velocity) {
        j[uid] = profile.to_json();
    }
    return j;
}

// ==========================================
// Cascades
// ==========================================

std::vector<CascadePair> temporal_cascades(const std::vector<ChangeSummary>& changes, int window_days, size_t top_n) {
    std::vector<CascadePair> results;
    const int64_t window_ms = static_cast<int64_t>(window_days) * MS_PER_DAY;
    Timeline timeline = build_timeline(changes);

    std::unordered_map<std::string, size_t> pair_index;
    std::vector<double> total_lag;

    for (const auto& uid_a : timeline.uids) {
        const auto& times_a = timeline.times.at(uid_a);
        for (const auto& uid_b : timeline.uids) {
            if (uid_a == uid_b) continue;
            const auto& times_b = timeline.times.at(uid_b);

            size_t count = 0;
            double lag_sum = 0.0;
            for (int64_t ta : times_a) {
                if (ta == 0) continue;
                for (int64_t tb : times_b) {
                    if (tb == 0) continue;
                    int64_t lag = tb - ta;
                    if (lag > 0 && lag <= window_ms) {
                        count++;
                        lag_sum += static_cast<double>(lag);
                    }
                }
            }
            if (count == 0) continue;

            std::string key = pair_key(uid_a, uid_b);
            auto it = pair_index.find(key);
            if (it == pair_index.end()) {
                CascadePair pair;
                pair.source = std::min(uid_a, uid_b);
                pair.target = std::max(uid_a, uid_b);
                it = pair_index.emplace(key, results.size()).first;
                results.push_back(std::move(pair));
                total_lag.push_back(0.0);
            }

            auto& pair = results[it->second];
            if (uid_a < uid_b) {
                pair.a_to_b += count;
            } else {
                pair.b_to_a += count;
            }
            total_lag[it->second] += lag_sum;
        }
    }

    for (size_t i = 0; i < results.size(); ++i) {
        auto& pair = results[i];
        pair.count = pair.a_to_b + pair.b_to_a;
        pair.avg_lag_days = total_lag[i] / pair.count / static_cast<double>(MS_PER_DAY);
        if (pair.a_to_b > 0 && pair.b_to_a > 0) {
            pair.direction = "bidirectional";
        } else if (pair.a_to_b > 0) {
            pair.direction = "A→B";
        } else {
            pair.direction = "B→A";
        }
    }

    std::stable_sort(results.begin(), results.end(),
        [](const CascadePair& x, const CascadePair& y) { return x.count > y.count; });

    if (results.size() > top_n) {
        results.resize(top_n);
    }
    return results;
}

// ==========================================
// Velocity
// ==========================================

std::map<std::string, VelocityProfile> change_velocity(const std::vector<ChangeSummary>& changes,
                                                       int bucket_days, double trend_threshold) {
    std::map<std::string, VelocityProfile> result;
    if (changes.empty() || bucket_days <= 0) {
        return result;
    }

    int64_t min_time = std::numeric_limits<int64_t>::max();
    int64_t max_time = 0;
    for (const auto& chg : changes) {
        if (chg.created_at_ms > 0) {
            min_time = std::min(min_time, chg.created_at_ms);
            max_time = std::max(max_time, chg.created_at_ms);
        }
    }
    if (max_time == 0) {
        return result;
    }

    const int64_t bucket_ms = static_cast<int64_t>(bucket_days) * MS_PER_DAY;
    int64_t total_weeks = (max_time - min_time + bucket_ms - 1) / bucket_ms;
    if (total_weeks < 1) total_weeks = 1;

    std::unordered_map<std::string, std::vector<int>> ci_weeks;
    for (const auto& chg : changes) {
        if (chg.created_at_ms == 0) continue;
        size_t week = static_cast<size_t>(std::min((chg.created_at_ms - min_time) / bucket_ms, total_weeks - 1));
        for (const auto& uid : chg.ci_uids) {
            auto& weeks = ci_weeks[uid];
            if (weeks.empty()) weeks.assign(static_cast<size_t>(total_weeks), 0);
            weeks[week]++;
        }
    }

    for (auto& [uid, weeks] : ci_weeks) {
        int total = 0;
        int max_count = 0;
        for (int c : weeks) {
            total += c;
            max_count = std::max(max_count, c);
        }
        if (total < 2) continue;

        VelocityProfile profile;
        profile.avg = static_cast<double>(total) / weeks.size();
        profile.max = max_count;
        profile.trend = "stable";

        size_t half = weeks.size() / 2;
        if (half > 0) {
            double first = 0.0;
            double second = 0.0;
            for (size_t w = 0; w < half; ++w) first += weeks[w];
            for (size_t w = half; w < weeks.size(); ++w) second += weeks[w];
            first /= half;
            second /= (weeks.size() - half);

            double change = (second - first) / std::max(first, 0.1);
            if (change > trend_threshold) {
                profile.trend = "increasing";
            } else if (change < -trend_threshold) {
                profile.trend = "decreasing";
            }
        }

        profile.weeks = std::move(weeks);
        result[uid] = std::move(profile);
    }

    return result;
}

} // namespace bsm
