#pragma once

#include "graph/records.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace bsm {

/**
 * @brief Time-lagged change pattern between two CIs
 *
 * source < target by uid. direction is "A→B" when only source-then-target
 * lags were seen, "B→A" for the reverse, "bidirectional" for both.
 */
struct CascadePair {
    std::string source;
    std::string target;
    size_t count = 0;                                  // a_to_b + b_to_a
    size_t a_to_b = 0;
    size_t b_to_a = 0;
    double avg_lag_days = 0.0;
    std::string direction;

    nlohmann::json to_json() const;
};

struct VelocityProfile {
    std::vector<int> weeks;                            // Changes per bucket
    double avg = 0.0;
    int max = 0;
    std::string trend;                                 // increasing / decreasing / stable

    nlohmann::json to_json() const;
};

/**
 * @brief Count changes to one CI followed by changes to another within the window
 * @param changes Change list from build_change_list
 * @param window_days Maximum lag; lags must be strictly positive
 * @param top_n Pairs returned, ranked by merged count
 *
 * Changes without a timestamp are ignored.
 */
std::vector<CascadePair> temporal_cascades(
    const std::vector<ChangeSummary>& changes,
    int window_days = 7,
    size_t top_n = 30
);

/**
 * @brief Per-CI change counts in fixed-width buckets with a trend label
 *
 * Buckets span the observed timestamp range. Only CIs with two or more
 * timestamped changes are reported.
 */
std::map<std::string, VelocityProfile> change_velocity(
    const std::vector<ChangeSummary>& changes,
    int bucket_days = 7,
    double trend_threshold = 0.25
);

nlohmann::json velocity_to_json(const std::map<std::string, VelocityProfile>& velocity);

} // namespace bsm
