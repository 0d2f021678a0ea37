#pragma once

/// @file planner.h
/// Deterministic assignment of new timestamps to a range of commits.

#include "error.h"
#include "types.h"

#include <string>
#include <vector>

namespace histofy {

/// Inputs for plan_migration().
struct PlanRequest {
    std::string target_date;              ///< First day, "YYYY-MM-DD".
    int         spread_days    = 1;       ///< Days to spread over, 1..365.
    std::string start_time     = "09:00"; ///< First commit of each day, "HH:MM".
    int         tz_offset      = 0;       ///< Minutes east of UTC.
    bool        preserve_order = true;
};

namespace planner {

/// Minutes between consecutive commits placed on the same day.
constexpr int kMinuteIncrement = 1;

constexpr int kMaxSpreadDays = 365;

/// Check the request fields without looking at any commits.
/// @throws ValidationError naming the offending field.
void validate(const PlanRequest& req);

/// Assign timestamps to @p commits (oldest first).
///
/// Commits fill days in order: each of the first ceil(N / spread_days) days
/// receives that many commits, starting at start_time and spaced
/// kMinuteIncrement minutes apart. The same inputs always produce the same
/// plan.
///
/// @throws ValidationError if @p commits is empty, contains a hash twice,
///         or the request is invalid.
MigrationPlan plan_migration(const std::vector<CommitInfo>& commits,
                             const PlanRequest& req);

} // namespace planner
} // namespace histofy
