#include "histofy/planner.h"
#include "internal.h"

#include <set>
#include <string>

namespace histofy {
namespace planner {

void validate(const PlanRequest& req) {
    dates::parse_date(req.target_date);
    dates::parse_time(req.start_time);
    if (req.spread_days < 1 || req.spread_days > kMaxSpreadDays) {
        throw ValidationError("spread days must be between 1 and " +
                                  std::to_string(kMaxSpreadDays) + ", got " +
                                  std::to_string(req.spread_days),
                              "spread", "pass --spread with a whole number of days");
    }
    if (req.tz_offset < -14 * 60 || req.tz_offset > 14 * 60) {
        throw ValidationError("timezone offset out of range: " +
                                  std::to_string(req.tz_offset) + " minutes",
                              "tz_offset");
    }
}

MigrationPlan plan_migration(const std::vector<CommitInfo>& commits,
                             const PlanRequest& req) {
    validate(req);
    if (commits.empty()) {
        throw ValidationError("no commits found in the specified range",
                              "commit_range",
                              "verify the range exists and contains commits");
    }

    std::set<std::string> seen;
    for (const auto& c : commits) {
        if (!seen.insert(c.hash).second)
            throw ValidationError("commit " + c.hash + " appears twice in range",
                                  "commit_range");
    }

    MigrationPlan plan;
    plan.target_date = req.target_date;
    plan.spread_days = req.spread_days;
    plan.start_time  = req.start_time;
    plan.tz_offset   = req.tz_offset;

    const auto first_day = dates::parse_date(req.target_date);
    const auto start     = dates::parse_time(req.start_time);
    const int64_t day0   = dates::to_epoch(first_day, start, req.tz_offset);

    const size_t n       = commits.size();
    const size_t spread  = static_cast<size_t>(req.spread_days);
    const size_t per_day = (n + spread - 1) / spread;

    if (spread > n) {
        plan.warnings.push_back("spread exceeds commit count: " +
                                std::to_string(spread - n) +
                                " trailing day(s) left unused");
    }

    const int start_minute = start.hour * 60 + start.minute;
    const int64_t last_minute =
        start_minute + static_cast<int64_t>(per_day - 1) * kMinuteIncrement;
    if (last_minute >= 24 * 60) {
        plan.warnings.push_back("commits per day overflow past midnight; "
                                "timestamps continue into the following day");
    }

    if (!req.preserve_order) {
        plan.warnings.push_back("disabling order preservation is not supported; "
                                "original commit order kept");
    }

    plan.commits.reserve(n);
    int64_t prev_ts = 0;
    for (size_t i = 0; i < n; ++i) {
        const auto& c = commits[i];
        const int64_t day  = static_cast<int64_t>(i / per_day);
        const int64_t slot = static_cast<int64_t>(i % per_day);
        int64_t ts = day0 + day * 86400 + slot * kMinuteIncrement * 60;
        // Overflowing days must not collide with the next day's first slot.
        if (i > 0 && ts <= prev_ts) ts = prev_ts + kMinuteIncrement * 60;
        prev_ts = ts;

        CommitMigration m;
        m.original_hash = c.hash;
        m.original_date = dates::format_datetime(c.author_time, c.author_offset);
        m.new_timestamp = ts;
        m.tz_offset     = req.tz_offset;
        m.new_date      = dates::format_date(ts, req.tz_offset);
        m.new_time      = dates::format_time(ts, req.tz_offset);
        m.author        = c.author_name;
        m.message       = c.message;
        plan.commits.push_back(std::move(m));
    }
    return plan;
}

} // namespace planner
} // namespace histofy
