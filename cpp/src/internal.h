#pragma once
/// Internal helpers shared between histofy source files.
/// Not part of the public API.

#include "histofy/error.h"
#include "histofy/git.h"
#include "histofy/history.h"
#include "histofy/types.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct git_repository;
struct git_signature;

namespace Json { class Value; }

namespace histofy {

// ---------------------------------------------------------------------------
// LibGit2Inner: state shared by LibGit2Git and its rewrite sessions
// ---------------------------------------------------------------------------

struct LibGit2Inner {
    git_repository*       repo;      ///< Raw libgit2 handle (owned).
    std::filesystem::path workdir;
    std::filesystem::path gitdir;
    Signature             signature; ///< Fallback commit identity.

    LibGit2Inner(const LibGit2Inner&) = delete;
    LibGit2Inner& operator=(const LibGit2Inner&) = delete;

    LibGit2Inner(git_repository* r, std::filesystem::path wd,
                 std::filesystem::path gd, Signature sig);
    ~LibGit2Inner();
};

// ---------------------------------------------------------------------------
// dates: calendar arithmetic on POSIX epoch seconds
// ---------------------------------------------------------------------------

namespace dates {

struct CivilDate {
    int year  = 1970;
    int month = 1;
    int day   = 1;
};

struct ClockTime {
    int hour   = 0;
    int minute = 0;
};

/// Parse "YYYY-MM-DD". @throws ValidationError on bad format or date.
CivilDate parse_date(const std::string& s);

/// Parse "HH:MM" (24h). @throws ValidationError on bad format or range.
ClockTime parse_time(const std::string& s);

int64_t   days_from_civil(const CivilDate& d);
CivilDate civil_from_days(int64_t days);

/// Epoch seconds for a wall-clock date/time in a zone @p tz_offset minutes
/// east of UTC.
int64_t to_epoch(const CivilDate& d, const ClockTime& t, int tz_offset);

std::string format_date(int64_t epoch, int tz_offset);     ///< YYYY-MM-DD
std::string format_time(int64_t epoch, int tz_offset);     ///< HH:MM
std::string format_datetime(int64_t epoch, int tz_offset); ///< YYYY-MM-DD HH:MM:SS

/// "YYYY-MM-DDTHH:MM:SSZ".
std::string format_iso8601(int64_t epoch);
std::optional<int64_t> parse_iso8601(const std::string& s);

/// Current time in epoch seconds.
int64_t now();

} // namespace dates

// ---------------------------------------------------------------------------
// ids: identifiers for operations and backups
// ---------------------------------------------------------------------------

namespace ids {

/// "op_<epoch-ms>_<8 hex>".
std::string operation_id();

/// @p bytes random bytes as lowercase hex.
std::string random_hex(size_t bytes);

} // namespace ids

// ---------------------------------------------------------------------------
// tree: libgit2 object helpers
// ---------------------------------------------------------------------------

namespace tree {

/// Throw GitError for @p operation with libgit2's last error message.
[[noreturn]] void throw_git(const std::string& operation);

CommitInfo read_commit(git_repository* repo, const std::string& commit_hex);

/// Create a commit object without updating any ref.
std::string write_commit(git_repository* repo,
                         const std::string& tree_hex,
                         const std::vector<std::string>& parent_hexes,
                         const git_signature* author,
                         const git_signature* committer,
                         const std::string& message);

/// Changed paths between two trees (added, deleted, modified, type change).
std::vector<std::string> diff_paths(git_repository* repo,
                                    const std::string& tree_a_hex,
                                    const std::string& tree_b_hex);

/// Result of a three-way tree merge.
struct MergeResult {
    std::optional<std::string> tree_hex; ///< Set when conflict-free.
    std::vector<std::string>   conflicts;
};

/// Merge @p theirs_hex onto @p ours_hex with @p ancestor_hex as base.
/// With @p favor set, conflicting hunks take that side instead of
/// producing conflicts.
MergeResult merge_trees(git_repository* repo,
                        const std::string& ancestor_hex,
                        const std::string& ours_hex,
                        const std::string& theirs_hex,
                        std::optional<ConflictStrategy> favor);

} // namespace tree

// ---------------------------------------------------------------------------
// rewrite: libgit2 RewriteSession
// ---------------------------------------------------------------------------

namespace rewrite {

/// Validate @p plan against the current branch and prepare a session.
/// @throws GitError if HEAD is detached or a planned commit is not on the
///         first-parent line of HEAD.
std::unique_ptr<RewriteSession> start(std::shared_ptr<LibGit2Inner> inner,
                                      const MigrationPlan& plan);

} // namespace rewrite

// ---------------------------------------------------------------------------
// ledger: Operation <-> JSON
// ---------------------------------------------------------------------------

namespace ledger {

void to_json(const Operation& op, Json::Value& out);

/// @throws ConfigurationError on a malformed entry.
Operation from_json(const Json::Value& in);

bool matches(const Operation& op, const HistoryFilter& filter);
bool matches(const Operation& op, const ClearOptions& opts);

} // namespace ledger

} // namespace histofy
