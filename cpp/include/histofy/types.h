#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// OperationType / OperationStatus
// ---------------------------------------------------------------------------

/// Kind of user-invoked unit of work tracked by the ledger.
enum class OperationType : uint8_t {
    Commit,
    Migrate,
    Config,
    Batch,
    Status,
};

const char* to_string(OperationType type);
std::optional<OperationType> parse_operation_type(const std::string& s);

/// True for operation types that write to the repository and therefore need
/// a Snapshot and the repository lock.
inline bool is_mutating(OperationType type) {
    return type == OperationType::Commit || type == OperationType::Migrate ||
           type == OperationType::Batch;
}

/// Lifecycle state of an Operation.
enum class OperationStatus : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Undone,
};

const char* to_string(OperationStatus status);
std::optional<OperationStatus> parse_operation_status(const std::string& s);

// ---------------------------------------------------------------------------
// Signature
// ---------------------------------------------------------------------------

/// Author identity used for commits.
struct Signature {
    std::string name;
    std::string email;
};

/// Parse "Name <email>" (email optional).
Signature parse_author(const std::string& author);

// ---------------------------------------------------------------------------
// Repository state
// ---------------------------------------------------------------------------

/// Working tree / index state as reported by GitPrimitives::status().
struct RepoStatus {
    std::optional<std::string> branch; ///< nullopt when HEAD is detached.
    std::optional<std::string> head;   ///< nullopt on an unborn branch.
    std::vector<std::string>   staged;
    std::vector<std::string>   modified;
    std::vector<std::string>   untracked;
    std::vector<std::string>   conflicted;

    bool clean() const {
        return staged.empty() && modified.empty() && untracked.empty() &&
               conflicted.empty();
    }
};

/// A single commit as read from the repository.
struct CommitInfo {
    std::string              hash;
    std::string              tree;
    std::vector<std::string> parents;
    std::string              message;
    std::string              author_name;
    std::string              author_email;
    int64_t                  author_time    = 0; ///< POSIX epoch seconds.
    int                      author_offset  = 0; ///< Minutes east of UTC.
    int64_t                  committer_time = 0;
};

/// Parameters for GitPrimitives::commit_with_date().
struct CommitSpec {
    std::string              message;
    int64_t                  timestamp  = 0; ///< POSIX epoch seconds.
    int                      tz_offset  = 0; ///< Minutes east of UTC.
    std::optional<Signature> author;         ///< Defaults to repo identity.
    bool                     allow_empty = false;
};

/// One entry of a batch commit request.
struct BatchCommitEntry {
    std::string                message;
    std::string                date;            ///< "YYYY-MM-DD".
    std::string                time = "12:00";  ///< "HH:MM".
    std::optional<std::string> author;          ///< "Name <email>".
};

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

/// Minimal repository state captured before a mutating operation.
struct Snapshot {
    std::filesystem::path      repo_path;
    std::string                head_commit;
    std::optional<std::string> branch;
    std::optional<std::string> backup_branch;
    int64_t                    created_at = 0;
};

// ---------------------------------------------------------------------------
// Operation
// ---------------------------------------------------------------------------

/// Data needed to invert an operation.
struct UndoData {
    std::optional<std::string> commit_hash;     ///< Last commit created.
    std::optional<std::string> parent_hash;     ///< Reset target for commit/batch.
    std::vector<std::string>   created_commits; ///< Batch commits, oldest first.
    std::optional<std::string> head_after;      ///< HEAD after a migration.
    std::optional<std::string> config_key;
    std::optional<std::string> previous_value;  ///< nullopt: key did not exist.
};

/// One user-invoked unit of work as recorded in the ledger.
struct Operation {
    std::string                        id;
    OperationType                      type = OperationType::Status;
    std::string                        command;
    std::map<std::string, std::string> args;
    int64_t                            started_at = 0;
    std::optional<int64_t>             completed_at;
    OperationStatus                    status   = OperationStatus::Pending;
    bool                               undoable = false;
    std::string                        description;
    std::optional<Snapshot>            snapshot;
    std::map<std::string, std::string> result;
    std::optional<std::string>         error;
    std::optional<std::string>         backup_branch;
    UndoData                           undo;
    std::optional<int64_t>             undone_at;
    bool                               forced_undo = false;
};

// ---------------------------------------------------------------------------
// Migration plan
// ---------------------------------------------------------------------------

/// One commit's new timestamp. Immutable once planned.
struct CommitMigration {
    std::string original_hash;
    std::string original_date; ///< "YYYY-MM-DD HH:MM:SS" in the author's zone.
    std::string new_date;      ///< "YYYY-MM-DD".
    std::string new_time;      ///< "HH:MM".
    int64_t     new_timestamp = 0;
    int         tz_offset     = 0; ///< Minutes east of UTC.
    std::string author;
    std::string message;

    bool operator==(const CommitMigration& o) const {
        return original_hash == o.original_hash &&
               original_date == o.original_date && new_date == o.new_date &&
               new_time == o.new_time && new_timestamp == o.new_timestamp &&
               tz_offset == o.tz_offset && author == o.author &&
               message == o.message;
    }
};

/// Ordered assignment of new timestamps to a range of commits.
struct MigrationPlan {
    std::string                  strategy = "interactive-rebase";
    std::string                  target_date;
    int                          spread_days = 1;
    std::string                  start_time;
    int                          tz_offset   = 0;
    std::vector<CommitMigration> commits;
    std::vector<std::string>     warnings;

    bool operator==(const MigrationPlan& o) const {
        return strategy == o.strategy && target_date == o.target_date &&
               spread_days == o.spread_days && start_time == o.start_time &&
               tz_offset == o.tz_offset && commits == o.commits &&
               warnings == o.warnings;
    }
};

// ---------------------------------------------------------------------------
// Conflict resolution
// ---------------------------------------------------------------------------

/// Automatic rebase conflict resolution policy.
enum class ConflictStrategy : uint8_t {
    Ours,
    Theirs,
};

const char* to_string(ConflictStrategy s);

/// Parse "ours" / "theirs". Returns nullopt for anything else.
std::optional<ConflictStrategy> parse_conflict_strategy(const std::string& s);

} // namespace histofy
