#pragma once

/// @file migration.h
/// Conflict-aware commit-date rewrite with backup, rollback and integrity
/// validation.

#include "cancel.h"
#include "error.h"
#include "git.h"
#include "planner.h"
#include "types.h"

#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

/// Executor state. Completed, Aborted, RolledBack and RollbackFailed are
/// terminal.
enum class MigrationState : uint8_t {
    Planning,
    BackupCreated,
    Rewriting,
    Conflict,
    Validating,
    Completed,
    Aborted,
    RolledBack,
    RollbackFailed,
};

const char* to_string(MigrationState s);

inline bool is_terminal(MigrationState s) {
    return s == MigrationState::Completed || s == MigrationState::Aborted ||
           s == MigrationState::RolledBack || s == MigrationState::RollbackFailed;
}

/// A migration that ended in a failed terminal state. The executor has
/// already put the repository where that state says (rolled back, left
/// untouched, or left as the failure found it when rollback was disabled),
/// so callers must not reset it again.
class MigrationError : public GitError {
public:
    MigrationError(const std::string& msg, MigrationState state,
                   std::optional<std::string> backup_branch = std::nullopt)
        : GitError("migrate", msg), state_(state),
          backup_branch_(std::move(backup_branch)) {}
    MigrationState state() const { return state_; }
    const std::optional<std::string>& backup_branch() const { return backup_branch_; }
private:
    MigrationState             state_;
    std::optional<std::string> backup_branch_;
};

// ---------------------------------------------------------------------------
// Options and callbacks
// ---------------------------------------------------------------------------

/// What a conflict handler wants done with a conflicted step.
enum class ConflictAction : uint8_t {
    Abort,     ///< Stop; the branch is left untouched.
    UseOurs,   ///< Continue, favouring the rewritten history.
    UseTheirs, ///< Continue, favouring the commit being replayed.
};

struct ConflictInfo {
    std::string              original_hash;
    std::vector<std::string> paths;
    size_t                   step_index = 0;
};

using ConflictHandler  = std::function<ConflictAction(const ConflictInfo&)>;

/// Progress callback: message plus a percentage when one is known.
using ProgressCallback =
    std::function<void(const std::string& message, std::optional<int> percent)>;

struct ExecuteOptions {
    std::string                     operation_id;  ///< Empty: generate one.
    bool                            create_backup       = true;
    bool                            rollback_on_failure = true;
    std::optional<ConflictStrategy> auto_resolve;  ///< Wins over on_conflict.
    ConflictHandler                 on_conflict;
    ProgressCallback                on_progress;
};

struct MigrationResult {
    bool                       success = false;
    MigrationState             state   = MigrationState::Planning;
    size_t                     migrated_count = 0;
    std::optional<std::string> backup_branch;
    bool                       conflicts_encountered = false;
    bool                       aborted         = false;
    bool                       rolled_back     = false;
    bool                       rollback_failed = false;
    bool                       cancelled       = false;
    std::optional<CancelReason> cancel_reason;
    std::optional<std::string> error;
    ErrorKind                  error_kind = ErrorKind::None;
    std::vector<std::string>   integrity_warnings;
    std::optional<std::string> original_head;
    std::optional<std::string> new_head;
    std::vector<std::pair<std::string, std::string>> rewritten;
    std::vector<MigrationState> transitions; ///< Every state entered, in order.
};

// ---------------------------------------------------------------------------
// MigrationExecutor
// ---------------------------------------------------------------------------

/// Drives a MigrationPlan through backup, rewrite, conflict handling and
/// validation.
///
/// Usage:
/// @code
///     histofy::MigrationExecutor exec(git, logger);
///     auto plan   = exec.plan("HEAD~3..HEAD", {"2023-06-15"});
///     auto result = exec.execute(plan);
/// @endcode
class MigrationExecutor {
public:
    static constexpr const char* kBackupPrefix = "histofy-backup-";

    MigrationExecutor(std::shared_ptr<GitPrimitives> git,
                      std::shared_ptr<spdlog::logger> logger = {},
                      std::shared_ptr<CancellationToken> cancel = {});

    /// Resolve @p range and plan it.
    /// @throws ValidationError for a bad request or an empty range.
    MigrationPlan plan(const std::string& range, const PlanRequest& req);

    /// Run @p plan. Never throws for repository or rewrite failures; they
    /// are reported in the result.
    MigrationResult execute(const MigrationPlan& plan,
                            const ExecuteOptions& opts = {});

    /// Backup branches, sorted by name.
    std::vector<std::string> list_backups();

    /// Delete all but the @p keep most recent backup branches.
    /// @return Names of the deleted branches.
    std::vector<std::string> prune_backups(size_t keep);

    /// "histofy-backup-<op_id>-<epoch>".
    static std::string backup_branch_name(const std::string& op_id, int64_t epoch);

private:
    std::string create_backup(const std::string& op_id, const std::string& head);
    void rollback(MigrationResult& r, const std::exception& cause);
    void enter(MigrationResult& r, MigrationState s);

    std::shared_ptr<GitPrimitives>     git_;
    std::shared_ptr<spdlog::logger>    log_;
    std::shared_ptr<CancellationToken> cancel_;
};

} // namespace histofy
