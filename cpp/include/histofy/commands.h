#pragma once

/// @file commands.h
/// Units of work behind the commit, batch and migrate commands, plus their
/// dry-run previews. Each run_* function is meant to be passed to
/// OperationManager::execute().

#include "cancel.h"
#include "dry_run.h"
#include "error.h"
#include "git.h"
#include "migration.h"
#include "operation.h"
#include "planner.h"
#include "types.h"

#include <spdlog/logger.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

/// Unvalidated option strings as received from the command line.
struct RawCommandOptions {
    std::optional<std::string> date;
    std::optional<std::string> time;
    std::optional<std::string> author;        ///< "Name <email>".
    std::optional<std::string> auto_resolve;  ///< "ours" / "theirs".
    std::optional<std::string> remote;
    bool                       add_all     = false;
    bool                       push        = false;
    bool                       dry_run     = false;
    bool                       no_backup   = false;
    bool                       no_rollback = false;
};

/// Validated options shared by the commands.
struct CommandOptions {
    std::optional<std::string>      date;   ///< "YYYY-MM-DD".
    std::optional<std::string>      time;   ///< "HH:MM".
    int                             tz_offset = 0;
    bool                            add_all   = false;
    std::optional<Signature>        author;
    bool                            push      = false;
    std::string                     remote    = "origin";
    bool                            dry_run   = false;
    std::optional<ConflictStrategy> auto_resolve_strategy;
    bool                            create_backup       = true;
    bool                            rollback_on_failure = true;
};

/// Validate @p raw. An unrecognised auto-resolve value is logged as a
/// warning and ignored.
/// @throws ValidationError for a malformed date, time or author.
CommandOptions parse_command_options(const RawCommandOptions& raw,
                                     spdlog::logger& log);

/// Backoff for network operations (push).
struct RetryPolicy {
    int                       max_retries = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};
};

struct BatchOptions {
    bool                               continue_on_error = false;
    int                                tz_offset = 0;
    std::shared_ptr<CancellationToken> cancel;
};

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

/// Commit the index (after add-all when requested) with the requested date.
/// The date defaults to today and the time to 12:00. A failed push is
/// reported in the result payload and does not fail the commit.
/// @throws ValidationError for an empty message.
OperationOutcome run_commit(GitPrimitives& git, const std::string& message,
                            const CommandOptions& opts, spdlog::logger& log,
                            const RetryPolicy& retry = {});

/// One dated commit per entry, oldest first. All entries are validated
/// before the first commit is written.
/// @throws ValidationError for a malformed entry, GitError if a commit fails
///         and continue_on_error is false or nothing was committed.
OperationOutcome run_batch(GitPrimitives& git,
                           const std::vector<BatchCommitEntry>& entries,
                           const BatchOptions& opts, spdlog::logger& log);

/// Plan and run a migration. With `dry_run` the plan is only previewed.
/// @throws ValidationError for a bad request, CancellationError (with the
///         token's reason) if the migration was cancelled, MigrationError
///         for any other failure once the executor has settled the branch.
OperationOutcome run_migrate(MigrationExecutor& exec, const std::string& range,
                             const PlanRequest& req, const CommandOptions& opts,
                             const std::string& operation_id,
                             spdlog::logger& log,
                             ConflictHandler on_conflict = {},
                             ProgressCallback on_progress = {});

/// Set @p key in @p config, recording the previous value for undo.
OperationOutcome run_config_set(ConfigStore& config, const std::string& key,
                                const std::string& value, spdlog::logger& log);

// ---------------------------------------------------------------------------
// Previews
// ---------------------------------------------------------------------------

DryRunManager preview_commit(const std::string& message, const CommandOptions& opts);

DryRunManager preview_migration(MigrationExecutor& exec, const std::string& range,
                                const PlanRequest& req, const CommandOptions& opts);

DryRunManager preview_batch(const std::vector<BatchCommitEntry>& entries,
                            const BatchOptions& opts);

DryRunManager preview_config(const ConfigIntent& intent);

} // namespace histofy
