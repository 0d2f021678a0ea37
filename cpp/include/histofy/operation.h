#pragma once

/// @file operation.h
/// Invocation context and the snapshot / execute / restore transaction
/// wrapped around every command.

#include "cancel.h"
#include "error.h"
#include "git.h"
#include "history.h"
#include "types.h"

#include <spdlog/logger.h>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace histofy {

// ---------------------------------------------------------------------------
// Context
// ---------------------------------------------------------------------------

/// Options for Context::open().
struct ContextOptions {
    /// Ledger and lock directory. Default: `<gitdir>/histofy`.
    std::optional<std::filesystem::path> history_dir;
    size_t                               max_history_entries = 100;
    std::shared_ptr<spdlog::logger>      logger;  ///< Default: null logger.
    std::shared_ptr<ConfigStore>         config;
};

/// Everything one invocation needs, passed explicitly to each component.
struct Context {
    std::filesystem::path              repo_path;
    std::shared_ptr<GitPrimitives>     git;
    std::shared_ptr<HistoryStore>      history;
    std::shared_ptr<spdlog::logger>    logger;
    std::filesystem::path              lock_dir;
    std::shared_ptr<CancellationToken> cancel;
    std::shared_ptr<ConfigStore>       config;

    /// Open the repository at @p repo_path with the libgit2 backend and a
    /// JSON ledger.
    /// @throws ConfigurationError if @p repo_path is not a repository.
    static Context open(const std::filesystem::path& repo_path,
                        const ContextOptions& opts = {});

    /// Ledger front-end sharing this context's store, git and lock.
    OperationHistory operation_history() const;
};

// ---------------------------------------------------------------------------
// OperationManager
// ---------------------------------------------------------------------------

struct OperationRequest {
    OperationType                      type = OperationType::Status;
    std::string                        command;
    std::map<std::string, std::string> args;
    std::string                        description;
    bool                               undoable = true;
    /// Preview only: no lock, no snapshot, nothing recorded.
    bool                               dry_run  = false;
};

/// What a unit of work reports back on success.
struct OperationOutcome {
    std::map<std::string, std::string> result;
    UndoData                           undo;
    std::optional<std::string>         backup_branch;
    bool                               undoable = true;
};

/// The unit of work. Receives the operation id.
using OperationFn = std::function<OperationOutcome(const std::string& operation_id)>;

struct ExecuteResult {
    bool                               success = false;
    std::string                        operation_id;
    std::optional<std::string>         error;
    ErrorKind                          error_kind = ErrorKind::None;
    bool                               restore_attempted = false;
    bool                               restored          = false;
    std::map<std::string, std::string> result;
};

/// Runs commands inside a snapshot / execute / restore transaction and
/// records them in the ledger.
///
/// Mutating operation types hold the repository lock for the whole call;
/// a second concurrent caller fails fast with ErrorKind::Concurrency.
/// A failed migration is left as the MigrationExecutor settled it.
class OperationManager {
public:
    explicit OperationManager(Context ctx);

    /// Never throws for failures of @p fn; they are reported in the result.
    ExecuteResult execute(const OperationRequest& req, const OperationFn& fn);

    const Context& context() const { return ctx_; }

private:
    Snapshot take_snapshot();
    bool restore(const Snapshot& snap, Operation& op);
    void record(const Operation& op);

    Context ctx_;
};

} // namespace histofy
