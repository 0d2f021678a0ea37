#include "histofy/operation.h"
#include "histofy/lock.h"
#include "histofy/log.h"
#include "histofy/migration.h"
#include "internal.h"

#include <string>

namespace histofy {

// ---------------------------------------------------------------------------
// Context
// ---------------------------------------------------------------------------

Context Context::open(const std::filesystem::path& repo_path,
                      const ContextOptions& opts) {
    Context ctx;
    auto git = LibGit2Git::open(repo_path);
    ctx.repo_path = git->path();
    ctx.lock_dir  = opts.history_dir ? *opts.history_dir : git->git_dir() / "histofy";
    ctx.history   = std::make_shared<JsonFileHistoryStore>(
        ctx.lock_dir / JsonFileHistoryStore::kFileName, opts.max_history_entries);
    ctx.git    = std::move(git);
    ctx.logger = logging::or_null(opts.logger);
    ctx.cancel = std::make_shared<CancellationToken>();
    ctx.config = opts.config;
    return ctx;
}

OperationHistory Context::operation_history() const {
    return OperationHistory(history, git, logger, config, lock_dir);
}

// ---------------------------------------------------------------------------
// OperationManager
// ---------------------------------------------------------------------------

OperationManager::OperationManager(Context ctx) : ctx_(std::move(ctx)) {
    ctx_.logger = logging::or_null(ctx_.logger);
}

Snapshot OperationManager::take_snapshot() {
    Snapshot s;
    s.repo_path  = ctx_.repo_path;
    s.branch     = ctx_.git->current_branch();
    s.created_at = dates::now();
    try {
        s.head_commit = ctx_.git->head_commit();
    } catch (const GitError&) {
        // Unborn branch: nothing to restore to.
        s.head_commit.clear();
    }
    return s;
}

bool OperationManager::restore(const Snapshot& snap, Operation& op) {
    auto& log = *ctx_.logger;
    try {
        auto backups = ctx_.git->list_branches(
            std::string(MigrationExecutor::kBackupPrefix) + op.id + "-");
        if (!backups.empty()) {
            op.backup_branch = backups.front();
            log.info("restoring {} from backup branch {}", op.id, backups.front());
            ctx_.git->reset_hard(backups.front());
            return true;
        }
        if (snap.head_commit.empty()) return true;
        if (ctx_.git->head_commit() != snap.head_commit) {
            log.info("restoring {} to snapshot head {}", op.id, snap.head_commit);
            ctx_.git->reset_soft(snap.head_commit);
        }
        return true;
    } catch (const std::exception& e) {
        log.error("could not restore snapshot for {}: {}; HEAD was {}", op.id,
                  e.what(), snap.head_commit);
        return false;
    }
}

void OperationManager::record(const Operation& op) {
    try {
        ctx_.history->append(op);
    } catch (const std::exception& e) {
        ctx_.logger->error("could not record operation {}: {}", op.id, e.what());
    }
}

ExecuteResult OperationManager::execute(const OperationRequest& req,
                                        const OperationFn& fn) {
    Operation op;
    op.id          = ids::operation_id();
    op.type        = req.type;
    op.command     = req.command;
    op.args        = req.args;
    op.description = req.description;
    op.started_at  = dates::now();
    op.status      = OperationStatus::Running;

    ExecuteResult r;
    r.operation_id = op.id;
    auto& log = *ctx_.logger;

    std::optional<RepoLock> guard;
    if (is_mutating(req.type) && !req.dry_run) {
        try {
            guard.emplace(ctx_.lock_dir);
            op.snapshot = take_snapshot();
        } catch (const ConcurrencyError& e) {
            // Not recorded: the operation never ran.
            log.warn("{} refused: {}", req.command, e.what());
            r.error      = e.what();
            r.error_kind = ErrorKind::Concurrency;
            return r;
        } catch (const HistofyError& e) {
            log.error("{} could not start: {}", req.command, e.what());
            r.error      = e.what();
            r.error_kind = classify(e);
            op.status    = OperationStatus::Failed;
            op.error     = e.what();
            op.undoable  = false;
            op.completed_at = dates::now();
            record(op);
            return r;
        }
    }

    log.info("operation {} started{}: {} {}", op.id, req.dry_run ? " (dry run)" : "",
             to_string(op.type), op.description);
    try {
        OperationOutcome out = fn(op.id);
        op.status        = OperationStatus::Completed;
        op.result        = out.result;
        op.undo          = out.undo;
        op.backup_branch = out.backup_branch;
        op.undoable      = req.undoable && out.undoable;
        if (op.snapshot) op.snapshot->backup_branch = out.backup_branch;
        r.success = true;
        r.result  = std::move(out.result);
        log.info("operation {} completed", op.id);
    } catch (const std::exception& e) {
        op.status   = OperationStatus::Failed;
        op.error    = e.what();
        op.undoable = false;
        r.error      = e.what();
        r.error_kind = classify(e);
        log.error("operation {} failed: {}", op.id, e.what());

        const auto* migration = dynamic_cast<const MigrationError*>(&e);
        if (migration) {
            op.backup_branch = migration->backup_branch();
            if (op.snapshot) op.snapshot->backup_branch = op.backup_branch;
            log.info("migration {} ended {}; leaving the repository as the "
                     "executor left it", op.id, to_string(migration->state()));
        }

        // Validation happens before any write; there is nothing to restore.
        if (op.snapshot && !migration && r.error_kind != ErrorKind::Validation) {
            r.restore_attempted = true;
            r.restored = restore(*op.snapshot, op);
            if (op.backup_branch) op.snapshot->backup_branch = op.backup_branch;
        }
    }
    op.completed_at = dates::now();
    if (!req.dry_run) record(op);
    return r;
}

} // namespace histofy
