#include "histofy/migration.h"
#include "histofy/log.h"
#include "internal.h"

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

namespace histofy {

const char* to_string(MigrationState s) {
    switch (s) {
        case MigrationState::Planning:       return "PLANNING";
        case MigrationState::BackupCreated:  return "BACKUP_CREATED";
        case MigrationState::Rewriting:      return "REWRITING";
        case MigrationState::Conflict:       return "CONFLICT";
        case MigrationState::Validating:     return "VALIDATING";
        case MigrationState::Completed:      return "COMPLETED";
        case MigrationState::Aborted:        return "ABORTED";
        case MigrationState::RolledBack:     return "ROLLED_BACK";
        case MigrationState::RollbackFailed: return "ROLLBACK_FAILED";
    }
    return "PLANNING"; // unreachable
}

namespace {

void report(const ExecuteOptions& opts, const std::string& msg,
            std::optional<int> percent = std::nullopt) {
    if (opts.on_progress) opts.on_progress(msg, percent);
}

std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

/// Epoch embedded in a backup branch name, 0 if it has none.
int64_t backup_epoch(const std::string& name) {
    const std::string rest = name.substr(std::string(MigrationExecutor::kBackupPrefix).size());
    auto dash = rest.find('-');
    if (dash == std::string::npos) return 0;
    auto end = rest.find('-', dash + 1);
    std::string digits = rest.substr(dash + 1, end == std::string::npos
                                                   ? std::string::npos
                                                   : end - dash - 1);
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return 0;
    return std::stoll(digits);
}

} // anonymous namespace

MigrationExecutor::MigrationExecutor(std::shared_ptr<GitPrimitives> git,
                                     std::shared_ptr<spdlog::logger> logger,
                                     std::shared_ptr<CancellationToken> cancel)
    : git_(std::move(git)), log_(logging::or_null(std::move(logger))),
      cancel_(std::move(cancel)) {}

std::string MigrationExecutor::backup_branch_name(const std::string& op_id,
                                                  int64_t epoch) {
    return std::string(kBackupPrefix) + op_id + "-" + std::to_string(epoch);
}

MigrationPlan MigrationExecutor::plan(const std::string& range,
                                      const PlanRequest& req) {
    planner::validate(req);
    auto commits = git_->log(range);
    auto plan = planner::plan_migration(commits, req);
    for (const auto& w : plan.warnings) log_->warn("migration plan: {}", w);
    log_->debug("planned {} commit(s) from {}", plan.commits.size(), range);
    return plan;
}

void MigrationExecutor::enter(MigrationResult& r, MigrationState s) {
    log_->debug("migration state {} -> {}", to_string(r.state), to_string(s));
    r.state = s;
    r.transitions.push_back(s);
}

std::string MigrationExecutor::create_backup(const std::string& op_id,
                                             const std::string& head) {
    const std::string base = backup_branch_name(op_id, dates::now());
    std::string name = base;
    for (int n = 2; git_->branch_exists(name); ++n) {
        name = base + "-" + std::to_string(n);
    }
    git_->create_branch(name, head);
    log_->info("created backup branch {} at {}", name, head);
    return name;
}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------

MigrationResult MigrationExecutor::execute(const MigrationPlan& plan,
                                           const ExecuteOptions& opts) {
    MigrationResult r;
    r.transitions.push_back(MigrationState::Planning);
    const std::string op_id =
        opts.operation_id.empty() ? ids::operation_id() : opts.operation_id;

    // Nothing is written before the backup exists; failures here abort
    // without rollback.
    try {
        if (plan.commits.empty())
            throw ValidationError("migration plan has no commits", "commit_range");
        auto st = git_->status();
        if (!st.branch)
            throw GitError("rebase", "HEAD is detached; check out a branch first");
        if (!st.clean())
            throw ValidationError("working tree has uncommitted changes",
                                  "working_tree",
                                  "commit or stash your changes before migrating");
        r.original_head = git_->head_commit();

        if (opts.create_backup) {
            r.backup_branch = create_backup(op_id, *r.original_head);
            enter(r, MigrationState::BackupCreated);
            report(opts, "Created backup branch " + *r.backup_branch);
        }
    } catch (const HistofyError& e) {
        log_->error("migration aborted before rewrite: {}", e.what());
        r.error      = e.what();
        r.error_kind = classify(e);
        r.aborted    = true;
        enter(r, MigrationState::Aborted);
        return r;
    }

    std::unique_ptr<RewriteSession> session;
    try {
        session = git_->rebase_with_dates(plan);
        enter(r, MigrationState::Rewriting);
        const size_t total = std::max<size_t>(session->total_steps(), 1);

        while (true) {
            if (cancel_) cancel_->throw_if_cancelled();
            RewriteStep step = session->next();
            if (step.status == RewriteStepStatus::Done) break;

            if (step.status == RewriteStepStatus::Conflict) {
                r.conflicts_encountered = true;
                enter(r, MigrationState::Conflict);
                log_->warn("conflict replaying {}: {}", step.original_hash,
                           join(step.conflicts));

                std::optional<ConflictStrategy> strategy = opts.auto_resolve;
                if (!strategy && opts.on_conflict) {
                    ConflictInfo info{step.original_hash, step.conflicts, step.index};
                    switch (opts.on_conflict(info)) {
                        case ConflictAction::UseOurs:   strategy = ConflictStrategy::Ours;   break;
                        case ConflictAction::UseTheirs: strategy = ConflictStrategy::Theirs; break;
                        case ConflictAction::Abort:     break;
                    }
                }
                if (!strategy) {
                    session->abort();
                    r.aborted = true;
                    r.error = "conflict in " + step.original_hash + " (" +
                              join(step.conflicts) +
                              "); migration aborted, branch unchanged";
                    r.error_kind = ErrorKind::Git;
                    if (r.backup_branch)
                        log_->info("backup branch {} retained", *r.backup_branch);
                    enter(r, MigrationState::Aborted);
                    return r;
                }

                log_->info("resolving conflict in {} with strategy {}",
                           step.original_hash, to_string(*strategy));
                step = session->resolve(*strategy);
                if (step.status == RewriteStepStatus::Conflict)
                    throw GitError("resolve", "conflict in " + step.original_hash +
                                                  " could not be resolved with " +
                                                  to_string(*strategy));
                enter(r, MigrationState::Rewriting);
            }

            report(opts, "Rewrote " + step.original_hash.substr(0, 7),
                   static_cast<int>((step.index + 1) * 100 / total));
        }

        if (cancel_) cancel_->throw_if_cancelled();
        r.new_head  = session->finish();
        r.rewritten = session->rewritten();

        enter(r, MigrationState::Validating);
        for (const auto& [orig, rewritten] : r.rewritten) {
            auto paths = git_->diff_trees(orig, rewritten);
            if (!paths.empty()) {
                std::string w = "content of " + orig.substr(0, 7) +
                                " differs after rewrite: " + join(paths);
                log_->warn("integrity check: {}", w);
                r.integrity_warnings.push_back(std::move(w));
            }
        }
        r.migrated_count = r.rewritten.size();
        r.success = true;
        enter(r, MigrationState::Completed);
        log_->info("migrated {} commit(s), new head {}", r.migrated_count, *r.new_head);
        report(opts, "Migration complete", 100);
    } catch (const CancellationError& e) {
        r.cancelled     = true;
        r.cancel_reason = e.reason();
        if (session) session->abort();
        rollback(r, e);
    } catch (const StaleBranchError& e) {
        // The branch was not moved by the rewrite; resetting it would drop
        // whatever was committed meanwhile.
        if (session) session->abort();
        r.error      = e.what();
        r.error_kind = ErrorKind::Git;
        r.aborted    = true;
        log_->error("branch moved during migration, leaving it as is: {}", e.what());
        if (r.backup_branch)
            log_->info("backup branch {} retained", *r.backup_branch);
        enter(r, MigrationState::Aborted);
    } catch (const std::exception& e) {
        if (session) session->abort();
        if (opts.rollback_on_failure) {
            rollback(r, e);
        } else {
            r.error      = e.what();
            r.error_kind = classify(e);
            r.aborted    = true;
            log_->error("migration failed, rollback disabled: {}", e.what());
            enter(r, MigrationState::Aborted);
        }
    }
    return r;
}

void MigrationExecutor::rollback(MigrationResult& r, const std::exception& cause) {
    r.error      = cause.what();
    r.error_kind = classify(cause);
    const std::string target = r.backup_branch ? *r.backup_branch
                                               : r.original_head.value_or("HEAD");
    log_->warn("migration failed ({}); rolling back to {}", cause.what(), target);
    try {
        git_->reset_hard(target);
        r.rolled_back = true;
        enter(r, MigrationState::RolledBack);
        log_->info("rolled back to {}", target);
    } catch (const std::exception& e) {
        r.rollback_failed = true;
        *r.error += std::string("; rollback failed: ") + e.what() +
                    "; recover manually with: git reset --hard " + target;
        log_->error("rollback to {} failed: {}; recover manually with "
                    "git reset --hard {}", target, e.what(), target);
        enter(r, MigrationState::RollbackFailed);
    }
}

// ---------------------------------------------------------------------------
// Backup housekeeping
// ---------------------------------------------------------------------------

std::vector<std::string> MigrationExecutor::list_backups() {
    return git_->list_branches(kBackupPrefix);
}

std::vector<std::string> MigrationExecutor::prune_backups(size_t keep) {
    auto names = list_backups();
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return std::make_tuple(backup_epoch(a), a) > std::make_tuple(backup_epoch(b), b);
    });
    std::vector<std::string> deleted;
    for (size_t i = keep; i < names.size(); ++i) {
        git_->delete_branch(names[i]);
        log_->info("deleted backup branch {}", names[i]);
        deleted.push_back(names[i]);
    }
    return deleted;
}

} // namespace histofy
