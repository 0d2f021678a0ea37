#include "histofy/histofy.h"
#include "internal.h"

#include <string>
#include <vector>

namespace histofy {

namespace {

std::string format_author(const Signature& s) {
    return s.email.empty() ? s.name : s.name + " <" + s.email + ">";
}

/// Epoch for @p date / @p time, defaulting to today and 12:00.
int64_t commit_timestamp(const CommandOptions& opts) {
    const std::string date = opts.date ? *opts.date
                                       : dates::format_date(dates::now(), opts.tz_offset);
    const std::string time = opts.time ? *opts.time : "12:00";
    return dates::to_epoch(dates::parse_date(date), dates::parse_time(time),
                           opts.tz_offset);
}

ExecuteOptions execute_options(const CommandOptions& opts,
                               const std::string& operation_id,
                               ConflictHandler on_conflict,
                               ProgressCallback on_progress) {
    ExecuteOptions eo;
    eo.operation_id        = operation_id;
    eo.create_backup       = opts.create_backup;
    eo.rollback_on_failure = opts.rollback_on_failure;
    eo.auto_resolve        = opts.auto_resolve_strategy;
    eo.on_conflict         = std::move(on_conflict);
    eo.on_progress         = std::move(on_progress);
    return eo;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

CommandOptions parse_command_options(const RawCommandOptions& raw,
                                     spdlog::logger& log) {
    CommandOptions opts;
    if (raw.date) {
        dates::parse_date(*raw.date);
        opts.date = raw.date;
    }
    if (raw.time) {
        dates::parse_time(*raw.time);
        opts.time = raw.time;
    }
    if (raw.author) {
        Signature sig = parse_author(*raw.author);
        if (sig.name.empty())
            throw ValidationError("author name is empty", "author",
                                  "use --author \"Name <email>\"");
        opts.author = std::move(sig);
    }
    if (raw.auto_resolve) {
        opts.auto_resolve_strategy = parse_conflict_strategy(*raw.auto_resolve);
        if (!opts.auto_resolve_strategy)
            log.warn("ignoring unknown --auto-resolve strategy '{}' "
                     "(expected 'ours' or 'theirs')", *raw.auto_resolve);
    }
    if (raw.remote) opts.remote = *raw.remote;
    opts.add_all             = raw.add_all;
    opts.push                = raw.push;
    opts.dry_run             = raw.dry_run;
    opts.create_backup       = !raw.no_backup;
    opts.rollback_on_failure = !raw.no_rollback;
    return opts;
}

// ---------------------------------------------------------------------------
// commit
// ---------------------------------------------------------------------------

OperationOutcome run_commit(GitPrimitives& git, const std::string& message,
                            const CommandOptions& opts, spdlog::logger& log,
                            const RetryPolicy& retry) {
    if (message.find_first_not_of(" \t\r\n") == std::string::npos)
        throw ValidationError("commit message is empty", "message");
    const int64_t ts = commit_timestamp(opts);

    OperationOutcome out;
    if (opts.dry_run) {
        out.undoable = false;
        out.result["dry_run"] = "true";
        return out;
    }

    if (opts.add_all) git.add_all();

    std::optional<std::string> parent;
    if (git.status().head) parent = git.head_commit();

    CommitSpec spec;
    spec.message   = message;
    spec.timestamp = ts;
    spec.tz_offset = opts.tz_offset;
    spec.author    = opts.author;
    const std::string hash = git.commit_with_date(spec);
    log.info("created commit {} dated {}", hash,
             dates::format_datetime(ts, opts.tz_offset));

    out.undo.commit_hash = hash;
    out.undo.parent_hash = parent;
    out.result["commit"] = hash;
    out.result["date"]   = dates::format_datetime(ts, opts.tz_offset);

    if (opts.push) {
        auto branch = git.current_branch();
        if (!branch) {
            log.warn("not pushing: HEAD is detached");
            out.result["pushed"] = "false";
        } else {
            try {
                retry_network([&]() { git.push(opts.remote, *branch); }, retry);
                out.result["pushed"] = "true";
                log.info("pushed {} to {}", *branch, opts.remote);
            } catch (const NetworkError& e) {
                log.error("push failed: {}", e.what());
                out.result["pushed"]     = "false";
                out.result["push_error"] = e.what();
            }
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// batch
// ---------------------------------------------------------------------------

OperationOutcome run_batch(GitPrimitives& git,
                           const std::vector<BatchCommitEntry>& entries,
                           const BatchOptions& opts, spdlog::logger& log) {
    if (entries.empty()) throw ValidationError("batch has no commits", "commits");

    std::vector<CommitSpec> specs;
    specs.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (e.message.empty())
            throw ValidationError("batch entry " + std::to_string(i + 1) +
                                      " has an empty message",
                                  "message");
        CommitSpec spec;
        spec.message   = e.message;
        spec.timestamp = dates::to_epoch(dates::parse_date(e.date),
                                         dates::parse_time(e.time), opts.tz_offset);
        spec.tz_offset   = opts.tz_offset;
        spec.allow_empty = true;
        if (e.author) spec.author = parse_author(*e.author);
        specs.push_back(std::move(spec));
    }

    std::optional<std::string> parent;
    if (git.status().head) parent = git.head_commit();

    OperationOutcome out;
    size_t failed = 0;
    for (size_t i = 0; i < specs.size(); ++i) {
        if (opts.cancel) opts.cancel->throw_if_cancelled();
        try {
            out.undo.created_commits.push_back(git.commit_with_date(specs[i]));
            log.debug("batch commit {}/{}: {}", i + 1, specs.size(),
                      out.undo.created_commits.back());
        } catch (const GitError& e) {
            if (!opts.continue_on_error) throw;
            ++failed;
            log.warn("batch entry {} failed: {}", i + 1, e.what());
        }
    }
    if (out.undo.created_commits.empty())
        throw GitError("batch", "no commits were created");

    out.undo.commit_hash = out.undo.created_commits.back();
    out.undo.parent_hash = parent;
    out.result["created"] = std::to_string(out.undo.created_commits.size());
    out.result["failed"]  = std::to_string(failed);
    log.info("batch created {} commit(s), {} failed",
             out.undo.created_commits.size(), failed);
    return out;
}

// ---------------------------------------------------------------------------
// migrate
// ---------------------------------------------------------------------------

OperationOutcome run_migrate(MigrationExecutor& exec, const std::string& range,
                             const PlanRequest& req, const CommandOptions& opts,
                             const std::string& operation_id,
                             spdlog::logger& log,
                             ConflictHandler on_conflict,
                             ProgressCallback on_progress) {
    MigrationPlan plan = exec.plan(range, req);

    OperationOutcome out;
    out.result["commits"] = std::to_string(plan.commits.size());
    if (opts.dry_run) {
        out.undoable = false;
        out.result["dry_run"] = "true";
        return out;
    }

    auto res = exec.execute(plan, execute_options(opts, operation_id,
                                                  std::move(on_conflict),
                                                  std::move(on_progress)));
    if (!res.success) {
        const std::string msg = res.error.value_or("migration failed");
        if (res.rollback_failed)
            log.error("migration left the repository in an unknown state; "
                      "backup branch: {}", res.backup_branch.value_or("(none)"));
        if (res.cancelled)
            throw CancellationError(res.cancel_reason.value_or(CancelReason::Signal));
        if (res.error_kind == ErrorKind::Validation) throw ValidationError(msg);
        throw MigrationError(msg, res.state, res.backup_branch);
    }

    out.backup_branch    = res.backup_branch;
    out.undoable         = res.backup_branch.has_value();
    out.undo.head_after  = res.new_head;
    out.result["migrated"]  = std::to_string(res.migrated_count);
    out.result["conflicts"] = res.conflicts_encountered ? "true" : "false";
    out.result["integrity_warnings"] = std::to_string(res.integrity_warnings.size());
    if (res.new_head) out.result["new_head"] = *res.new_head;
    return out;
}

// ---------------------------------------------------------------------------
// config
// ---------------------------------------------------------------------------

OperationOutcome run_config_set(ConfigStore& config, const std::string& key,
                                const std::string& value, spdlog::logger& log) {
    if (key.empty()) throw ValidationError("configuration key is empty", "key");
    OperationOutcome out;
    out.undo.config_key     = key;
    out.undo.previous_value = config.get(key);
    config.set(key, value);
    out.result["key"] = key;
    log.info("set configuration key {}", key);
    return out;
}

// ---------------------------------------------------------------------------
// Previews
// ---------------------------------------------------------------------------

DryRunManager preview_commit(const std::string& message, const CommandOptions& opts) {
    CommitIntent intent;
    intent.message = message;
    intent.add_all = opts.add_all;
    intent.date    = opts.date;
    intent.time    = opts.time;
    if (opts.author) intent.author = format_author(*opts.author);
    intent.push    = opts.push;
    return DryRunManager::for_commit_operation(intent);
}

DryRunManager preview_migration(MigrationExecutor& exec, const std::string& range,
                                const PlanRequest& req, const CommandOptions& opts) {
    auto dry = DryRunManager::for_migration_operation(exec.plan(range, req),
                                                      opts.create_backup);
    if (!opts.rollback_on_failure)
        dry.add_warning("automatic rollback is disabled; a failure leaves the "
                        "repository as it was when the error occurred");
    return dry;
}

DryRunManager preview_batch(const std::vector<BatchCommitEntry>& entries,
                            const BatchOptions& opts) {
    BatchIntent intent;
    intent.commits           = entries;
    intent.continue_on_error = opts.continue_on_error;
    return DryRunManager::for_batch_operation(intent);
}

DryRunManager preview_config(const ConfigIntent& intent) {
    return DryRunManager::for_config_operation(intent);
}

} // namespace histofy
