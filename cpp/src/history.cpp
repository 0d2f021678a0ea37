#include "histofy/history.h"
#include "histofy/lock.h"
#include "histofy/log.h"
#include "internal.h"

#include <json/json.h>

#include <fstream>
#include <string>
#include <vector>

namespace histofy {

namespace {

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

} // anonymous namespace

OperationHistory::OperationHistory(std::shared_ptr<HistoryStore> store,
                                   std::shared_ptr<GitPrimitives> git,
                                   std::shared_ptr<spdlog::logger> logger,
                                   std::shared_ptr<ConfigStore> config,
                                   std::optional<std::filesystem::path> lock_dir)
    : store_(std::move(store)), git_(std::move(git)),
      log_(logging::or_null(std::move(logger))), config_(std::move(config)),
      lock_dir_(std::move(lock_dir)) {}

void OperationHistory::record(const Operation& op) {
    store_->append(op);
    log_->debug("recorded operation {} ({}, {})", op.id, to_string(op.type),
                to_string(op.status));
}

std::vector<Operation> OperationHistory::get_history(const HistoryFilter& filter) {
    return store_->query(filter);
}

Operation OperationHistory::get_operation(const std::string& id) {
    auto op = store_->get(id);
    if (!op) throw NotFoundError("operation " + id);
    return *op;
}

// ---------------------------------------------------------------------------
// Safety
// ---------------------------------------------------------------------------

UndoSafetyCheck OperationHistory::check_undo_safety(const Operation& op) {
    auto blocked = [](std::string reason) {
        return UndoSafetyCheck{false, std::move(reason)};
    };

    if (op.status == OperationStatus::Undone) return blocked("operation has already been undone");
    if (!op.undoable) return blocked("operation is not undoable");
    if (op.status != OperationStatus::Completed)
        return blocked(std::string("operation status is ") + to_string(op.status));

    if (op.type == OperationType::Config) {
        if (!op.undo.config_key) return blocked("no configuration key recorded");
        return {};
    }

    try {
        if (!git_->status().clean())
            return blocked("working tree has uncommitted changes");
        const std::string head = git_->head_commit();

        switch (op.type) {
            case OperationType::Commit:
            case OperationType::Batch:
                if (!op.undo.commit_hash) return blocked("no undo data recorded");
                if (head != *op.undo.commit_hash)
                    return blocked("HEAD has moved since the operation; newer commits exist");
                if (!op.undo.parent_hash)
                    return blocked("operation created the root commit");
                break;
            case OperationType::Migrate:
                if (!op.backup_branch) return blocked("migration has no backup branch");
                if (!git_->branch_exists(*op.backup_branch))
                    return blocked("backup branch " + *op.backup_branch + " no longer exists");
                if (op.undo.head_after && head != *op.undo.head_after)
                    return blocked("HEAD has moved since the migration; newer commits exist");
                break;
            default:
                return blocked(std::string("undo is not supported for ") + to_string(op.type));
        }
    } catch (const GitError& e) {
        return blocked(e.what());
    }
    return {};
}

// ---------------------------------------------------------------------------
// Undo
// ---------------------------------------------------------------------------

UndoResult OperationHistory::undo_operation(const std::string& id,
                                            const UndoOptions& opts) {
    Operation op = get_operation(id);
    if (op.status == OperationStatus::Undone) throw AlreadyUndoneError(id);
    if (!op.undoable) throw NotUndoableError(id);
    if (op.type == OperationType::Config && !config_)
        throw ConfigurationError("no configuration store available to undo " + id,
                                 op.undo.config_key.value_or(""));

    std::optional<RepoLock> guard;
    if (!opts.dry_run && lock_dir_ && op.type != OperationType::Config)
        guard.emplace(*lock_dir_);

    // Re-read under the lock so a concurrent undo is seen.
    op = get_operation(id);
    if (op.status == OperationStatus::Undone) throw AlreadyUndoneError(id);

    auto check = check_undo_safety(op);
    bool forced = false;
    if (!check.safe) {
        if (!opts.force) throw UndoBlockedError(id, check.reason.value_or("unsafe"));
        forced = true;
        log_->warn("forcing undo of {} despite failed safety check: {}", id,
                   check.reason.value_or("unsafe"));
    }
    return apply_undo(op, opts, forced);
}

UndoResult OperationHistory::apply_undo(const Operation& op, const UndoOptions& opts,
                                        bool forced) {
    UndoResult r;
    r.operation_id = op.id;
    r.type         = op.type;
    r.dry_run      = opts.dry_run;
    r.forced       = forced;

    switch (op.type) {
        case OperationType::Commit:
        case OperationType::Batch: {
            if (!op.undo.parent_hash)
                throw UndoBlockedError(op.id, "no parent commit to reset to");
            r.reset_to = *op.undo.parent_hash;
            size_t n = op.type == OperationType::Batch ? op.undo.created_commits.size() : 1;
            r.actions.push_back("reset --hard " + *r.reset_to + " (drop " +
                                std::to_string(n) + " commit(s))");
            if (!opts.dry_run) git_->reset_hard(*r.reset_to);
            break;
        }
        case OperationType::Migrate: {
            if (!op.backup_branch)
                throw UndoBlockedError(op.id, "migration has no backup branch");
            r.reset_to = *op.backup_branch;
            r.actions.push_back("reset --hard " + *r.reset_to);
            if (!opts.dry_run) git_->reset_hard(*r.reset_to);
            break;
        }
        case OperationType::Config: {
            const std::string key = op.undo.config_key.value_or("");
            if (op.undo.previous_value) {
                r.actions.push_back("set " + key + " to its previous value");
                if (!opts.dry_run) config_->set(key, *op.undo.previous_value);
            } else {
                r.actions.push_back("unset " + key);
                if (!opts.dry_run) config_->unset(key);
            }
            break;
        }
        case OperationType::Status:
            throw NotUndoableError(op.id);
    }

    if (!opts.dry_run) {
        store_->mark_undone(op.id, dates::now(), forced);
        log_->info("undid operation {} ({}){}", op.id, to_string(op.type),
                   forced ? " [forced]" : "");
    }
    return r;
}

UndoLastResult OperationHistory::undo_last(size_t count, const UndoOptions& opts) {
    if (count == 0) throw ValidationError("undo count must be at least 1", "count");

    HistoryFilter f;
    f.status        = OperationStatus::Completed;
    f.undoable_only = true;
    f.limit         = count;

    const auto ops = store_->query(f);
    if (ops.empty()) throw NotFoundError("undoable operations");
    if (ops.size() < count)
        throw NotFoundError("undoable operations (" + std::to_string(ops.size()) +
                            " available, " + std::to_string(count) + " requested)");

    UndoLastResult out;
    for (const auto& op : ops) {
        try {
            out.undone.push_back(undo_operation(op.id, opts));
        } catch (const HistofyError& e) {
            log_->warn("undo of {} failed: {}", op.id, e.what());
            out.failed.emplace_back(op.id, e.what());
            if (!opts.force) break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

size_t OperationHistory::clear_history(const ClearOptions& opts) {
    size_t n = store_->clear(opts);
    log_->info("cleared {} history entr{}", n, n == 1 ? "y" : "ies");
    return n;
}

void OperationHistory::export_history(const std::filesystem::path& path,
                                      ExportFormat format) {
    const auto ops = store_->query({});
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw ConfigurationError("cannot write " + path.string(), "export");

    if (format == ExportFormat::Json) {
        Json::Value root(Json::objectValue);
        root["exportedAt"] = dates::format_iso8601(dates::now());
        root["count"]      = Json::UInt64(ops.size());
        Json::Value arr(Json::arrayValue);
        for (const auto& op : ops) {
            Json::Value j;
            ledger::to_json(op, j);
            arr.append(j);
        }
        root["operations"] = arr;
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        out << Json::writeString(writer, root) << "\n";
    } else {
        out << "id,type,command,status,timestamp,completed_at,undoable,backup_branch,description\n";
        for (const auto& op : ops) {
            out << csv_field(op.id) << ',' << to_string(op.type) << ','
                << csv_field(op.command) << ',' << to_string(op.status) << ','
                << dates::format_iso8601(op.started_at) << ','
                << (op.completed_at ? dates::format_iso8601(*op.completed_at) : "") << ','
                << (op.undoable ? "true" : "false") << ','
                << csv_field(op.backup_branch.value_or("")) << ','
                << csv_field(op.description) << "\n";
        }
    }
    if (!out) throw ConfigurationError("cannot write " + path.string(), "export");
    log_->info("exported {} operation(s) to {}", ops.size(), path.string());
}

} // namespace histofy
