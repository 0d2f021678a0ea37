#include "histofy/history.h"
#include "histofy/lock.h"
#include "internal.h"

#include <json/json.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// ledger: JSON mapping
// ---------------------------------------------------------------------------

namespace ledger {

namespace {

Json::Value map_to_json(const std::map<std::string, std::string>& m) {
    Json::Value j(Json::objectValue);
    for (const auto& [k, v] : m) j[k] = v;
    return j;
}

std::map<std::string, std::string> map_from_json(const Json::Value& j) {
    std::map<std::string, std::string> m;
    if (!j.isObject()) return m;
    for (const auto& key : j.getMemberNames()) m[key] = j[key].asString();
    return m;
}

void put_opt(Json::Value& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

std::optional<std::string> get_opt(const Json::Value& j, const char* key) {
    if (!j.isMember(key) || j[key].isNull()) return std::nullopt;
    return j[key].asString();
}

std::optional<int64_t> get_opt_int(const Json::Value& j, const char* key) {
    if (!j.isMember(key) || j[key].isNull()) return std::nullopt;
    return j[key].asInt64();
}

} // anonymous namespace

void to_json(const Operation& op, Json::Value& j) {
    j = Json::Value(Json::objectValue);
    j["id"]          = op.id;
    j["timestamp"]   = dates::format_iso8601(op.started_at);
    j["startedAt"]   = Json::Int64(op.started_at);
    j["type"]        = to_string(op.type);
    j["command"]     = op.command;
    j["description"] = op.description;
    j["status"]      = to_string(op.status);
    j["undoable"]    = op.undoable;
    put_opt(j, "backupBranch", op.backup_branch);
    put_opt(j, "error", op.error);
    if (op.completed_at) j["completedAt"] = Json::Int64(*op.completed_at);
    if (op.undone_at)    j["undoneAt"]    = Json::Int64(*op.undone_at);
    j["forcedUndo"] = op.forced_undo;
    j["args"]       = map_to_json(op.args);
    j["result"]     = map_to_json(op.result);

    if (op.snapshot) {
        Json::Value s(Json::objectValue);
        s["repoPath"]   = op.snapshot->repo_path.string();
        s["headCommit"] = op.snapshot->head_commit;
        put_opt(s, "branch", op.snapshot->branch);
        put_opt(s, "backupBranch", op.snapshot->backup_branch);
        s["createdAt"] = Json::Int64(op.snapshot->created_at);
        j["snapshot"] = s;
    }

    Json::Value u(Json::objectValue);
    put_opt(u, "commitHash", op.undo.commit_hash);
    put_opt(u, "parentHash", op.undo.parent_hash);
    put_opt(u, "headAfter", op.undo.head_after);
    put_opt(u, "configKey", op.undo.config_key);
    put_opt(u, "previousValue", op.undo.previous_value);
    Json::Value created(Json::arrayValue);
    for (const auto& c : op.undo.created_commits) created.append(c);
    u["createdCommits"] = created;
    j["undoData"] = u;
}

Operation from_json(const Json::Value& j) {
    if (!j.isObject() || !j["id"].isString())
        throw ConfigurationError("malformed ledger entry", "history");

    Operation op;
    op.id = j["id"].asString();
    auto type = parse_operation_type(j["type"].asString());
    auto status = parse_operation_status(j["status"].asString());
    if (!type || !status)
        throw ConfigurationError("ledger entry " + op.id +
                                     " has an unknown type or status",
                                 "history");
    op.type   = *type;
    op.status = *status;
    op.command     = j["command"].asString();
    op.description = j["description"].asString();
    op.undoable    = j["undoable"].asBool();
    if (j.isMember("startedAt")) {
        op.started_at = j["startedAt"].asInt64();
    } else if (auto ts = dates::parse_iso8601(j["timestamp"].asString())) {
        op.started_at = *ts;
    }
    op.backup_branch = get_opt(j, "backupBranch");
    op.error         = get_opt(j, "error");
    op.completed_at  = get_opt_int(j, "completedAt");
    op.undone_at     = get_opt_int(j, "undoneAt");
    op.forced_undo   = j["forcedUndo"].asBool();
    op.args          = map_from_json(j["args"]);
    op.result        = map_from_json(j["result"]);

    if (j["snapshot"].isObject()) {
        const auto& s = j["snapshot"];
        Snapshot snap;
        snap.repo_path     = s["repoPath"].asString();
        snap.head_commit   = s["headCommit"].asString();
        snap.branch        = get_opt(s, "branch");
        snap.backup_branch = get_opt(s, "backupBranch");
        snap.created_at    = s["createdAt"].asInt64();
        op.snapshot = std::move(snap);
    }

    const auto& u = j["undoData"];
    if (u.isObject()) {
        op.undo.commit_hash    = get_opt(u, "commitHash");
        op.undo.parent_hash    = get_opt(u, "parentHash");
        op.undo.head_after     = get_opt(u, "headAfter");
        op.undo.config_key     = get_opt(u, "configKey");
        op.undo.previous_value = get_opt(u, "previousValue");
        for (const auto& c : u["createdCommits"]) op.undo.created_commits.push_back(c.asString());
    }
    return op;
}

bool matches(const Operation& op, const HistoryFilter& f) {
    if (f.type && op.type != *f.type) return false;
    if (f.status && op.status != *f.status) return false;
    if (f.since && op.started_at < *f.since) return false;
    if (f.undoable_only && !op.undoable) return false;
    return true;
}

bool matches(const Operation& op, const ClearOptions& o) {
    if (o.type && op.type != *o.type) return false;
    if (o.older_than && op.started_at >= *o.older_than) return false;
    return true;
}

} // namespace ledger

namespace {

void insert_front(std::vector<Operation>& ops, const Operation& op, size_t cap) {
    ops.erase(std::remove_if(ops.begin(), ops.end(),
                             [&](const Operation& o) { return o.id == op.id; }),
              ops.end());
    ops.insert(ops.begin(), op);
    if (cap > 0 && ops.size() > cap) ops.resize(cap);
}

std::vector<Operation> filter_ops(const std::vector<Operation>& ops,
                                  const HistoryFilter& f) {
    std::vector<Operation> out;
    for (const auto& op : ops) {
        if (!ledger::matches(op, f)) continue;
        out.push_back(op);
        if (f.limit > 0 && out.size() >= f.limit) break;
    }
    return out;
}

void set_undone(std::vector<Operation>& ops, const std::string& id,
                int64_t at, bool forced) {
    auto it = std::find_if(ops.begin(), ops.end(),
                           [&](const Operation& o) { return o.id == id; });
    if (it == ops.end()) throw NotFoundError("operation " + id);
    it->status      = OperationStatus::Undone;
    it->undone_at   = at;
    it->forced_undo = forced;
}

size_t remove_matching(std::vector<Operation>& ops, const ClearOptions& opts) {
    auto before = ops.size();
    ops.erase(std::remove_if(ops.begin(), ops.end(),
                             [&](const Operation& o) { return ledger::matches(o, opts); }),
              ops.end());
    return before - ops.size();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MemoryHistoryStore
// ---------------------------------------------------------------------------

MemoryHistoryStore::MemoryHistoryStore(size_t max_entries)
    : max_entries_(max_entries) {}

void MemoryHistoryStore::append(const Operation& op) {
    std::lock_guard<std::mutex> lk(mutex_);
    insert_front(ops_, op, max_entries_);
}

std::vector<Operation> MemoryHistoryStore::query(const HistoryFilter& filter) {
    std::lock_guard<std::mutex> lk(mutex_);
    return filter_ops(ops_, filter);
}

std::optional<Operation> MemoryHistoryStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& op : ops_)
        if (op.id == id) return op;
    return std::nullopt;
}

void MemoryHistoryStore::mark_undone(const std::string& id, int64_t at, bool forced) {
    std::lock_guard<std::mutex> lk(mutex_);
    set_undone(ops_, id, at, forced);
}

size_t MemoryHistoryStore::clear(const ClearOptions& opts) {
    std::lock_guard<std::mutex> lk(mutex_);
    return remove_matching(ops_, opts);
}

// ---------------------------------------------------------------------------
// JsonFileHistoryStore
// ---------------------------------------------------------------------------

JsonFileHistoryStore::JsonFileHistoryStore(std::filesystem::path path,
                                           size_t max_entries)
    : path_(std::move(path)), max_entries_(max_entries) {}

std::vector<Operation> JsonFileHistoryStore::load() const {
    std::vector<Operation> ops;
    if (!std::filesystem::exists(path_)) return ops;

    std::ifstream in(path_);
    if (!in) throw ConfigurationError("cannot read history file " + path_.string(), "history");

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs))
        throw ConfigurationError("corrupt history file " + path_.string() + ": " + errs,
                                 "history");
    if (!root.isObject() || !root["operations"].isArray())
        throw ConfigurationError("history file " + path_.string() +
                                     " has no operations array",
                                 "history");
    try {
        for (const auto& entry : root["operations"]) ops.push_back(ledger::from_json(entry));
    } catch (const Json::Exception& e) {
        throw ConfigurationError("malformed entry in history file " + path_.string() +
                                     ": " + e.what(),
                                 "history");
    }
    return ops;
}

void JsonFileHistoryStore::save(const std::vector<Operation>& ops) const {
    std::error_code ec;
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec)
        throw ConfigurationError("cannot create history directory " +
                                     path_.parent_path().string() + ": " + ec.message(),
                                 "history");

    Json::Value root(Json::objectValue);
    root["version"] = 1;
    Json::Value arr(Json::arrayValue);
    for (const auto& op : ops) {
        Json::Value j;
        ledger::to_json(op, j);
        arr.append(j);
    }
    root["operations"] = arr;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw ConfigurationError("cannot write history file " + tmp.string(), "history");
        out << Json::writeString(writer, root) << "\n";
        if (!out) throw ConfigurationError("cannot write history file " + tmp.string(), "history");
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec)
        throw ConfigurationError("cannot replace history file " + path_.string() +
                                     ": " + ec.message(),
                                 "history");
}

std::filesystem::path JsonFileHistoryStore::lock_path() const {
    auto p = path_;
    p += ".lock";
    return p;
}

void JsonFileHistoryStore::append(const Operation& op) {
    lock::with_file_lock(lock_path(), [&] {
        auto ops = load();
        insert_front(ops, op, max_entries_);
        save(ops);
    });
}

std::vector<Operation> JsonFileHistoryStore::query(const HistoryFilter& filter) {
    return filter_ops(load(), filter);
}

std::optional<Operation> JsonFileHistoryStore::get(const std::string& id) {
    for (auto& op : load())
        if (op.id == id) return op;
    return std::nullopt;
}

void JsonFileHistoryStore::mark_undone(const std::string& id, int64_t at, bool forced) {
    lock::with_file_lock(lock_path(), [&] {
        auto ops = load();
        set_undone(ops, id, at, forced);
        save(ops);
    });
}

size_t JsonFileHistoryStore::clear(const ClearOptions& opts) {
    size_t n = 0;
    lock::with_file_lock(lock_path(), [&] {
        auto ops = load();
        n = remove_matching(ops, opts);
        save(ops);
    });
    return n;
}

} // namespace histofy
