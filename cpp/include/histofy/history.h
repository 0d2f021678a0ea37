#pragma once

/// @file history.h
/// Operation ledger storage and safety-checked undo.

#include "error.h"
#include "git.h"
#include "types.h"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// Filters
// ---------------------------------------------------------------------------

struct HistoryFilter {
    std::optional<OperationType>   type;
    std::optional<OperationStatus> status;
    std::optional<int64_t>         since;          ///< started_at >= since.
    bool                           undoable_only = false;
    size_t                         limit = 0;      ///< 0: no limit.
};

struct ClearOptions {
    std::optional<int64_t>       older_than; ///< Only entries started before this.
    std::optional<OperationType> type;
};

// ---------------------------------------------------------------------------
// HistoryStore: ledger storage capability
// ---------------------------------------------------------------------------

/// Persistent list of operations, newest first.
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    /// Insert @p op at the front, replacing any entry with the same id.
    /// Entries beyond the capacity are dropped from the back.
    virtual void append(const Operation& op) = 0;

    virtual std::vector<Operation> query(const HistoryFilter& filter) = 0;

    virtual std::optional<Operation> get(const std::string& id) = 0;

    /// Set status Undone, undone_at and forced_undo.
    /// @throws NotFoundError if @p id is unknown.
    virtual void mark_undone(const std::string& id, int64_t at, bool forced) = 0;

    /// @return Number of entries removed.
    virtual size_t clear(const ClearOptions& opts) = 0;
};

/// In-memory store for tests and dry runs.
class MemoryHistoryStore : public HistoryStore {
public:
    explicit MemoryHistoryStore(size_t max_entries = 100);

    void append(const Operation& op) override;
    std::vector<Operation> query(const HistoryFilter& filter) override;
    std::optional<Operation> get(const std::string& id) override;
    void mark_undone(const std::string& id, int64_t at, bool forced) override;
    size_t clear(const ClearOptions& opts) override;

private:
    std::mutex             mutex_;
    std::vector<Operation> ops_;
    size_t                 max_entries_;
};

/// JSON ledger file. Every call re-reads the file so that separate
/// processes see each other's entries; writes replace the file atomically.
/// Each read-modify-write cycle holds an exclusive lock on `<path>.lock`,
/// so concurrent writers never lose each other's entries.
///
/// File layout: `{"version": 1, "operations": [ {...}, ... ]}`.
class JsonFileHistoryStore : public HistoryStore {
public:
    static constexpr const char* kFileName = "operations.json";

    /// @param path  Ledger file; its directory is created on first write.
    explicit JsonFileHistoryStore(std::filesystem::path path,
                                  size_t max_entries = 100);

    void append(const Operation& op) override;
    std::vector<Operation> query(const HistoryFilter& filter) override;
    std::optional<Operation> get(const std::string& id) override;
    void mark_undone(const std::string& id, int64_t at, bool forced) override;
    size_t clear(const ClearOptions& opts) override;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path lock_path() const;

private:
    /// @throws ConfigurationError if the file exists but cannot be parsed.
    std::vector<Operation> load() const;
    void save(const std::vector<Operation>& ops) const;

    std::filesystem::path path_;
    size_t                max_entries_;
};

// ---------------------------------------------------------------------------
// ConfigStore: configuration capability used to undo `config` operations
// ---------------------------------------------------------------------------

class ConfigStore {
public:
    virtual ~ConfigStore() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void unset(const std::string& key) = 0;
};

// ---------------------------------------------------------------------------
// OperationHistory
// ---------------------------------------------------------------------------

/// Result of check_undo_safety(). Computed fresh on every call.
struct UndoSafetyCheck {
    bool                       safe = true;
    std::optional<std::string> reason;
};

struct UndoOptions {
    bool force   = false; ///< Proceed despite a failed safety check.
    bool dry_run = false; ///< Check and describe only.
};

struct UndoResult {
    std::string                operation_id;
    OperationType              type = OperationType::Status;
    bool                       dry_run = false;
    bool                       forced  = false;
    std::optional<std::string> reset_to;   ///< Commit or branch HEAD was reset to.
    std::vector<std::string>   actions;    ///< Human-readable steps taken.
};

struct UndoLastResult {
    std::vector<UndoResult>                          undone;
    std::vector<std::pair<std::string, std::string>> failed; ///< (id, error)
};

enum class ExportFormat : uint8_t { Json, Csv };

/// Ledger front-end: recording, querying and undo.
///
/// Usage:
/// @code
///     histofy::OperationHistory history(store, git, logger);
///     auto check = history.check_undo_safety(history.get_operation(id));
///     if (check.safe) history.undo_operation(id);
/// @endcode
class OperationHistory {
public:
    /// @param lock_dir  Directory of the repository lock; when set, undo
    ///                  takes the lock for its duration.
    OperationHistory(std::shared_ptr<HistoryStore> store,
                     std::shared_ptr<GitPrimitives> git,
                     std::shared_ptr<spdlog::logger> logger = {},
                     std::shared_ptr<ConfigStore> config = {},
                     std::optional<std::filesystem::path> lock_dir = {});

    void record(const Operation& op);

    std::vector<Operation> get_history(const HistoryFilter& filter = {});

    /// @throws NotFoundError if @p id is unknown.
    Operation get_operation(const std::string& id);

    UndoSafetyCheck check_undo_safety(const Operation& op);

    /// Apply the inverse of operation @p id and mark it undone.
    /// @throws NotFoundError, AlreadyUndoneError (even with force),
    ///         NotUndoableError, UndoBlockedError, ConcurrencyError,
    ///         ConfigurationError (config undo without a ConfigStore),
    ///         GitError.
    UndoResult undo_operation(const std::string& id, const UndoOptions& opts = {});

    /// Undo the @p count most recent completed, undoable operations, newest
    /// first. Stops at the first failure unless `force`.
    /// @throws ValidationError if @p count is 0.
    /// @throws NotFoundError if fewer than @p count operations are undoable;
    ///         nothing is undone then.
    UndoLastResult undo_last(size_t count = 1, const UndoOptions& opts = {});

    size_t clear_history(const ClearOptions& opts = {});

    /// @throws ConfigurationError if the file cannot be written.
    void export_history(const std::filesystem::path& path,
                        ExportFormat format = ExportFormat::Json);

private:
    UndoResult apply_undo(const Operation& op, const UndoOptions& opts, bool forced);

    std::shared_ptr<HistoryStore>        store_;
    std::shared_ptr<GitPrimitives>       git_;
    std::shared_ptr<spdlog::logger>      log_;
    std::shared_ptr<ConfigStore>         config_;
    std::optional<std::filesystem::path> lock_dir_;
};

} // namespace histofy
