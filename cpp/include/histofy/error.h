#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace histofy {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all histofy exceptions.
class HistofyError : public std::runtime_error {
public:
    explicit HistofyError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// Bad user input (range, date, time, number). Always raised before any
/// repository mutation.
class ValidationError : public HistofyError {
public:
    explicit ValidationError(const std::string& msg,
                             std::string field = {},
                             std::string suggestion = {})
        : HistofyError("validation error: " + msg),
          field_(std::move(field)), suggestion_(std::move(suggestion)) {}
    const std::string& field() const { return field_; }
    const std::string& suggestion() const { return suggestion_; }
private:
    std::string field_;
    std::string suggestion_;
};

/// A git operation failed. `operation()` names the failing sub-command
/// (e.g. "create_branch", "reset_hard").
class GitError : public HistofyError {
public:
    GitError(const std::string& operation, const std::string& msg)
        : HistofyError("git error: " + operation + ": " + msg),
          operation_(operation) {}
    const std::string& operation() const { return operation_; }
private:
    std::string operation_;
};

/// A branch moved after an operation read it, so the operation refused to
/// overwrite it.
class StaleBranchError : public GitError {
public:
    StaleBranchError(const std::string& ref, const std::string& expected)
        : GitError("update_ref", "stale branch: " + ref +
                                     " no longer points at " + expected),
          ref_(ref), expected_(expected) {}
    const std::string& ref() const { return ref_; }
    const std::string& expected() const { return expected_; }
private:
    std::string ref_;
    std::string expected_;
};

/// A push or other remote operation failed.
class NetworkError : public HistofyError {
public:
    explicit NetworkError(const std::string& msg, bool retryable = true,
                          int status = 0)
        : HistofyError("network error: " + msg),
          retryable_(retryable), status_(status) {}
    bool retryable() const { return retryable_; }
    int status() const { return status_; }
private:
    bool retryable_;
    int  status_;
};

/// Another process holds the repository lock.
class ConcurrencyError : public HistofyError {
public:
    explicit ConcurrencyError(const std::string& lock_path)
        : HistofyError("another histofy operation is running (lock: " +
                       lock_path + ")"),
          lock_path_(lock_path) {}
    const std::string& lock_path() const { return lock_path_; }
private:
    std::string lock_path_;
};

/// History or backup storage is unavailable or misconfigured.
class ConfigurationError : public HistofyError {
public:
    explicit ConfigurationError(const std::string& msg, std::string key = {})
        : HistofyError("configuration error: " + msg), key_(std::move(key)) {}
    const std::string& key() const { return key_; }
private:
    std::string key_;
};

/// Why a running operation was cancelled.
enum class CancelReason {
    Signal,    ///< SIGINT / SIGTERM received.
    UserAbort, ///< The caller chose to abort (e.g. at a conflict prompt).
    Timeout,
};

const char* to_string(CancelReason reason);

/// The operation was cancelled. Carries an explicit reason.
class CancellationError : public HistofyError {
public:
    explicit CancellationError(CancelReason reason)
        : HistofyError(std::string("cancelled: ") + to_string(reason)),
          reason_(reason) {}
    CancelReason reason() const { return reason_; }
private:
    CancelReason reason_;
};

/// An operation id (or other named item) does not exist.
class NotFoundError : public HistofyError {
public:
    explicit NotFoundError(const std::string& what)
        : HistofyError("not found: " + what) {}
};

/// The operation has already been undone.
class AlreadyUndoneError : public HistofyError {
public:
    explicit AlreadyUndoneError(const std::string& id)
        : HistofyError("operation " + id + " has already been undone"),
          id_(id) {}
    const std::string& operation_id() const { return id_; }
private:
    std::string id_;
};

/// The operation was recorded as not undoable.
class NotUndoableError : public HistofyError {
public:
    explicit NotUndoableError(const std::string& id)
        : HistofyError("operation " + id + " is not undoable"), id_(id) {}
    const std::string& operation_id() const { return id_; }
private:
    std::string id_;
};

/// An undo safety check failed and `force` was not given.
class UndoBlockedError : public HistofyError {
public:
    UndoBlockedError(const std::string& id, const std::string& reason)
        : HistofyError("cannot safely undo operation " + id + ": " + reason +
                       " (use --force to override)"),
          id_(id), reason_(reason) {}
    const std::string& operation_id() const { return id_; }
    const std::string& reason() const { return reason_; }
private:
    std::string id_;
    std::string reason_;
};

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

/// Coarse error category reported in result structs.
enum class ErrorKind {
    None,
    Validation,
    Git,
    Network,
    Concurrency,
    Configuration,
    Cancelled,
    NotFound,
    Undo,
    Other,
};

const char* to_string(ErrorKind kind);

/// Map an exception to its ErrorKind by dynamic type.
ErrorKind classify(const std::exception& e);

} // namespace histofy
