#pragma once

/// @file lock.h
/// Cross-process exclusive lock serialising mutating operations on one
/// repository.

#include "error.h"

#include <chrono>
#include <filesystem>
#include <functional>

namespace histofy {

/// Holds an advisory lock on `<dir>/histofy.lock` for its lifetime.
///
/// Acquisition does not wait: if another process (or another RepoLock in
/// this process) holds the lock, the constructor throws ConcurrencyError.
class RepoLock {
public:
    /// @throws ConcurrencyError if the lock is held elsewhere.
    /// @throws ConfigurationError if the lock file cannot be created.
    explicit RepoLock(const std::filesystem::path& dir);
    ~RepoLock();

    RepoLock(const RepoLock&) = delete;
    RepoLock& operator=(const RepoLock&) = delete;

    const std::filesystem::path& path() const { return path_; }

    static constexpr const char* kFileName = "histofy.lock";

private:
    std::filesystem::path path_;
    int                   fd_ = -1;
};

namespace lock {

/// Acquire the lock in @p dir, run @p fn, then release.
void with_repo_lock(const std::filesystem::path& dir,
                    const std::function<void()>& fn);

/// Hold an exclusive lock on @p lock_file while @p fn runs. Unlike
/// RepoLock this waits, polling every 50ms, for up to @p timeout.
/// @throws ConcurrencyError on timeout.
/// @throws ConfigurationError if the lock file cannot be created.
void with_file_lock(const std::filesystem::path& lock_file,
                    const std::function<void()>& fn,
                    std::chrono::milliseconds timeout = std::chrono::seconds(30));

} // namespace lock
} // namespace histofy
