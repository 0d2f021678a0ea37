#include "histofy/lock.h"
#include "histofy/error.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <functional>
#include <thread>

#ifdef HISTOFY_POSIX_LOCK
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>
#endif

namespace histofy {

#ifdef HISTOFY_POSIX_LOCK

/// Acquire an advisory flock on `<dir>/histofy.lock`. Never waits.
RepoLock::RepoLock(const std::filesystem::path& dir)
    : path_(dir / kFileName) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ConfigurationError("cannot create lock directory " + dir.string() +
                                     ": " + ec.message(),
                                 "lock_dir");
    }

    const auto lock_str = path_.string();
    int fd = ::open(lock_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw ConfigurationError("cannot open lock file: " + lock_str + ": " +
                                     std::strerror(errno),
                                 "lock_dir");
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) throw ConcurrencyError(lock_str);
        throw ConfigurationError(std::string("flock failed: ") + std::strerror(err),
                                 "lock_dir");
    }
    fd_ = fd;
}

RepoLock::~RepoLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

namespace {

/// RAII POSIX flock guard.
struct FlockGuard {
    int fd;
    explicit FlockGuard(int f) : fd(f) {}
    ~FlockGuard() {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }
    FlockGuard(const FlockGuard&) = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;
};

} // anonymous namespace

#else
// Fallback: no-op (single-process only)
RepoLock::RepoLock(const std::filesystem::path& dir) : path_(dir / kFileName) {}
RepoLock::~RepoLock() = default;
#endif

namespace lock {

void with_repo_lock(const std::filesystem::path& dir,
                    const std::function<void()>& fn) {
    RepoLock guard(dir);
    fn();
    // guard destructor releases lock + closes fd
}

#ifdef HISTOFY_POSIX_LOCK

void with_file_lock(const std::filesystem::path& lock_file,
                    const std::function<void()>& fn,
                    std::chrono::milliseconds timeout) {
    std::error_code ec;
    if (lock_file.has_parent_path())
        std::filesystem::create_directories(lock_file.parent_path(), ec);
    if (ec) {
        throw ConfigurationError("cannot create lock directory " +
                                     lock_file.parent_path().string() + ": " +
                                     ec.message(),
                                 "lock_dir");
    }

    const auto lock_str = lock_file.string();
    int fd = ::open(lock_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw ConfigurationError("cannot open lock file: " + lock_str + ": " +
                                     std::strerror(errno),
                                 "lock_dir");
    }

    using namespace std::chrono;
    auto deadline = steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) break;

        int err = errno;
        if (err != EWOULDBLOCK) {
            ::close(fd);
            throw ConfigurationError(std::string("flock failed: ") + std::strerror(err),
                                     "lock_dir");
        }
        if (steady_clock::now() >= deadline) {
            ::close(fd);
            throw ConcurrencyError(lock_str);
        }
        std::this_thread::sleep_for(milliseconds(50));
    }

    FlockGuard guard(fd);
    fn();
}

#else
// Fallback: no-op (single-process, single-thread only)
void with_file_lock(const std::filesystem::path& /*lock_file*/,
                    const std::function<void()>& fn,
                    std::chrono::milliseconds /*timeout*/) {
    fn();
}
#endif

} // namespace lock
} // namespace histofy
