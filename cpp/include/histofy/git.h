#pragma once

/// @file git.h
/// Git capability interface consumed by the core, and its libgit2 backend.

#include "error.h"
#include "types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;

namespace histofy {

// ---------------------------------------------------------------------------
// RewriteSession: a history rewrite in progress
// ---------------------------------------------------------------------------

/// Outcome of a single rewrite step.
enum class RewriteStepStatus : uint8_t {
    Applied,  ///< The commit was replayed.
    Conflict, ///< The replay produced index conflicts.
    Done,     ///< No steps remain.
};

struct RewriteStep {
    RewriteStepStatus        status = RewriteStepStatus::Done;
    std::string              original_hash;
    std::string              new_hash;    ///< Empty unless Applied.
    std::vector<std::string> conflicts;   ///< Conflicted paths.
    size_t                   index = 0;   ///< Zero-based step number.
};

/// A rebase-style rewrite that assigns new dates to planned commits.
///
/// Obtained from GitPrimitives::rebase_with_dates(). Nothing visible in the
/// repository changes until finish(); abort() discards all replayed commits.
class RewriteSession {
public:
    virtual ~RewriteSession() = default;

    /// Number of commits that will be replayed (planned + descendants).
    virtual size_t total_steps() const = 0;

    /// Replay the next commit.
    /// @throws GitError on libgit2 failures.
    virtual RewriteStep next() = 0;

    /// Re-apply the conflicted step favouring one side.
    /// @throws GitError if no step is in conflict.
    virtual RewriteStep resolve(ConflictStrategy strategy) = 0;

    /// Point the branch at the rewritten head and update the working tree.
    /// @return The new head commit hash.
    /// @throws StaleBranchError if the branch no longer points at the head
    ///         the session started from; the branch is left alone.
    virtual std::string finish() = 0;

    /// Drop the session without touching the branch.
    virtual void abort() = 0;

    /// (original, rewritten) hash pairs for the planned commits replayed
    /// so far, oldest first.
    virtual std::vector<std::pair<std::string, std::string>>
    rewritten() const = 0;
};

// ---------------------------------------------------------------------------
// GitPrimitives: capability interface
// ---------------------------------------------------------------------------

/// Raw git operations the core depends on. Injected so that the core can be
/// tested against an in-memory implementation.
class GitPrimitives {
public:
    virtual ~GitPrimitives() = default;

    /// Working directory of the repository.
    virtual std::filesystem::path path() const = 0;

    /// Directory holding repository metadata (".git").
    virtual std::filesystem::path git_dir() const = 0;

    virtual RepoStatus status() = 0;

    /// HEAD commit hash.
    /// @throws GitError if HEAD is unborn.
    virtual std::string head_commit() = 0;

    /// Short name of the checked-out branch, or nullopt if detached.
    virtual std::optional<std::string> current_branch() = 0;

    /// Resolve any revision expression to a 40-char commit hash.
    /// @throws ValidationError if it does not name a commit.
    virtual std::string resolve(const std::string& rev) = 0;

    /// Commits in @p range, oldest first, following first parents.
    /// "A..B" yields commits reachable from B and not from A; a plain
    /// revision yields that single commit.
    /// @throws ValidationError if either end does not resolve.
    virtual std::vector<CommitInfo> log(const std::string& range) = 0;

    virtual CommitInfo read_commit(const std::string& hash) = 0;

    /// Stage all changes, including deletions and untracked files.
    virtual void add_all() = 0;

    /// Commit the index on top of HEAD with the given date.
    /// @return The new commit hash.
    /// @throws GitError if nothing is staged and allow_empty is false.
    virtual std::string commit_with_date(const CommitSpec& spec) = 0;

    /// @throws GitError if the branch already exists.
    virtual void create_branch(const std::string& name,
                               const std::string& target) = 0;
    virtual bool branch_exists(const std::string& name) = 0;
    virtual void delete_branch(const std::string& name) = 0;

    /// Local branch names starting with @p prefix, sorted.
    virtual std::vector<std::string>
    list_branches(const std::string& prefix) = 0;

    /// Begin rewriting the dates of the commits in @p plan on the current
    /// branch. Commits above the planned range are replayed unchanged.
    /// @throws GitError if HEAD is detached or the plan is not on HEAD's
    ///         first-parent line.
    virtual std::unique_ptr<RewriteSession>
    rebase_with_dates(const MigrationPlan& plan) = 0;

    /// Move the current branch to @p rev and reset index and working tree.
    virtual void reset_hard(const std::string& rev) = 0;

    /// Move the current branch to @p rev, keeping index and working tree.
    virtual void reset_soft(const std::string& rev) = 0;

    /// Paths whose content differs between the trees of two commits.
    virtual std::vector<std::string> diff_trees(const std::string& a,
                                                const std::string& b) = 0;

    /// Push @p branch to @p remote.
    /// @throws NetworkError on transport failure.
    virtual void push(const std::string& remote,
                      const std::string& branch) = 0;
};

// ---------------------------------------------------------------------------
// LibGit2Git: libgit2-backed implementation
// ---------------------------------------------------------------------------

struct LibGit2Inner;

/// GitPrimitives over a non-bare repository opened with libgit2.
///
/// Usage:
/// @code
///     auto git = histofy::LibGit2Git::open("/path/to/worktree");
///     auto commits = git->log("HEAD~3..HEAD");
/// @endcode
class LibGit2Git : public GitPrimitives {
public:
    /// Open the repository containing @p path.
    /// @throws ConfigurationError if no repository is found.
    static std::shared_ptr<LibGit2Git> open(const std::filesystem::path& path);

    /// Create a new non-bare repository at @p path with an initial branch.
    static std::shared_ptr<LibGit2Git> init(const std::filesystem::path& path,
                                            const std::string& branch = "main");

    ~LibGit2Git() override;
    LibGit2Git(const LibGit2Git&) = delete;
    LibGit2Git& operator=(const LibGit2Git&) = delete;

    /// Identity used when CommitSpec::author is not given.
    void set_default_signature(Signature sig);

    std::filesystem::path path() const override;
    std::filesystem::path git_dir() const override;
    RepoStatus status() override;
    std::string head_commit() override;
    std::optional<std::string> current_branch() override;
    std::string resolve(const std::string& rev) override;
    std::vector<CommitInfo> log(const std::string& range) override;
    CommitInfo read_commit(const std::string& hash) override;
    void add_all() override;
    std::string commit_with_date(const CommitSpec& spec) override;
    void create_branch(const std::string& name,
                       const std::string& target) override;
    bool branch_exists(const std::string& name) override;
    void delete_branch(const std::string& name) override;
    std::vector<std::string> list_branches(const std::string& prefix) override;
    std::unique_ptr<RewriteSession>
    rebase_with_dates(const MigrationPlan& plan) override;
    void reset_hard(const std::string& rev) override;
    void reset_soft(const std::string& rev) override;
    std::vector<std::string> diff_trees(const std::string& a,
                                        const std::string& b) override;
    void push(const std::string& remote, const std::string& branch) override;

private:
    explicit LibGit2Git(std::shared_ptr<LibGit2Inner> inner);

    std::shared_ptr<LibGit2Inner> inner_;
};

} // namespace histofy
