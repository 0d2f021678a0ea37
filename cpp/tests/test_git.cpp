#include <catch2/catch_test_macros.hpp>
#include <histofy/histofy.h>

#include "internal.h"

#include <git2.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static fs::path make_temp_repo() {
    return fs::temp_directory_path() /
           ("histofy_git_" + std::to_string(
                std::hash<std::thread::id>{}(std::this_thread::get_id())
                ^ static_cast<size_t>(
                      std::chrono::steady_clock::now().time_since_epoch().count())));
}

static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

static std::shared_ptr<histofy::LibGit2Git> init_repo(const fs::path& path) {
    auto git = histofy::LibGit2Git::init(path);
    git->set_default_signature({"Tester", "tester@example.com"});
    return git;
}

/// Write @p name, stage everything and commit at @p when.
static std::string commit_file(histofy::GitPrimitives& git, const std::string& name,
                               const std::string& content, int64_t when) {
    write_file(git.path() / name, content);
    git.add_all();
    histofy::CommitSpec spec;
    spec.message   = "edit " + name;
    spec.timestamp = when;
    return git.commit_with_date(spec);
}

// ---------------------------------------------------------------------------
// Repository basics
// ---------------------------------------------------------------------------

TEST_CASE("LibGit2Git: init and open", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        CHECK(fs::exists(path / ".git"));
        CHECK(git->current_branch() == std::optional<std::string>("main"));
        CHECK_FALSE(git->status().head);
        CHECK_THROWS_AS(git->head_commit(), histofy::GitError);
    }
    {
        auto git = histofy::LibGit2Git::open(path);
        CHECK(fs::equivalent(git->path(), path));
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: open outside a repository fails", "[git]") {
    auto path = make_temp_repo();
    fs::create_directories(path);
    CHECK_THROWS_AS(histofy::LibGit2Git::open(path), histofy::ConfigurationError);
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: commit_with_date sets author and committer dates", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        write_file(path / "a.txt", "one\n");
        git->add_all();

        histofy::CommitSpec spec;
        spec.message   = "first";
        spec.timestamp = 1686819600;
        spec.tz_offset = 120;
        spec.author    = histofy::Signature{"Ada", "ada@example.com"};
        auto hash = git->commit_with_date(spec);

        CHECK(git->head_commit() == hash);
        auto c = git->read_commit(hash);
        CHECK(c.author_time == 1686819600);
        CHECK(c.committer_time == 1686819600);
        CHECK(c.author_offset == 120);
        CHECK(c.author_name == "Ada");
        CHECK(c.message == "first");
        CHECK(c.parents.empty());
        CHECK(git->status().clean());
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: nothing to commit unless allowed", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "one\n", 1600000000);
        histofy::CommitSpec spec;
        spec.message   = "empty";
        spec.timestamp = 1600000100;
        CHECK_THROWS_AS(git->commit_with_date(spec), histofy::GitError);
        spec.allow_empty = true;
        CHECK_NOTHROW(git->commit_with_date(spec));
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: status reports changes", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "one\n", 1600000000);
        CHECK(git->status().clean());

        write_file(path / "a.txt", "two\n");
        write_file(path / "new.txt", "x\n");
        auto st = git->status();
        CHECK_FALSE(st.clean());
        CHECK(st.modified == std::vector<std::string>{"a.txt"});
        CHECK(st.untracked == std::vector<std::string>{"new.txt"});
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: log range is oldest first", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        std::vector<std::string> hashes;
        for (int i = 0; i < 4; ++i)
            hashes.push_back(commit_file(*git, "f.txt", std::to_string(i), 1600000000 + i));

        auto range = git->log("HEAD~3..HEAD");
        REQUIRE(range.size() == 3);
        CHECK(range[0].hash == hashes[1]);
        CHECK(range[2].hash == hashes[3]);
        CHECK(git->resolve("HEAD~1") == hashes[2]);
        CHECK_THROWS_AS(git->resolve("no-such-ref"), histofy::ValidationError);
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: branch operations", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        auto head = commit_file(*git, "a.txt", "one\n", 1600000000);
        git->create_branch("histofy-backup-x-1", head);
        git->create_branch("other", "HEAD");

        CHECK(git->branch_exists("other"));
        CHECK(git->list_branches("histofy-backup-") ==
              std::vector<std::string>{"histofy-backup-x-1"});
        CHECK(git->resolve("histofy-backup-x-1") == head);
        CHECK_THROWS_AS(git->create_branch("other", head), histofy::GitError);

        git->delete_branch("other");
        CHECK_FALSE(git->branch_exists("other"));
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: reset restores the working tree", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        auto first = commit_file(*git, "a.txt", "one\n", 1600000000);
        commit_file(*git, "a.txt", "two\n", 1600000100);

        git->reset_soft(first);
        CHECK(git->head_commit() == first);
        CHECK_FALSE(git->status().clean());

        git->reset_hard(first);
        CHECK(git->status().clean());
        std::ifstream in(path / "a.txt");
        std::string line;
        std::getline(in, line);
        CHECK(line == "one");
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: push to an unknown remote is a network error", "[git]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "one\n", 1600000000);
        try {
            git->push("nowhere", "main");
            FAIL("expected NetworkError");
        } catch (const histofy::NetworkError& e) {
            CHECK_FALSE(e.retryable());
        }
    }
    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Migration end to end
// ---------------------------------------------------------------------------

TEST_CASE("LibGit2Git: migration rewrites dates and keeps content", "[git][migration]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "base\n", 1500000000);
        std::vector<std::string> originals;
        originals.push_back(commit_file(*git, "a.txt", "one\n", 1600000000));
        originals.push_back(commit_file(*git, "b.txt", "two\n", 1600000100));
        originals.push_back(commit_file(*git, "a.txt", "three\n", 1600000200));

        histofy::MigrationExecutor exec(git);
        histofy::PlanRequest req;
        req.target_date = "2023-06-15";
        auto plan = exec.plan("HEAD~3..HEAD", req);
        auto r = exec.execute(plan);

        REQUIRE(r.success);
        CHECK(r.migrated_count == 3);
        CHECK(r.integrity_warnings.empty());
        REQUIRE(r.backup_branch);
        CHECK(git->resolve(*r.backup_branch) == originals.back());

        auto rewritten = git->log("HEAD~3..HEAD");
        REQUIRE(rewritten.size() == 3);
        for (size_t i = 0; i < 3; ++i) {
            auto old = git->read_commit(originals[i]);
            CHECK(rewritten[i].hash != originals[i]);
            CHECK(rewritten[i].tree == old.tree);
            CHECK(rewritten[i].message == old.message);
            CHECK(rewritten[i].author_time == plan.commits[i].new_timestamp);
            CHECK(rewritten[i].committer_time == plan.commits[i].new_timestamp);
        }
        CHECK(git->status().clean());

        // Undo: back to the backup gives the original hashes.
        git->reset_hard(*r.backup_branch);
        auto restored = git->log("HEAD~3..HEAD");
        for (size_t i = 0; i < 3; ++i) CHECK(restored[i].hash == originals[i]);
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: migrating the middle of a branch carries later commits", "[git][migration]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "base\n", 1500000000);
        auto middle = commit_file(*git, "a.txt", "one\n", 1600000000);
        auto tip    = commit_file(*git, "b.txt", "two\n", 1600000100);

        histofy::MigrationExecutor exec(git);
        histofy::PlanRequest req;
        req.target_date = "2023-06-15";
        auto r = exec.execute(exec.plan("HEAD~2..HEAD~1", req));

        REQUIRE(r.success);
        auto head = git->read_commit(git->head_commit());
        CHECK(head.tree == git->read_commit(tip).tree);
        CHECK(head.author_time == 1600000100);
        CHECK(head.parents.front() != middle);
        CHECK(git->read_commit(head.parents.front()).author_time == 1686819600);
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: migration refuses a dirty tree", "[git][migration]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "base\n", 1500000000);
        commit_file(*git, "a.txt", "one\n", 1600000000);
        write_file(path / "a.txt", "local edit\n");

        histofy::MigrationExecutor exec(git);
        histofy::PlanRequest req;
        req.target_date = "2023-06-15";
        auto r = exec.execute(exec.plan("HEAD~1..HEAD", req));
        CHECK(r.state == histofy::MigrationState::Aborted);
        CHECK(r.error_kind == histofy::ErrorKind::Validation);
        CHECK(exec.list_backups().empty());
    }
    fs::remove_all(path);
}

TEST_CASE("LibGit2Git: rewrite refuses a branch that moved meanwhile", "[git][migration]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        commit_file(*git, "a.txt", "base\n", 1500000000);
        commit_file(*git, "a.txt", "one\n", 1600000000);

        histofy::MigrationExecutor exec(git);
        histofy::PlanRequest req;
        req.target_date = "2023-06-15";
        auto session = git->rebase_with_dates(exec.plan("HEAD~1..HEAD", req));
        while (session->next().status != histofy::RewriteStepStatus::Done) {}

        auto foreign = commit_file(*git, "b.txt", "meanwhile\n", 1600000100);
        CHECK_THROWS_AS(session->finish(), histofy::StaleBranchError);
        CHECK(git->head_commit() == foreign);
        CHECK(git->status().clean());
    }
    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Three-way tree merge
// ---------------------------------------------------------------------------

namespace {

struct RawRepo {
    git_repository* repo = nullptr;
    explicit RawRepo(const fs::path& path) {
        REQUIRE(git_repository_open(&repo, path.string().c_str()) == 0);
    }
    ~RawRepo() { if (repo) git_repository_free(repo); }
};

} // anonymous namespace

TEST_CASE("tree::merge_trees: diverged trees", "[git][merge]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        auto base = commit_file(*git, "shared.txt", "one\ntwo\nthree\n", 1500000000);
        auto ours = commit_file(*git, "shared.txt", "ours\ntwo\nthree\n", 1500000100);
        git->reset_hard(base);
        const std::string base_tree = git->read_commit(base).tree;
        const std::string ours_tree = git->read_commit(ours).tree;
        RawRepo raw(path);

        SECTION("same line changed on both sides") {
            auto theirs = commit_file(*git, "shared.txt", "theirs\ntwo\nthree\n", 1500000200);
            const std::string theirs_tree = git->read_commit(theirs).tree;

            auto plain = histofy::tree::merge_trees(raw.repo, base_tree, ours_tree,
                                                    theirs_tree, std::nullopt);
            CHECK_FALSE(plain.tree_hex);
            CHECK(plain.conflicts == std::vector<std::string>{"shared.txt"});

            auto favour_ours = histofy::tree::merge_trees(
                raw.repo, base_tree, ours_tree, theirs_tree, histofy::ConflictStrategy::Ours);
            REQUIRE(favour_ours.tree_hex);
            CHECK(*favour_ours.tree_hex == ours_tree);

            auto favour_theirs = histofy::tree::merge_trees(
                raw.repo, base_tree, ours_tree, theirs_tree, histofy::ConflictStrategy::Theirs);
            REQUIRE(favour_theirs.tree_hex);
            CHECK(*favour_theirs.tree_hex == theirs_tree);
        }
        SECTION("independent changes merge cleanly") {
            auto theirs = commit_file(*git, "other.txt", "new\n", 1500000200);
            const std::string theirs_tree = git->read_commit(theirs).tree;

            auto merged = histofy::tree::merge_trees(raw.repo, base_tree, ours_tree,
                                                     theirs_tree, std::nullopt);
            REQUIRE(merged.tree_hex);
            CHECK(merged.conflicts.empty());
            CHECK(histofy::tree::diff_paths(raw.repo, ours_tree, *merged.tree_hex) ==
                  std::vector<std::string>{"other.txt"});
            CHECK(histofy::tree::diff_paths(raw.repo, theirs_tree, *merged.tree_hex) ==
                  std::vector<std::string>{"shared.txt"});
        }
    }
    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Context end to end
// ---------------------------------------------------------------------------

TEST_CASE("Context: commit, record and undo through the ledger", "[git][operation]") {
    auto path = make_temp_repo();
    {
        auto git = init_repo(path);
        auto first = commit_file(*git, "a.txt", "one\n", 1600000000);
        write_file(path / "b.txt", "new\n");

        auto ctx = histofy::Context::open(path);
        CHECK(ctx.lock_dir == ctx.git->git_dir() / "histofy");
        histofy::OperationManager mgr(ctx);

        histofy::CommandOptions opts;
        opts.date    = "2023-06-15";
        opts.add_all = true;
        histofy::OperationRequest req;
        req.type    = histofy::OperationType::Commit;
        req.command = "commit";
        auto r = mgr.execute(req, [&](const std::string&) {
            return histofy::run_commit(*ctx.git, "add b", opts, *ctx.logger);
        });
        REQUIRE(r.success);
        CHECK(fs::exists(ctx.lock_dir / histofy::JsonFileHistoryStore::kFileName));

        auto history = ctx.operation_history();
        auto op = history.get_operation(r.operation_id);
        CHECK(op.status == histofy::OperationStatus::Completed);
        CHECK(op.undo.parent_hash == first);
        CHECK(history.check_undo_safety(op).safe);

        history.undo_operation(r.operation_id);
        CHECK(ctx.git->head_commit() == first);
        CHECK(history.get_operation(r.operation_id).status ==
              histofy::OperationStatus::Undone);
        CHECK_THROWS_AS(history.undo_operation(r.operation_id),
                        histofy::AlreadyUndoneError);
    }
    fs::remove_all(path);
}
