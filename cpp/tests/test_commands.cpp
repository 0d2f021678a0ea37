#include <catch2/catch_test_macros.hpp>
#include <histofy/histofy.h>

#include "fake_git.h"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using histofy::CommandOptions;
using histofy::RawCommandOptions;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

/// Logger writing to @p out so tests can inspect warnings.
std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto log  = std::make_shared<spdlog::logger>("test", sink);
    log->set_pattern("%l %v");
    log->set_level(spdlog::level::debug);
    return log;
}

histofy::RetryPolicy fast_retry(int retries = 3) {
    histofy::RetryPolicy p;
    p.max_retries = retries;
    p.base_delay  = std::chrono::milliseconds(1);
    p.max_delay   = std::chrono::milliseconds(2);
    return p;
}

CommandOptions dated(const std::string& date, const std::string& time = "10:30") {
    CommandOptions o;
    o.date = date;
    o.time = time;
    return o;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_command_options
// ---------------------------------------------------------------------------

TEST_CASE("Commands: options are validated and defaulted", "[commands]") {
    auto& log = *histofy::logging::null_logger();
    RawCommandOptions raw;
    raw.date         = "2023-06-15";
    raw.time         = "08:45";
    raw.author       = "Ada Lovelace <ada@example.com>";
    raw.auto_resolve = "theirs";
    raw.no_backup    = true;

    auto o = histofy::parse_command_options(raw, log);
    CHECK(o.date == std::optional<std::string>("2023-06-15"));
    CHECK(o.time == std::optional<std::string>("08:45"));
    REQUIRE(o.author);
    CHECK(o.author->name == "Ada Lovelace");
    CHECK(o.author->email == "ada@example.com");
    CHECK(o.auto_resolve_strategy == histofy::ConflictStrategy::Theirs);
    CHECK_FALSE(o.create_backup);
    CHECK(o.rollback_on_failure);
    CHECK(o.remote == "origin");
}

TEST_CASE("Commands: unknown auto-resolve value is ignored with a warning", "[commands]") {
    std::ostringstream out;
    auto log = capture_logger(out);
    RawCommandOptions raw;
    raw.auto_resolve = "mine";

    auto o = histofy::parse_command_options(raw, *log);
    CHECK_FALSE(o.auto_resolve_strategy);
    CHECK(out.str().find("warning") != std::string::npos);
    CHECK(out.str().find("mine") != std::string::npos);
}

TEST_CASE("Commands: malformed options are rejected", "[commands]") {
    auto& log = *histofy::logging::null_logger();
    RawCommandOptions bad_date;
    bad_date.date = "2023-02-30";
    CHECK_THROWS_AS(histofy::parse_command_options(bad_date, log), histofy::ValidationError);

    RawCommandOptions bad_time;
    bad_time.time = "25:00";
    CHECK_THROWS_AS(histofy::parse_command_options(bad_time, log), histofy::ValidationError);

    RawCommandOptions bad_author;
    bad_author.author = "<nobody@example.com>";
    CHECK_THROWS_AS(histofy::parse_command_options(bad_author, log), histofy::ValidationError);
}

// ---------------------------------------------------------------------------
// run_commit
// ---------------------------------------------------------------------------

TEST_CASE("Commands: commit uses the requested date", "[commands]") {
    fake::FakeGit git;
    const std::string parent = git.add_commit("root");
    git.dirty = true;

    auto o = dated("2023-06-15");
    o.add_all = true;
    auto out = histofy::run_commit(git, "feature", o, *histofy::logging::null_logger());

    REQUIRE(out.undo.commit_hash);
    CHECK(out.undo.parent_hash == parent);
    CHECK(git.head_commit() == *out.undo.commit_hash);
    const auto& c = git.commits.at(*out.undo.commit_hash);
    CHECK(c.author_time == 1686825000);
    CHECK(c.message == "feature");
    CHECK_FALSE(git.dirty);
    CHECK(out.result.at("date") == "2023-06-15 10:30:00");
    CHECK(out.undoable);
}

TEST_CASE("Commands: commit time defaults to noon", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    CommandOptions o;
    o.date = "2023-06-15";
    auto out = histofy::run_commit(git, "x", o, *histofy::logging::null_logger());
    CHECK(git.commits.at(*out.undo.commit_hash).author_time == 1686830400);
}

TEST_CASE("Commands: empty commit message is a validation error", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    CHECK_THROWS_AS(histofy::run_commit(git, "  \n", dated("2023-06-15"),
                                        *histofy::logging::null_logger()),
                    histofy::ValidationError);
    CHECK(git.commits.size() == 1);
}

TEST_CASE("Commands: dry-run commit writes nothing", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    auto o = dated("2023-06-15");
    o.dry_run = true;
    auto out = histofy::run_commit(git, "x", o, *histofy::logging::null_logger());
    CHECK_FALSE(out.undoable);
    CHECK(git.commits.size() == 1);
}

TEST_CASE("Commands: push is retried on transient failures", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    git.push_failures = 2;
    auto o = dated("2023-06-15");
    o.push = true;

    auto out = histofy::run_commit(git, "x", o, *histofy::logging::null_logger(),
                                   fast_retry());
    CHECK(out.result.at("pushed") == "true");
    CHECK(git.push_calls == 3);
}

TEST_CASE("Commands: failed push keeps the commit", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    auto o = dated("2023-06-15");
    o.push = true;

    SECTION("fatal error is not retried") {
        git.push_fatal = true;
        auto out = histofy::run_commit(git, "x", o, *histofy::logging::null_logger(),
                                       fast_retry());
        CHECK(out.result.at("pushed") == "false");
        CHECK(out.result.count("push_error"));
        CHECK(git.push_calls == 1);
        CHECK(out.undo.commit_hash);
    }
    SECTION("retries exhausted") {
        git.push_failures = 10;
        auto out = histofy::run_commit(git, "x", o, *histofy::logging::null_logger(),
                                       fast_retry(2));
        CHECK(out.result.at("pushed") == "false");
        CHECK(git.push_calls == 3);
    }
}

// ---------------------------------------------------------------------------
// run_batch
// ---------------------------------------------------------------------------

TEST_CASE("Commands: batch creates one commit per entry", "[commands]") {
    fake::FakeGit git;
    const std::string parent = git.add_commit("root");
    std::vector<histofy::BatchCommitEntry> entries = {
        {"first", "2023-01-01", "09:00"},
        {"second", "2023-01-02", "09:00", std::string("Bob <bob@example.com>")},
    };
    auto out = histofy::run_batch(git, entries, {}, *histofy::logging::null_logger());

    REQUIRE(out.undo.created_commits.size() == 2);
    CHECK(out.undo.parent_hash == parent);
    CHECK(out.undo.commit_hash == out.undo.created_commits.back());
    CHECK(git.head_commit() == out.undo.created_commits.back());
    CHECK(git.commits.at(out.undo.created_commits[1]).author_name == "Bob");
    CHECK(out.result.at("created") == "2");
}

TEST_CASE("Commands: batch validates every entry before committing", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    std::vector<histofy::BatchCommitEntry> entries = {
        {"first", "2023-01-01"},
        {"second", "2023-13-01"},
    };
    CHECK_THROWS_AS(histofy::run_batch(git, entries, {}, *histofy::logging::null_logger()),
                    histofy::ValidationError);
    CHECK(git.commits.size() == 1);
    CHECK_THROWS_AS(histofy::run_batch(git, {}, {}, *histofy::logging::null_logger()),
                    histofy::ValidationError);
}

TEST_CASE("Commands: batch failure handling", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    git.reject_messages.insert("second");
    std::vector<histofy::BatchCommitEntry> entries = {
        {"first", "2023-01-01"}, {"second", "2023-01-02"}, {"third", "2023-01-03"},
    };

    SECTION("stops at the first failure by default") {
        CHECK_THROWS_AS(histofy::run_batch(git, entries, {}, *histofy::logging::null_logger()),
                        histofy::GitError);
        CHECK(git.commits.size() == 2);
    }
    SECTION("continues when asked") {
        histofy::BatchOptions opts;
        opts.continue_on_error = true;
        auto out = histofy::run_batch(git, entries, opts, *histofy::logging::null_logger());
        CHECK(out.undo.created_commits.size() == 2);
        CHECK(out.result.at("failed") == "1");
        CHECK(git.commits.at(git.head_commit()).message == "third");
    }
    SECTION("nothing created is an error") {
        git.reject_messages = {"first", "second", "third"};
        histofy::BatchOptions opts;
        opts.continue_on_error = true;
        CHECK_THROWS_AS(histofy::run_batch(git, entries, opts, *histofy::logging::null_logger()),
                        histofy::GitError);
    }
}

TEST_CASE("Commands: batch stops when cancelled", "[commands]") {
    fake::FakeGit git;
    git.add_commit("root");
    histofy::BatchOptions opts;
    opts.cancel = std::make_shared<histofy::CancellationToken>();
    opts.cancel->cancel();
    std::vector<histofy::BatchCommitEntry> entries = {{"first", "2023-01-01"}};
    CHECK_THROWS_AS(histofy::run_batch(git, entries, opts, *histofy::logging::null_logger()),
                    histofy::CancellationError);
    CHECK(git.commits.size() == 1);
}

// ---------------------------------------------------------------------------
// run_migrate
// ---------------------------------------------------------------------------

TEST_CASE("Commands: migrate reports backup and undo data", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    git->add_commit("a");
    git->add_commit("b");
    histofy::MigrationExecutor exec(git);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";

    auto out = histofy::run_migrate(exec, "HEAD~2..HEAD", req, {}, "op_x",
                                    *histofy::logging::null_logger());
    REQUIRE(out.backup_branch);
    CHECK(out.undoable);
    CHECK(out.undo.head_after == git->head_commit());
    CHECK(out.result.at("migrated") == "2");
    CHECK(out.result.at("conflicts") == "false");
}

TEST_CASE("Commands: dry-run migrate only plans", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    const std::string head = git->add_commit("a");
    histofy::MigrationExecutor exec(git);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";
    CommandOptions o;
    o.dry_run = true;

    auto out = histofy::run_migrate(exec, "HEAD~1..HEAD", req, o, "op_x",
                                    *histofy::logging::null_logger());
    CHECK_FALSE(out.undoable);
    CHECK(out.result.at("commits") == "1");
    CHECK(git->head_commit() == head);
    CHECK(exec.list_backups().empty());
}

TEST_CASE("Commands: failed migrate throws after rollback", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    const std::string a = git->add_commit("a");
    histofy::MigrationExecutor exec(git);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";
    git->fail_on.insert(a);

    SECTION("rolled back by default") {
        try {
            histofy::run_migrate(exec, "HEAD~1..HEAD", req, {}, "op_x",
                                 *histofy::logging::null_logger());
            FAIL("expected MigrationError");
        } catch (const histofy::MigrationError& e) {
            CHECK(e.state() == histofy::MigrationState::RolledBack);
            REQUIRE(e.backup_branch());
            CHECK(e.backup_branch()->rfind("histofy-backup-op_x-", 0) == 0);
        }
        CHECK(git->resets == 1);
    }
    SECTION("aborted when rollback is disabled") {
        CommandOptions o;
        o.rollback_on_failure = false;
        try {
            histofy::run_migrate(exec, "HEAD~1..HEAD", req, o, "op_x",
                                 *histofy::logging::null_logger());
            FAIL("expected MigrationError");
        } catch (const histofy::MigrationError& e) {
            CHECK(e.state() == histofy::MigrationState::Aborted);
        }
        CHECK(git->resets == 0);
    }
    CHECK(git->head_commit() == a);
}

TEST_CASE("Commands: cancelled migrate keeps the cancel reason", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    git->add_commit("a");
    const std::string head = git->add_commit("b");
    auto cancel = std::make_shared<histofy::CancellationToken>();
    histofy::MigrationExecutor exec(git, {}, cancel);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";

    auto stop = [&](const std::string& msg, std::optional<int>) {
        if (msg.rfind("Rewrote", 0) == 0) cancel->cancel(histofy::CancelReason::UserAbort);
    };
    try {
        histofy::run_migrate(exec, "HEAD~2..HEAD", req, {}, "op_x",
                             *histofy::logging::null_logger(), {}, stop);
        FAIL("expected CancellationError");
    } catch (const histofy::CancellationError& e) {
        CHECK(e.reason() == histofy::CancelReason::UserAbort);
    }
    CHECK(git->head_commit() == head);
}

TEST_CASE("Commands: migrate without backup is not undoable", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    git->add_commit("a");
    histofy::MigrationExecutor exec(git);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";
    CommandOptions o;
    o.create_backup = false;

    auto out = histofy::run_migrate(exec, "HEAD~1..HEAD", req, o, "op_x",
                                    *histofy::logging::null_logger());
    CHECK_FALSE(out.backup_branch);
    CHECK_FALSE(out.undoable);
}

// ---------------------------------------------------------------------------
// run_config_set and previews
// ---------------------------------------------------------------------------

namespace {

class MapConfig : public histofy::ConfigStore {
public:
    std::map<std::string, std::string> values;
    std::optional<std::string> get(const std::string& key) override {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
    void set(const std::string& key, const std::string& value) override { values[key] = value; }
    void unset(const std::string& key) override { values.erase(key); }
};

} // anonymous namespace

TEST_CASE("Commands: config set records the previous value", "[commands]") {
    MapConfig config;
    config.values["remote.default"] = "origin";
    auto out = histofy::run_config_set(config, "remote.default", "upstream",
                                       *histofy::logging::null_logger());
    CHECK(config.values.at("remote.default") == "upstream");
    CHECK(out.undo.config_key == std::optional<std::string>("remote.default"));
    CHECK(out.undo.previous_value == std::optional<std::string>("origin"));

    auto fresh = histofy::run_config_set(config, "new.key", "v",
                                         *histofy::logging::null_logger());
    CHECK_FALSE(fresh.undo.previous_value);
}

TEST_CASE("Commands: migration preview warns when rollback is disabled", "[commands]") {
    auto git = std::make_shared<fake::FakeGit>();
    git->add_commit("root");
    git->add_commit("a");
    histofy::MigrationExecutor exec(git);
    histofy::PlanRequest req;
    req.target_date = "2023-06-15";
    CommandOptions o;
    o.rollback_on_failure = false;

    auto with = histofy::preview_migration(exec, "HEAD~1..HEAD", req, {}).generate_summary();
    auto without = histofy::preview_migration(exec, "HEAD~1..HEAD", req, o).generate_summary();
    CHECK(without.warnings_count == with.warnings_count + 1);
}

TEST_CASE("Commands: commit preview includes push", "[commands]") {
    auto o = dated("2023-06-15");
    o.push = true;
    auto s = histofy::preview_commit("msg", o).generate_summary();
    CHECK(s.operations.back().type == "git_push");
}

// ---------------------------------------------------------------------------
// retry_network
// ---------------------------------------------------------------------------

TEST_CASE("retry_network: returns the value once the call succeeds", "[commands]") {
    int calls = 0;
    int v = histofy::retry_network([&]() {
        if (++calls < 3) throw histofy::NetworkError("flaky");
        return 42;
    }, fast_retry());
    CHECK(v == 42);
    CHECK(calls == 3);
}

TEST_CASE("retry_network: other exceptions propagate at once", "[commands]") {
    int calls = 0;
    CHECK_THROWS_AS(histofy::retry_network([&]() {
        ++calls;
        throw histofy::GitError("push", "denied");
    }, fast_retry()), histofy::GitError);
    CHECK(calls == 1);
}

TEST_CASE("retry_network: long retry budgets keep the delay capped", "[commands]") {
    histofy::RetryPolicy p;
    p.max_retries = 80;
    p.base_delay  = std::chrono::milliseconds(1);
    p.max_delay   = std::chrono::milliseconds(1);

    int calls = 0;
    int v = histofy::retry_network([&]() {
        if (++calls <= 70) throw histofy::NetworkError("flaky");
        return 7;
    }, p);
    CHECK(v == 7);
    CHECK(calls == 71);
}
