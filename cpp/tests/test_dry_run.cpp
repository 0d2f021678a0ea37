#include <catch2/catch_test_macros.hpp>
#include <histofy/histofy.h>

#include <json/json.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

using histofy::DryRunManager;
using histofy::RiskLevel;

static histofy::MigrationPlan sample_plan(size_t n) {
    histofy::MigrationPlan plan;
    plan.target_date = "2023-06-15";
    plan.start_time  = "09:00";
    for (size_t i = 0; i < n; ++i) {
        histofy::CommitMigration m;
        m.original_hash = std::string(40, static_cast<char>('a' + i % 6));
        m.original_date = "2020-01-01 12:00:00";
        m.new_date      = "2023-06-15";
        m.new_time      = "09:0" + std::to_string(i % 10);
        m.message       = "change " + std::to_string(i);
        plan.commits.push_back(m);
    }
    return plan;
}

// ---------------------------------------------------------------------------
// Accumulation and summary
// ---------------------------------------------------------------------------

TEST_CASE("DryRun: add_operation assigns sequential ids", "[dryrun]") {
    DryRunManager dry;
    histofy::DryRunOperation op;
    op.type = "x";
    CHECK(dry.add_operation(op) == 1);
    CHECK(dry.add_operation(op) == 2);
    CHECK(dry.operations()[1].id == 2);
}

TEST_CASE("DryRun: summary aggregates risk, time, files and git commands", "[dryrun]") {
    DryRunManager dry;
    histofy::DryRunOperation a;
    a.type = "a";
    a.estimated_duration_sec = 10;
    a.affected_files = {"x.txt", "y.txt"};
    a.git_command = "add";
    dry.add_operation(a);

    histofy::DryRunOperation b;
    b.type = "b";
    b.estimated_duration_sec = 5;
    b.risk_level = RiskLevel::High;
    b.reversible = false;
    b.affected_files = {"y.txt"};
    dry.add_operation(b);
    dry.add_warning("careful");

    auto s = dry.generate_summary();
    CHECK(s.total_operations == 2);
    CHECK(s.estimated_time == 15);
    CHECK(s.affected_files_count == 2);
    CHECK(s.git_operations_count == 1);
    CHECK(s.risk_distribution.low == 1);
    CHECK(s.risk_distribution.medium == 0);
    CHECK(s.risk_distribution.high == 1);
    CHECK(s.reversible_operations == 1);
    CHECK(s.irreversible_operations == 1);
    CHECK(s.warnings_count == 1);
}

TEST_CASE("DryRun: generate_summary is idempotent", "[dryrun]") {
    auto dry = DryRunManager::for_migration_operation(sample_plan(4));
    CHECK(dry.generate_summary() == dry.generate_summary());
}

TEST_CASE("DryRun: display_preview returns the rendered summary", "[dryrun]") {
    auto dry = DryRunManager::for_migration_operation(sample_plan(3));
    std::ostringstream out;
    histofy::PreviewOptions opts;
    opts.show_git_commands = true;
    auto shown = dry.display_preview(out, opts);

    CHECK(shown == dry.generate_summary());
    CHECK(out.str().find("DRY RUN PREVIEW") != std::string::npos);
    CHECK(out.str().find("git rebase --interactive") != std::string::npos);
    CHECK(out.str().find("No changes have been made") != std::string::npos);
}

TEST_CASE("DryRun: preview truncates long operation lists", "[dryrun]") {
    auto dry = DryRunManager::for_migration_operation(sample_plan(30));
    std::ostringstream out;
    histofy::PreviewOptions opts;
    opts.max_operations = 5;
    dry.display_preview(out, opts);
    CHECK(out.str().find("... and 27 more operations") != std::string::npos);
}

TEST_CASE("DryRun: clear empties everything", "[dryrun]") {
    auto dry = DryRunManager::for_migration_operation(sample_plan(2));
    dry.clear();
    auto s = dry.generate_summary();
    CHECK(s.total_operations == 0);
    CHECK(s.estimated_time == 0);
    CHECK(s.warnings_count == 0);
    CHECK(s.git_operations.empty());
}

TEST_CASE("DryRun: format_duration", "[dryrun]") {
    CHECK(DryRunManager::format_duration(45) == "45s");
    CHECK(DryRunManager::format_duration(60) == "1m");
    CHECK(DryRunManager::format_duration(125) == "2m 5s");
    CHECK(DryRunManager::format_duration(3600) == "1h");
    CHECK(DryRunManager::format_duration(3780) == "1h 3m");
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

TEST_CASE("DryRun: commit with push adds an irreversible medium-risk step", "[dryrun]") {
    histofy::CommitIntent intent;
    intent.message = "hello";
    intent.add_all = true;
    intent.push    = true;
    auto s = DryRunManager::for_commit_operation(intent).generate_summary();

    REQUIRE(s.total_operations == 3);
    CHECK(s.operations[2].type == "git_push");
    CHECK(s.operations[2].risk_level == RiskLevel::Medium);
    CHECK_FALSE(s.operations[2].reversible);
    CHECK(s.irreversible_operations == 1);
    CHECK(s.warnings_count == 1);
}

TEST_CASE("DryRun: migration steps are high risk and reversible with backup", "[dryrun]") {
    auto s = DryRunManager::for_migration_operation(sample_plan(3)).generate_summary();

    // backup + 3 steps + cleanup
    REQUIRE(s.total_operations == 5);
    CHECK(s.operations.front().type == "git_backup");
    CHECK(s.risk_distribution.high == 3);
    CHECK(s.irreversible_operations == 0);
}

TEST_CASE("DryRun: migration without backup is irreversible", "[dryrun]") {
    auto s = DryRunManager::for_migration_operation(sample_plan(3), false)
                 .generate_summary();

    REQUIRE(s.total_operations == 4);
    CHECK(s.irreversible_operations == 3);
    bool has_error = false;
    for (const auto& w : s.warnings)
        if (w.severity == histofy::WarningSeverity::Error) has_error = true;
    CHECK(has_error);
}

TEST_CASE("DryRun: sensitive config value is masked", "[dryrun]") {
    histofy::ConfigIntent intent;
    intent.key       = "github.token";
    intent.value     = "secret";
    intent.sensitive = true;
    auto s = DryRunManager::for_config_operation(intent).generate_summary();

    REQUIRE(s.total_operations == 2);
    CHECK(s.operations[0].details.at("value") == "[ENCRYPTED]");
    CHECK(s.operations[0].description.find("secret") == std::string::npos);
    CHECK(s.affected_files_count == 1);
}

TEST_CASE("DryRun: batch has a validation step then one commit per entry", "[dryrun]") {
    histofy::BatchIntent intent;
    intent.commits = {{"one", "2023-01-01"}, {"two", "2023-01-02", "08:30"}};
    auto s = DryRunManager::for_batch_operation(intent).generate_summary();

    REQUIRE(s.total_operations == 3);
    CHECK(s.operations[0].type == "data_validation");
    CHECK(s.operations[2].details.at("time") == "08:30");
    CHECK(s.git_operations_count == 2);
}

// ---------------------------------------------------------------------------
// Export
// ---------------------------------------------------------------------------

TEST_CASE("DryRun: export writes the summary schema", "[dryrun]") {
    auto path = fs::temp_directory_path() /
                ("histofy_dryrun_" + std::to_string(
                     std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".json");
    DryRunManager::for_migration_operation(sample_plan(2)).export_summary(path);

    std::ifstream in(path);
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    REQUIRE(Json::parseFromStream(builder, in, &root, &errs));
    CHECK(root["totalOperations"].asUInt() == 4);
    CHECK(root["riskDistribution"]["high"].asUInt() == 2);
    CHECK(root["operations"].size() == 4);
    CHECK(root["version"].asString() == "1.0.0");
    CHECK(root.isMember("exportedAt"));
    fs::remove(path);
}
