#include "histofy/dry_run.h"
#include "histofy/error.h"
#include "internal.h"

#include <json/json.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <string>

namespace histofy {

const char* to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "low"; // unreachable
}

const char* to_string(WarningSeverity s) {
    switch (s) {
        case WarningSeverity::Info:    return "info";
        case WarningSeverity::Warning: return "warning";
        case WarningSeverity::Error:   return "error";
    }
    return "warning"; // unreachable
}

// ---------------------------------------------------------------------------
// DryRunSummary
// ---------------------------------------------------------------------------

bool DryRunSummary::operator==(const DryRunSummary& o) const {
    return total_operations == o.total_operations &&
           estimated_time == o.estimated_time &&
           affected_files_count == o.affected_files_count &&
           git_operations_count == o.git_operations_count &&
           risk_distribution == o.risk_distribution &&
           reversible_operations == o.reversible_operations &&
           irreversible_operations == o.irreversible_operations &&
           warnings_count == o.warnings_count && operations == o.operations &&
           warnings == o.warnings && affected_files == o.affected_files &&
           git_operations == o.git_operations;
}

Json::Value DryRunSummary::to_json() const {
    Json::Value root(Json::objectValue);
    root["totalOperations"]    = Json::UInt64(total_operations);
    root["estimatedTime"]      = estimated_time;
    root["affectedFilesCount"] = Json::UInt64(affected_files_count);
    root["gitOperationsCount"] = Json::UInt64(git_operations_count);

    Json::Value risk(Json::objectValue);
    risk["low"]    = Json::UInt64(risk_distribution.low);
    risk["medium"] = Json::UInt64(risk_distribution.medium);
    risk["high"]   = Json::UInt64(risk_distribution.high);
    root["riskDistribution"] = risk;

    root["reversibleOperations"]   = Json::UInt64(reversible_operations);
    root["irreversibleOperations"] = Json::UInt64(irreversible_operations);
    root["warningsCount"]          = Json::UInt64(warnings_count);

    Json::Value ops(Json::arrayValue);
    for (const auto& op : operations) {
        Json::Value j(Json::objectValue);
        j["id"]          = op.id;
        j["type"]        = op.type;
        j["description"] = op.description;
        Json::Value details(Json::objectValue);
        for (const auto& [k, v] : op.details) details[k] = v;
        j["details"]           = details;
        j["estimatedDuration"] = op.estimated_duration_sec;
        j["riskLevel"]         = to_string(op.risk_level);
        j["reversible"]        = op.reversible;
        if (op.git_command) {
            j["gitCommand"] = *op.git_command;
            Json::Value args(Json::arrayValue);
            for (const auto& a : op.git_args) args.append(a);
            j["gitArgs"] = args;
        }
        Json::Value files(Json::arrayValue);
        for (const auto& f : op.affected_files) files.append(f);
        j["affectedFiles"] = files;
        ops.append(j);
    }
    root["operations"] = ops;

    Json::Value warns(Json::arrayValue);
    for (const auto& w : warnings) {
        Json::Value j(Json::objectValue);
        j["message"]  = w.message;
        j["severity"] = to_string(w.severity);
        warns.append(j);
    }
    root["warnings"] = warns;

    Json::Value files(Json::arrayValue);
    for (const auto& f : affected_files) files.append(f);
    root["affectedFiles"] = files;

    Json::Value gits(Json::arrayValue);
    for (const auto& g : git_operations) {
        Json::Value j(Json::objectValue);
        j["command"] = g.command;
        Json::Value args(Json::arrayValue);
        for (const auto& a : g.args) args.append(a);
        j["args"]        = args;
        j["description"] = g.description;
        gits.append(j);
    }
    root["gitOperations"] = gits;
    return root;
}

// ---------------------------------------------------------------------------
// Accumulation
// ---------------------------------------------------------------------------

int DryRunManager::add_operation(DryRunOperation op) {
    op.id = static_cast<int>(operations_.size()) + 1;
    estimated_time_ += op.estimated_duration_sec;
    affected_files_.insert(op.affected_files.begin(), op.affected_files.end());
    if (op.git_command) {
        git_operations_.push_back({*op.git_command, op.git_args, op.description});
    }
    operations_.push_back(std::move(op));
    return operations_.back().id;
}

void DryRunManager::add_warning(std::string message, WarningSeverity severity) {
    warnings_.push_back({std::move(message), severity});
}

DryRunSummary DryRunManager::generate_summary() const {
    DryRunSummary s;
    s.total_operations     = operations_.size();
    s.estimated_time       = estimated_time_;
    s.affected_files_count = affected_files_.size();
    s.git_operations_count = git_operations_.size();
    for (const auto& op : operations_) {
        switch (op.risk_level) {
            case RiskLevel::Low:    ++s.risk_distribution.low;    break;
            case RiskLevel::Medium: ++s.risk_distribution.medium; break;
            case RiskLevel::High:   ++s.risk_distribution.high;   break;
        }
        if (op.reversible) ++s.reversible_operations;
    }
    s.irreversible_operations = s.total_operations - s.reversible_operations;
    s.warnings_count = warnings_.size();
    s.operations     = operations_;
    s.warnings       = warnings_;
    s.affected_files.assign(affected_files_.begin(), affected_files_.end());
    s.git_operations = git_operations_;
    return s;
}

void DryRunManager::clear() {
    operations_.clear();
    warnings_.clear();
    affected_files_.clear();
    git_operations_.clear();
    estimated_time_ = 0;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string DryRunManager::format_duration(int seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        int m = seconds / 60, s = seconds % 60;
        return s > 0 ? std::to_string(m) + "m " + std::to_string(s) + "s"
                     : std::to_string(m) + "m";
    }
    int h = seconds / 3600, m = (seconds % 3600) / 60;
    return m > 0 ? std::to_string(h) + "h " + std::to_string(m) + "m"
                 : std::to_string(h) + "h";
}

DryRunSummary DryRunManager::display_preview(std::ostream& out,
                                             const PreviewOptions& opts) const {
    DryRunSummary s = generate_summary();

    out << "DRY RUN PREVIEW\n\n";
    out << "Operation Summary:\n";
    out << "  Total Operations: " << s.total_operations << "\n";
    out << "  Estimated Time: " << format_duration(s.estimated_time) << "\n";
    out << "  Affected Files: " << s.affected_files_count << "\n";
    out << "  Git Operations: " << s.git_operations_count << "\n";

    if (s.total_operations > 0) {
        out << "\nRisk Assessment:\n";
        if (s.risk_distribution.low)
            out << "  LOW: " << s.risk_distribution.low << " operations\n";
        if (s.risk_distribution.medium)
            out << "  MEDIUM: " << s.risk_distribution.medium << " operations\n";
        if (s.risk_distribution.high)
            out << "  HIGH: " << s.risk_distribution.high << " operations\n";
    }

    if (s.irreversible_operations > 0) {
        out << "\nWarning: " << s.irreversible_operations
            << " operations are irreversible!\n";
    }

    if (opts.show_details && !s.operations.empty()) {
        out << "\nPlanned Operations:\n";
        size_t shown = std::min(opts.max_operations, s.operations.size());
        for (size_t i = 0; i < shown; ++i) {
            const auto& op = s.operations[i];
            out << "  " << (i + 1) << ". [" << to_string(op.risk_level) << "]"
                << (op.reversible ? "" : " [irreversible]") << " "
                << op.description << "\n";
            for (const auto& [k, v] : op.details) {
                out << "     " << k << ": " << v << "\n";
            }
        }
        if (s.operations.size() > shown) {
            out << "     ... and " << (s.operations.size() - shown)
                << " more operations\n";
        }
    }

    if (opts.show_git_commands && !s.git_operations.empty()) {
        out << "\nGit Commands to Execute:\n";
        for (size_t i = 0; i < s.git_operations.size(); ++i) {
            const auto& g = s.git_operations[i];
            std::string cmd = "git " + g.command;
            for (const auto& a : g.args) cmd += " " + a;
            out << "  " << (i + 1) << ". " << cmd << "\n";
            if (!g.description.empty()) out << "     " << g.description << "\n";
        }
    }

    if (opts.show_warnings && !s.warnings.empty()) {
        out << "\nWarnings and Recommendations:\n";
        for (size_t i = 0; i < s.warnings.size(); ++i) {
            out << "  " << (i + 1) << ". [" << to_string(s.warnings[i].severity)
                << "] " << s.warnings[i].message << "\n";
        }
    }

    if (s.affected_files_count > 0 && s.affected_files_count <= 10) {
        out << "\nAffected Files:\n";
        for (const auto& f : s.affected_files) out << "  " << f << "\n";
    } else if (s.affected_files_count > 10) {
        out << "\nAffected Files: " << s.affected_files_count
            << " files (too many to list)\n";
    }

    out << "\nThis is a preview only. No changes have been made.\n";
    out << "Use --execute or remove --dry-run to perform these operations.\n";
    return s;
}

void DryRunManager::export_summary(const std::filesystem::path& path) const {
    Json::Value root = generate_summary().to_json();
    root["exportedAt"] = dates::format_iso8601(dates::now());
    root["version"]    = "1.0.0";

    std::ofstream ofs(path);
    if (!ofs) {
        throw ConfigurationError("cannot write dry-run export: " + path.string());
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &ofs);
    ofs << "\n";
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

DryRunManager DryRunManager::for_commit_operation(const CommitIntent& intent) {
    DryRunManager dry;

    DryRunOperation add;
    add.type        = "git_add";
    add.description = "Stage files for commit";
    if (intent.files.empty()) {
        add.details["files"] = "all changes";
    } else {
        std::string joined;
        for (const auto& f : intent.files) {
            if (!joined.empty()) joined += ", ";
            joined += f;
        }
        add.details["files"] = joined;
    }
    add.details["mode"]            = intent.add_all ? "all" : "selective";
    add.estimated_duration_sec     = 2;
    add.git_command                = "add";
    add.git_args = intent.add_all ? std::vector<std::string>{"."} : intent.files;
    add.affected_files.insert(intent.files.begin(), intent.files.end());
    dry.add_operation(std::move(add));

    DryRunOperation commit;
    commit.type        = "git_commit";
    commit.description = "Create commit: \"" + intent.message + "\"";
    commit.details["message"] = intent.message;
    commit.details["date"]    = intent.date.value_or("current");
    commit.details["time"]    = intent.time.value_or("current");
    commit.details["author"]  = intent.author.value_or("default");
    commit.estimated_duration_sec = 3;
    commit.git_command = "commit";
    commit.git_args    = {"-m", intent.message};
    dry.add_operation(std::move(commit));

    if (intent.push) {
        DryRunOperation push;
        push.type        = "git_push";
        push.description = "Push commit to remote repository";
        push.estimated_duration_sec = 5;
        push.risk_level  = RiskLevel::Medium;
        push.reversible  = false;
        push.git_command = "push";
        dry.add_operation(std::move(push));
        dry.add_warning("Push operation cannot be undone automatically");
    }
    return dry;
}

DryRunManager DryRunManager::for_migration_operation(const MigrationPlan& plan,
                                                     bool create_backup) {
    DryRunManager dry;

    if (create_backup) {
        DryRunOperation backup;
        backup.type        = "git_backup";
        backup.description = "Create backup of current repository state";
        backup.estimated_duration_sec = 10;
        backup.git_command = "branch";
        backup.git_args    = {"histofy-backup-<operation-id>"};
        dry.add_operation(std::move(backup));
    }

    for (const auto& c : plan.commits) {
        std::string subject = c.message.substr(0, c.message.find('\n'));
        if (subject.size() > 50) subject = subject.substr(0, 50) + "...";

        DryRunOperation step;
        step.type        = "commit_migration";
        step.description = "Migrate commit " + c.original_hash.substr(0, 8) +
                           ": " + subject;
        step.details["originalDate"] = c.original_date;
        step.details["newDate"]      = c.new_date + " " + c.new_time;
        step.details["hash"]         = c.original_hash;
        step.details["strategy"]     = plan.strategy;
        step.estimated_duration_sec  = 15;
        step.risk_level  = RiskLevel::High;
        step.reversible  = create_backup;
        step.git_command = "rebase";
        step.git_args    = {"--interactive"};
        dry.add_operation(std::move(step));
    }

    DryRunOperation cleanup;
    cleanup.type        = "cleanup";
    cleanup.description = "Clean up temporary files and references";
    cleanup.estimated_duration_sec = 5;
    dry.add_operation(std::move(cleanup));

    dry.add_warning("Migration will rewrite Git history");
    if (create_backup) {
        dry.add_warning("Backup will be created automatically",
                        WarningSeverity::Info);
    } else {
        dry.add_warning("No backup will be created; the rewrite cannot be "
                        "rolled back or undone",
                        WarningSeverity::Error);
    }
    if (plan.commits.size() > 10) {
        dry.add_warning("Large migration may take significant time");
    }
    for (const auto& w : plan.warnings) dry.add_warning(w, WarningSeverity::Info);
    return dry;
}

DryRunManager DryRunManager::for_config_operation(const ConfigIntent& intent) {
    DryRunManager dry;

    if (intent.action == ConfigIntent::Action::Set) {
        DryRunOperation set;
        set.type        = "config_update";
        set.description = "Set configuration: " + intent.key + " = " +
                          (intent.sensitive ? "[ENCRYPTED]" : intent.value);
        set.details["key"]       = intent.key;
        set.details["value"]     = intent.sensitive ? "[ENCRYPTED]" : intent.value;
        set.details["encrypted"] = intent.sensitive ? "true" : "false";
        set.estimated_duration_sec = 2;
        set.affected_files.insert(intent.config_file);
        dry.add_operation(std::move(set));

        if (intent.sensitive) {
            DryRunOperation enc;
            enc.type        = "encryption";
            enc.description = "Encrypt sensitive configuration value";
            enc.estimated_duration_sec = 1;
            dry.add_operation(std::move(enc));
        }
    } else {
        DryRunOperation init;
        init.type        = "config_init";
        init.description = "Initialize configuration file with default values";
        init.details["configFile"]        = intent.config_file;
        init.details["createDirectories"] = "true";
        init.estimated_duration_sec = 3;
        init.affected_files.insert(intent.config_file);
        dry.add_operation(std::move(init));
    }
    return dry;
}

DryRunManager DryRunManager::for_batch_operation(const BatchIntent& intent) {
    DryRunManager dry;
    if (intent.commits.empty()) return dry;

    const size_t n = intent.commits.size();

    DryRunOperation validate;
    validate.type        = "data_validation";
    validate.description = "Validate " + std::to_string(n) + " commit entries";
    validate.estimated_duration_sec = static_cast<int>((n + 9) / 10);
    dry.add_operation(std::move(validate));

    for (size_t i = 0; i < n; ++i) {
        const auto& c = intent.commits[i];
        DryRunOperation op;
        op.type        = "batch_commit";
        op.description = "Create commit " + std::to_string(i + 1) + "/" +
                         std::to_string(n) + ": " + c.message;
        op.details["message"] = c.message;
        op.details["date"]    = c.date;
        op.details["time"]    = c.time;
        op.details["author"]  = c.author.value_or("default");
        op.estimated_duration_sec = 3;
        op.git_command = "commit";
        op.git_args    = {"-m", c.message};
        dry.add_operation(std::move(op));
    }

    if (n > 50) dry.add_warning("Large batch operation may take significant time");
    if (intent.continue_on_error) {
        dry.add_warning("Will continue processing even if individual commits fail",
                        WarningSeverity::Info);
    }
    return dry;
}

} // namespace histofy
