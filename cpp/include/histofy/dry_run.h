#pragma once

/// @file dry_run.h
/// Side-effect-free previews of commit, migration, config and batch work.

#include "types.h"

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace Json { class Value; }

namespace histofy {

// ---------------------------------------------------------------------------
// Preview items
// ---------------------------------------------------------------------------

enum class RiskLevel : uint8_t { Low, Medium, High };
const char* to_string(RiskLevel r);

enum class WarningSeverity : uint8_t { Info, Warning, Error };
const char* to_string(WarningSeverity s);

/// One simulated step. `id` is assigned by DryRunManager::add_operation().
struct DryRunOperation {
    int                                id = 0;
    std::string                        type;
    std::string                        description;
    std::map<std::string, std::string> details;
    int                                estimated_duration_sec = 0;
    RiskLevel                          risk_level = RiskLevel::Low;
    bool                               reversible = true;
    std::optional<std::string>         git_command;
    std::vector<std::string>           git_args;
    std::set<std::string>              affected_files;

    bool operator==(const DryRunOperation& o) const {
        return id == o.id && type == o.type && description == o.description &&
               details == o.details &&
               estimated_duration_sec == o.estimated_duration_sec &&
               risk_level == o.risk_level && reversible == o.reversible &&
               git_command == o.git_command && git_args == o.git_args &&
               affected_files == o.affected_files;
    }
};

struct DryRunWarning {
    std::string     message;
    WarningSeverity severity = WarningSeverity::Warning;

    bool operator==(const DryRunWarning& o) const {
        return message == o.message && severity == o.severity;
    }
};

/// A git invocation that would be run.
struct GitInvocation {
    std::string              command;
    std::vector<std::string> args;
    std::string              description;

    bool operator==(const GitInvocation& o) const {
        return command == o.command && args == o.args &&
               description == o.description;
    }
};

struct RiskDistribution {
    size_t low    = 0;
    size_t medium = 0;
    size_t high   = 0;

    bool operator==(const RiskDistribution& o) const {
        return low == o.low && medium == o.medium && high == o.high;
    }
};

/// Aggregate view of everything added to a DryRunManager.
struct DryRunSummary {
    size_t                       total_operations       = 0;
    int                          estimated_time         = 0; ///< Seconds.
    size_t                       affected_files_count   = 0;
    size_t                       git_operations_count   = 0;
    RiskDistribution             risk_distribution;
    size_t                       reversible_operations   = 0;
    size_t                       irreversible_operations = 0;
    size_t                       warnings_count          = 0;
    std::vector<DryRunOperation> operations;
    std::vector<DryRunWarning>   warnings;
    std::vector<std::string>     affected_files;
    std::vector<GitInvocation>   git_operations;

    bool operator==(const DryRunSummary& o) const;

    /// Export schema: totalOperations, estimatedTime, ..., gitOperations.
    Json::Value to_json() const;
};

/// Options for DryRunManager::display_preview().
struct PreviewOptions {
    bool   show_details      = true;
    bool   show_warnings     = true;
    bool   show_git_commands = false;
    size_t max_operations    = 20;
};

// ---------------------------------------------------------------------------
// Intents for the factory builders
// ---------------------------------------------------------------------------

struct CommitIntent {
    std::string                message;
    std::vector<std::string>   files;   ///< Empty with add_all: everything.
    bool                       add_all = false;
    std::optional<std::string> date;
    std::optional<std::string> time;
    std::optional<std::string> author;
    bool                       push = false;
};

struct ConfigIntent {
    enum class Action : uint8_t { Set, Init };

    Action      action = Action::Set;
    std::string key;
    std::string value;
    bool        sensitive   = false;
    std::string config_file = "~/.histofy/config.yaml";
};

struct BatchIntent {
    std::vector<BatchCommitEntry> commits;
    bool                          continue_on_error = false;
};

// ---------------------------------------------------------------------------
// DryRunManager
// ---------------------------------------------------------------------------

/// Accumulates simulated operations and warnings. Never touches a
/// repository.
///
/// Usage:
/// @code
///     auto preview = histofy::DryRunManager::for_migration_operation(plan);
///     auto summary = preview.display_preview(std::cout);
/// @endcode
class DryRunManager {
public:
    /// Append @p op, assigning the next id.
    /// @return The assigned id (1-based).
    int add_operation(DryRunOperation op);

    void add_warning(std::string message,
                     WarningSeverity severity = WarningSeverity::Warning);

    /// Pure projection of the accumulated state.
    DryRunSummary generate_summary() const;

    /// Render a human-readable preview to @p out.
    /// @return The summary that was rendered.
    DryRunSummary display_preview(std::ostream& out,
                                  const PreviewOptions& opts = {}) const;

    /// Write the summary plus `exportedAt` and `version` as JSON.
    /// @throws ConfigurationError if the file cannot be written.
    void export_summary(const std::filesystem::path& path) const;

    void clear();

    const std::vector<DryRunOperation>& operations() const { return operations_; }
    const std::vector<DryRunWarning>&   warnings()   const { return warnings_; }

    /// "45s", "2m 5s", "1h 3m".
    static std::string format_duration(int seconds);

    // -- Builders -----------------------------------------------------------

    static DryRunManager for_commit_operation(const CommitIntent& intent);

    /// Backup (unless @p create_backup is false), one rebase step per planned
    /// commit, then cleanup.
    static DryRunManager for_migration_operation(const MigrationPlan& plan,
                                                 bool create_backup = true);

    static DryRunManager for_config_operation(const ConfigIntent& intent);
    static DryRunManager for_batch_operation(const BatchIntent& intent);

private:
    std::vector<DryRunOperation> operations_;
    std::vector<DryRunWarning>   warnings_;
    std::set<std::string>        affected_files_;
    std::vector<GitInvocation>   git_operations_;
    int                          estimated_time_ = 0;
};

} // namespace histofy
