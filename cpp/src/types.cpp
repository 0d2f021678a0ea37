#include "histofy/types.h"

#include <string>

namespace histofy {

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* to_string(OperationType type) {
    switch (type) {
        case OperationType::Commit:  return "commit";
        case OperationType::Migrate: return "migrate";
        case OperationType::Config:  return "config";
        case OperationType::Batch:   return "batch";
        case OperationType::Status:  return "status";
    }
    return "status"; // unreachable
}

std::optional<OperationType> parse_operation_type(const std::string& s) {
    if (s == "commit")  return OperationType::Commit;
    if (s == "migrate") return OperationType::Migrate;
    if (s == "config")  return OperationType::Config;
    if (s == "batch")   return OperationType::Batch;
    if (s == "status")  return OperationType::Status;
    return std::nullopt;
}

const char* to_string(OperationStatus status) {
    switch (status) {
        case OperationStatus::Pending:   return "pending";
        case OperationStatus::Running:   return "running";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed:    return "failed";
        case OperationStatus::Undone:    return "undone";
    }
    return "pending"; // unreachable
}

std::optional<OperationStatus> parse_operation_status(const std::string& s) {
    if (s == "pending")   return OperationStatus::Pending;
    if (s == "running")   return OperationStatus::Running;
    if (s == "completed") return OperationStatus::Completed;
    if (s == "failed")    return OperationStatus::Failed;
    if (s == "undone")    return OperationStatus::Undone;
    return std::nullopt;
}

const char* to_string(ConflictStrategy s) {
    return s == ConflictStrategy::Ours ? "ours" : "theirs";
}

std::optional<ConflictStrategy> parse_conflict_strategy(const std::string& s) {
    if (s == "ours")   return ConflictStrategy::Ours;
    if (s == "theirs") return ConflictStrategy::Theirs;
    return std::nullopt;
}

Signature parse_author(const std::string& author) {
    Signature sig;
    auto lt = author.find('<');
    std::string name = lt == std::string::npos ? author : author.substr(0, lt);
    while (!name.empty() && name.back() == ' ') name.pop_back();
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    sig.name = name;
    if (lt != std::string::npos) {
        auto gt = author.find('>', lt);
        if (gt != std::string::npos) sig.email = author.substr(lt + 1, gt - lt - 1);
    }
    return sig;
}

} // namespace histofy
