#include "histofy/error.h"

namespace histofy {

const char* to_string(CancelReason reason) {
    switch (reason) {
        case CancelReason::Signal:    return "signal";
        case CancelReason::UserAbort: return "user abort";
        case CancelReason::Timeout:   return "timeout";
    }
    return "signal"; // unreachable
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Validation:    return "validation";
        case ErrorKind::Git:           return "git";
        case ErrorKind::Network:       return "network";
        case ErrorKind::Concurrency:   return "concurrency";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Cancelled:     return "cancelled";
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::Undo:          return "undo";
        case ErrorKind::Other:         return "other";
    }
    return "other"; // unreachable
}

ErrorKind classify(const std::exception& e) {
    if (dynamic_cast<const ValidationError*>(&e))    return ErrorKind::Validation;
    if (dynamic_cast<const GitError*>(&e))           return ErrorKind::Git;
    if (dynamic_cast<const NetworkError*>(&e))       return ErrorKind::Network;
    if (dynamic_cast<const ConcurrencyError*>(&e))   return ErrorKind::Concurrency;
    if (dynamic_cast<const ConfigurationError*>(&e)) return ErrorKind::Configuration;
    if (dynamic_cast<const CancellationError*>(&e))  return ErrorKind::Cancelled;
    if (dynamic_cast<const NotFoundError*>(&e))      return ErrorKind::NotFound;
    if (dynamic_cast<const AlreadyUndoneError*>(&e) ||
        dynamic_cast<const NotUndoableError*>(&e) ||
        dynamic_cast<const UndoBlockedError*>(&e))   return ErrorKind::Undo;
    return ErrorKind::Other;
}

} // namespace histofy
