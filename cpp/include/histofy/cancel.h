#pragma once

/// @file cancel.h
/// Cooperative cancellation for long-running operations.

#include "error.h"

#include <atomic>
#include <memory>
#include <optional>

namespace histofy {

/// Flag checked between steps of a migration or batch. Thread- and
/// signal-safe to set.
class CancellationToken {
public:
    void cancel(CancelReason reason = CancelReason::UserAbort) noexcept {
        reason_.store(static_cast<int>(reason));
        cancelled_.store(true);
    }

    bool cancelled() const noexcept { return cancelled_.load(); }

    std::optional<CancelReason> reason() const noexcept {
        if (!cancelled()) return std::nullopt;
        return static_cast<CancelReason>(reason_.load());
    }

    /// @throws CancellationError if cancel() has been called.
    void throw_if_cancelled() const {
        if (cancelled()) throw CancellationError(*reason());
    }

    void reset() noexcept { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int>  reason_{static_cast<int>(CancelReason::UserAbort)};
};

/// Route SIGINT and SIGTERM to @p token with CancelReason::Signal.
/// Only one token is wired at a time; a later call replaces the earlier one.
void install_signal_handlers(std::shared_ptr<CancellationToken> token);

/// Restore default signal dispositions and drop the wired token.
void remove_signal_handlers();

} // namespace histofy
