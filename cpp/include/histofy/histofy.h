#pragma once

/// @file histofy.h
/// Umbrella header: include this to get the full histofy C++ API.

#include "error.h"
#include "types.h"
#include "log.h"
#include "cancel.h"
#include "lock.h"
#include "git.h"
#include "planner.h"
#include "dry_run.h"
#include "migration.h"
#include "history.h"
#include "operation.h"
#include "commands.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <type_traits>

namespace histofy {

/// Retry a network operation with exponential backoff on retryable
/// NetworkError.
///
/// Calls `f()` up to `policy.max_retries + 1` times. Before retry n (0-based)
/// sleeps min(base_delay * 2^n, max_delay). A NetworkError with
/// `retryable() == false` is rethrown at once.
///
/// @code
///     histofy::retry_network([&]() { git.push("origin", "main"); });
/// @endcode
template <typename F>
auto retry_network(F&& f, const RetryPolicy& policy = {}) -> decltype(f()) {
    for (int attempt = 0; ; ++attempt) {
        try {
            return f();
        } catch (const NetworkError& e) {
            if (!e.retryable() || attempt >= policy.max_retries) throw;
            // Past max_delay doubling changes nothing; clamp before shifting.
            const int shift = std::min(attempt, 30);
            std::chrono::milliseconds delay = policy.max_delay;
            if (policy.base_delay.count() <= (policy.max_delay.count() >> shift))
                delay = std::chrono::milliseconds(policy.base_delay.count() << shift);
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace histofy
