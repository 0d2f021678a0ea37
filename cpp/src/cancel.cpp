#include "histofy/cancel.h"

#include <csignal>

namespace histofy {

namespace {
// Kept alive here so the handler never sees a dangling pointer.
std::shared_ptr<CancellationToken> g_token;
std::atomic<CancellationToken*>    g_raw{nullptr};

extern "C" void on_signal(int) {
    if (auto* t = g_raw.load()) t->cancel(CancelReason::Signal);
}
} // anonymous namespace

void install_signal_handlers(std::shared_ptr<CancellationToken> token) {
    g_raw.store(token.get());
    g_token = std::move(token);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

void remove_signal_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_raw.store(nullptr);
    g_token.reset();
}

} // namespace histofy
