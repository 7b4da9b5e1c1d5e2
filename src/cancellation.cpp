#include "fetchkit/cancellation.hpp"

#include <csignal>
#include <utility>

namespace fetchkit {

namespace {

std::atomic<CancellationToken*> g_interrupted_token{nullptr};

void handleInterrupt(int signo) {
    if (auto* token = g_interrupted_token.load()) {
        token->cancel();
    }
    std::signal(signo, SIG_DFL);
}

} // namespace

InterruptGuard::InterruptGuard(CancellationToken token) : token_(std::move(token)) {
    g_interrupted_token.store(&token_);
    previous_ = std::signal(SIGINT, handleInterrupt);
    if (previous_ == SIG_ERR) {
        previous_ = SIG_DFL;
    }
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, previous_);
    g_interrupted_token.store(nullptr);
}

} // namespace fetchkit
