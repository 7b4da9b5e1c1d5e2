#pragma once

#include <atomic>
#include <memory>

namespace fetchkit {

// Copies share one flag, so a token handed to a transfer can be cancelled
// from any thread holding another copy.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }
    void reset() noexcept { flag_->store(false, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Routes the first SIGINT to a token while alive, then falls back to the
// default action so a second Ctrl-C terminates. Restores the previous
// handler on destruction. One guard at a time.
class InterruptGuard {
public:
    explicit InterruptGuard(CancellationToken token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    using Handler = void (*)(int);

    CancellationToken token_;
    Handler previous_;
};

} // namespace fetchkit
