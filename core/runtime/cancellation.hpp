#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace warden {
namespace runtime {

// Cooperative cancellation flag shared by the supervision loop and the
// recovery controller. wait_for() is the only suspension point of the loop.
class CancellationToken {
public:
    explicit CancellationToken(std::chrono::milliseconds tick = std::chrono::milliseconds(200));

    // Request cancellation and wake any waiter (not async-signal-safe)
    void cancel();

    // Async-signal-safe: only stores the flag, waiters notice it on their next tick
    void cancel_from_signal() { cancelled_.store(true); }

    bool is_cancelled() const { return cancelled_.load(); }

    // Wait up to duration. Returns true if cancellation was observed.
    // The flag is re-checked at least once per tick.
    bool wait_for(std::chrono::milliseconds duration);

    std::chrono::milliseconds tick() const { return tick_; }

private:
    std::chrono::milliseconds tick_;
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace runtime
}  // namespace warden
