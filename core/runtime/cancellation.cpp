#include "cancellation.hpp"

#include <algorithm>

namespace warden {
namespace runtime {

CancellationToken::CancellationToken(std::chrono::milliseconds tick)
    : tick_(tick.count() > 0 ? tick : std::chrono::milliseconds(1)) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        // Signal-initiated cancellation cannot notify, so never sleep longer than one tick
        cv_.wait_for(lock, std::min(remaining + std::chrono::milliseconds(1), tick_),
                     [this] { return cancelled_.load(); });
    }
    return true;
}

}  // namespace runtime
}  // namespace warden
