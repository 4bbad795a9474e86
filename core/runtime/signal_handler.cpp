#include "signal_handler.hpp"

#include <csignal>

namespace warden {
namespace runtime {

std::atomic<CancellationToken *> SignalHandler::token_{nullptr};
std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install(CancellationToken &token) {
    token_.store(&token);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: only atomic operations allowed
    shutdown_requested_.store(true);
    CancellationToken *token = token_.load();
    if (token != nullptr) {
        token->cancel_from_signal();
    }
}

}  // namespace runtime
}  // namespace warden
