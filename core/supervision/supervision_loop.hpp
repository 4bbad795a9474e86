#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "alert_notifier.hpp"
#include "health/health_prober.hpp"
#include "recovery/recovery_controller.hpp"
#include "recovery_tracker.hpp"
#include "runtime/cancellation.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace supervision {

enum class LoopState { CHECKING, RECOVERING, SLEEPING, STOPPED };

const char *to_string(LoopState state);

// SupervisionLoop keeps one service alive:
// Checking -> (Healthy) Sleeping | (Degraded/Down) Recovering -> Sleeping -> Checking ...
// Single-threaded; exactly one check or recovery is outstanding at a time.
// Cancellation is observed at the top of Checking, before Recovering and
// during the Sleeping wait. Stopped is terminal.
class SupervisionLoop {
public:
    using TransitionCallback = std::function<void(LoopState from, LoopState to)>;

    SupervisionLoop(const service::ServiceDescriptor &descriptor, health::HealthProber &prober,
                    recovery::RecoveryController &recovery, RecoveryTracker &tracker,
                    runtime::CancellationToken &cancel, AlertNotifier *alerts = nullptr);

    // Main loop (blocking) - returns once Stopped
    void run();

    // Execute the current state's work and move to the next state
    LoopState step();

    LoopState state() const { return state_; }
    uint64_t check_count() const { return check_count_; }
    uint64_t recovery_count() const { return recovery_count_; }

    // Register a callback for every state change (used for logging and tests)
    void on_transition(TransitionCallback callback) { on_transition_ = std::move(callback); }

private:
    LoopState do_checking();
    LoopState do_recovering();
    LoopState do_sleeping();
    void transition(LoopState next);

    const service::ServiceDescriptor descriptor_;
    health::HealthProber &prober_;
    recovery::RecoveryController &recovery_;
    RecoveryTracker &tracker_;
    runtime::CancellationToken &cancel_;
    AlertNotifier *alerts_;

    LoopState state_ = LoopState::CHECKING;
    uint64_t check_count_ = 0;
    uint64_t recovery_count_ = 0;
    TransitionCallback on_transition_;
};

}  // namespace supervision
}  // namespace warden
