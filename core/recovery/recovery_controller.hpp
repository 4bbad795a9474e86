#pragma once

#include <chrono>
#include <string>

#include "container/i_container_runtime.hpp"
#include "health/health_prober.hpp"
#include "runtime/cancellation.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace recovery {

enum class RecoveryOutcome {
    SUCCEEDED,      // Fully healthy read within the readiness budget
    TIMED_OUT,      // Readiness attempts exhausted
    RUNTIME_ERROR,  // A container runtime call failed
    CANCELLED       // Shutdown observed before teardown or during the readiness poll
};

const char *to_string(RecoveryOutcome outcome);

// Record of one recovery cycle. Logged, never persisted.
struct RecoveryAttempt {
    std::chrono::system_clock::time_point start_time;
    RecoveryOutcome outcome = RecoveryOutcome::RUNTIME_ERROR;
    int attempts = 0;                    // Readiness probes consumed
    std::chrono::milliseconds elapsed{0};
    std::string error;                   // Runtime failure description (RUNTIME_ERROR only)
};

// RecoveryController performs stop -> remove -> recreate -> readiness poll.
// Callers must not run two recoveries for the same service concurrently.
class RecoveryController {
public:
    RecoveryController(container::IContainerRuntime &runtime, health::HealthProber &prober);

    // Observe cancellation between steps and during the readiness poll.
    // Without a token the readiness poll waits uninterrupted.
    void set_cancellation(runtime::CancellationToken *token) { cancel_ = token; }

    RecoveryAttempt recover(const service::ServiceDescriptor &descriptor);

private:
    bool teardown(const service::ServiceDescriptor &descriptor, RecoveryAttempt &attempt);
    void await_ready(const service::ServiceDescriptor &descriptor, RecoveryAttempt &attempt);
    bool cancelled() const { return cancel_ != nullptr && cancel_->is_cancelled(); }

    container::IContainerRuntime &runtime_;
    health::HealthProber &prober_;
    runtime::CancellationToken *cancel_ = nullptr;
    runtime::CancellationToken never_cancelled_;
};

}  // namespace recovery
}  // namespace warden
