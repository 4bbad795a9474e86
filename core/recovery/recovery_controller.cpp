#include "recovery_controller.hpp"

#include "logging/logger.hpp"

namespace warden {
namespace recovery {

const char *to_string(RecoveryOutcome outcome) {
    switch (outcome) {
        case RecoveryOutcome::SUCCEEDED:
            return "Succeeded";
        case RecoveryOutcome::TIMED_OUT:
            return "TimedOut";
        case RecoveryOutcome::RUNTIME_ERROR:
            return "RuntimeError";
        case RecoveryOutcome::CANCELLED:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

RecoveryController::RecoveryController(container::IContainerRuntime &runtime, health::HealthProber &prober)
    : runtime_(runtime), prober_(prober) {}

RecoveryAttempt RecoveryController::recover(const service::ServiceDescriptor &descriptor) {
    RecoveryAttempt attempt;
    attempt.start_time = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();
    const std::string &name = descriptor.container_name;

    auto finish = [&](RecoveryOutcome outcome) {
        attempt.outcome = outcome;
        attempt.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        return attempt;
    };

    if (cancelled()) {
        LOG_WARN("[Recovery] Shutdown requested, skipping recovery of " << name);
        return finish(RecoveryOutcome::CANCELLED);
    }

    LOG_INFO("[Recovery] Starting/restarting " << name << "...");

    // From here on the sequence runs to the end of create so the container is
    // never left half-recreated.
    if (!teardown(descriptor, attempt)) {
        return finish(RecoveryOutcome::RUNTIME_ERROR);
    }

    LOG_INFO("[Recovery] Starting new container " << name << " (" << descriptor.image << ")");
    if (!runtime_.run(descriptor)) {
        attempt.error = runtime_.last_error();
        LOG_ERROR("[Recovery] Failed to start container " << name << ": " << attempt.error);
        return finish(RecoveryOutcome::RUNTIME_ERROR);
    }
    LOG_INFO("[Recovery] Container " << name << " started, waiting for readiness");

    await_ready(descriptor, attempt);
    return finish(attempt.outcome);
}

bool RecoveryController::teardown(const service::ServiceDescriptor &descriptor, RecoveryAttempt &attempt) {
    const std::string &name = descriptor.container_name;

    container::ContainerState state;
    if (!runtime_.inspect(name, state)) {
        attempt.error = runtime_.last_error();
        LOG_ERROR("[Recovery] Cannot inspect " << name << ": " << attempt.error);
        return false;
    }

    if (!state.exists) {
        LOG_DEBUG("[Recovery] No existing container " << name);
        return true;
    }

    if (state.running) {
        LOG_INFO("[Recovery] Stopping existing container " << name << "...");
    }
    if (!runtime_.stop(name)) {
        attempt.error = runtime_.last_error();
        LOG_ERROR("[Recovery] Failed to stop " << name << ": " << attempt.error);
        return false;
    }

    LOG_INFO("[Recovery] Removing existing container " << name << "...");
    if (!runtime_.remove(name)) {
        attempt.error = runtime_.last_error();
        LOG_ERROR("[Recovery] Failed to remove " << name << ": " << attempt.error);
        return false;
    }
    return true;
}

void RecoveryController::await_ready(const service::ServiceDescriptor &descriptor, RecoveryAttempt &attempt) {
    runtime::CancellationToken &token = cancel_ != nullptr ? *cancel_ : never_cancelled_;
    const auto interval = std::chrono::milliseconds(descriptor.poll_interval_ms);

    while (attempt.attempts < descriptor.max_attempts) {
        attempt.attempts++;
        auto signal = prober_.probe(descriptor);
        if (health::composite_of(signal) == health::CompositeStatus::HEALTHY) {
            LOG_INFO("[Recovery] " << descriptor.container_name << " is ready and accessible (attempt "
                                   << attempt.attempts << "/" << descriptor.max_attempts << ")");
            attempt.outcome = RecoveryOutcome::SUCCEEDED;
            return;
        }

        if (attempt.attempts >= descriptor.max_attempts) {
            break;
        }
        if (token.wait_for(interval)) {
            LOG_WARN("[Recovery] Shutdown requested during readiness poll of " << descriptor.container_name);
            attempt.outcome = RecoveryOutcome::CANCELLED;
            return;
        }
    }

    LOG_ERROR("[Recovery] " << descriptor.container_name << " failed to become ready within "
                            << descriptor.readiness_timeout_ms() / 1000 << " seconds");
    attempt.outcome = RecoveryOutcome::TIMED_OUT;
}

}  // namespace recovery
}  // namespace warden
