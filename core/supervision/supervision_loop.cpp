#include "supervision_loop.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "logging/logger.hpp"

namespace warden {
namespace supervision {

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

}  // namespace

const char *to_string(LoopState state) {
    switch (state) {
        case LoopState::CHECKING:
            return "Checking";
        case LoopState::RECOVERING:
            return "Recovering";
        case LoopState::SLEEPING:
            return "Sleeping";
        case LoopState::STOPPED:
            return "Stopped";
        default:
            return "Unknown";
    }
}

SupervisionLoop::SupervisionLoop(const service::ServiceDescriptor &descriptor, health::HealthProber &prober,
                                 recovery::RecoveryController &recovery, RecoveryTracker &tracker,
                                 runtime::CancellationToken &cancel, AlertNotifier *alerts)
    : descriptor_(descriptor),
      prober_(prober),
      recovery_(recovery),
      tracker_(tracker),
      cancel_(cancel),
      alerts_(alerts) {}

void SupervisionLoop::run() {
    LOG_INFO("[Monitor] Starting health monitoring of " << descriptor_.container_name << " (every "
                                                        << descriptor_.check_interval_ms << "ms)");

    while (state_ != LoopState::STOPPED) {
        step();
    }

    LOG_INFO("[Monitor] Monitoring stopped after " << check_count_ << " check(s), " << recovery_count_
                                                   << " recovery cycle(s)");
}

LoopState SupervisionLoop::step() {
    LoopState next = LoopState::STOPPED;
    switch (state_) {
        case LoopState::CHECKING:
            next = do_checking();
            break;
        case LoopState::RECOVERING:
            next = do_recovering();
            break;
        case LoopState::SLEEPING:
            next = do_sleeping();
            break;
        case LoopState::STOPPED:
            return state_;
    }
    transition(next);
    return state_;
}

void SupervisionLoop::transition(LoopState next) {
    if (next == state_) {
        return;
    }
    LoopState prev = state_;
    state_ = next;
    LOG_DEBUG("[Monitor] " << to_string(prev) << " -> " << to_string(next));
    if (on_transition_) {
        on_transition_(prev, next);
    }
}

LoopState SupervisionLoop::do_checking() {
    if (cancel_.is_cancelled()) {
        return LoopState::STOPPED;
    }

    check_count_++;
    auto signal = prober_.probe(descriptor_);
    health::HealthProber::log_signal(descriptor_, signal);

    auto status = health::composite_of(signal);
    if (status == health::CompositeStatus::HEALTHY) {
        tracker_.record_success();
        return LoopState::SLEEPING;
    }

    LOG_WARN("[Monitor] Health check failed (" << health::to_string(status) << ") - attempting restart...");
    return LoopState::RECOVERING;
}

LoopState SupervisionLoop::do_recovering() {
    if (cancel_.is_cancelled()) {
        return LoopState::STOPPED;
    }

    recovery_count_++;
    auto attempt = recovery_.recover(descriptor_);

    switch (attempt.outcome) {
        case recovery::RecoveryOutcome::SUCCEEDED:
            LOG_INFO("[Monitor] " << descriptor_.container_name << " restored successfully after "
                                  << attempt.attempts << " readiness poll(s) (" << attempt.elapsed.count() << "ms)");
            tracker_.record_success();
            if (alerts_ != nullptr) {
                alerts_->notify(descriptor_.container_name + " service was restarted at " +
                                format_time(attempt.start_time));
            }
            return LoopState::SLEEPING;

        case recovery::RecoveryOutcome::CANCELLED:
            return LoopState::STOPPED;

        case recovery::RecoveryOutcome::TIMED_OUT:
        case recovery::RecoveryOutcome::RUNTIME_ERROR:
        default: {
            std::string reason = recovery::to_string(attempt.outcome);
            if (!attempt.error.empty()) {
                reason += ": " + attempt.error;
            }
            LOG_CRITICAL("[Monitor] Failed to restart " << descriptor_.container_name << " (" << reason << ", "
                                                        << attempt.attempts << " readiness poll(s))");
            if (alerts_ != nullptr) {
                alerts_->notify("CRITICAL: " + descriptor_.container_name + " service restart failed at " +
                                format_time(attempt.start_time));
            }

            if (tracker_.record_failure()) {
                LOG_CRITICAL("[Monitor] " << descriptor_.container_name << " has failed "
                                          << tracker_.consecutive_failures()
                                          << " consecutive recovery cycles - operator attention required");
            }
            return LoopState::SLEEPING;
        }
    }
}

LoopState SupervisionLoop::do_sleeping() {
    auto wait = std::chrono::milliseconds(descriptor_.check_interval_ms);
    int backoff_ms = tracker_.get_backoff_ms();
    if (backoff_ms > 0) {
        LOG_INFO("[Monitor] Backing off " << backoff_ms << "ms after " << tracker_.consecutive_failures()
                                          << " consecutive failure(s)");
        wait += std::chrono::milliseconds(backoff_ms);
    }

    if (cancel_.wait_for(wait)) {
        return LoopState::STOPPED;
    }
    return LoopState::CHECKING;
}

}  // namespace supervision
}  // namespace warden
