#include "recovery_tracker.hpp"

#include <algorithm>
#include <utility>

#include "logging/logger.hpp"

namespace warden {
namespace supervision {

RecoveryTracker::RecoveryTracker(std::vector<int> backoff_ms, int alarm_after_failures)
    : backoff_ms_(std::move(backoff_ms)), alarm_after_failures_(alarm_after_failures) {}

bool RecoveryTracker::record_failure() {
    consecutive_failures_++;
    total_failures_++;

    if (alarm_after_failures_ > 0 && !alarm_raised_ && consecutive_failures_ >= alarm_after_failures_) {
        alarm_raised_ = true;
        return true;
    }
    return false;
}

void RecoveryTracker::record_success() {
    if (consecutive_failures_ > 0) {
        LOG_INFO("[Tracker] Service recovered after " << consecutive_failures_ << " failed recovery cycle(s)");
    }

    consecutive_failures_ = 0;
    alarm_raised_ = false;
}

int RecoveryTracker::get_backoff_ms() const {
    if (consecutive_failures_ == 0 || backoff_ms_.empty()) {
        return 0;
    }

    // The last entry repeats once the schedule is exhausted
    size_t index = std::min(static_cast<size_t>(consecutive_failures_), backoff_ms_.size()) - 1;
    return backoff_ms_[index];
}

}  // namespace supervision
}  // namespace warden
