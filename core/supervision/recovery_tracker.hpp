#pragma once

#include <vector>

namespace warden {
namespace supervision {

// RecoveryTracker counts consecutive failed recovery cycles for the supervised
// service. It implements the optional escalating backoff and the
// max-consecutive-failure alarm; with an empty schedule and a zero threshold it
// never changes the loop's cadence.
class RecoveryTracker {
public:
    RecoveryTracker(std::vector<int> backoff_ms, int alarm_after_failures);

    // Record a failed recovery cycle (TimedOut or RuntimeError).
    // Returns true when this failure reaches the alarm threshold; fires once per streak.
    bool record_failure();

    // Record a successful recovery or a healthy check - ends the failure streak
    void record_success();

    // Extra delay to add to the next sleep.
    // Returns 0 when no failures are pending or no schedule is configured.
    int get_backoff_ms() const;

    int consecutive_failures() const { return consecutive_failures_; }
    int total_failures() const { return total_failures_; }
    bool alarm_raised() const { return alarm_raised_; }

private:
    std::vector<int> backoff_ms_;
    int alarm_after_failures_;

    int consecutive_failures_ = 0;  // Failed cycles since the last success
    int total_failures_ = 0;
    bool alarm_raised_ = false;     // Alarm already fired for the current streak
};

}  // namespace supervision
}  // namespace warden
