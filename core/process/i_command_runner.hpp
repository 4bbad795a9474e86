#pragma once

#include <string>
#include <vector>

namespace warden {
namespace process {

struct CommandResult {
    bool started = false;    // false if the process could not be spawned
    bool timed_out = false;  // true if the child was killed at the deadline
    int exit_code = -1;      // Valid only when started && !timed_out
    std::string stdout_data;
    std::string stderr_data;
    std::string error;       // Spawn/poll failure description

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Interface for CommandRunner to enable mocking
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Run argv[0] (resolved through PATH) and collect its output.
    // Never blocks longer than timeout_ms plus a short reap grace period.
    virtual CommandResult run(const std::vector<std::string> &argv, int timeout_ms) = 0;
};

}  // namespace process
}  // namespace warden
