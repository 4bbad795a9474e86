#pragma once

#include <string>
#include <vector>

#include "process/i_command_runner.hpp"

namespace warden {
namespace supervision {

// Operator notification hook: runs a configured command (e.g. `wall`) with the
// alert text as its last argument. An empty command disables notifications.
class AlertNotifier {
public:
    AlertNotifier(process::ICommandRunner &runner, std::vector<std::string> command, int timeout_ms = 5000);

    bool enabled() const { return !command_.empty(); }

    // Returns false if the command could not be run or exited non-zero.
    // Failures are logged at WARN and never propagate.
    bool notify(const std::string &message);

private:
    process::ICommandRunner &runner_;
    std::vector<std::string> command_;
    int timeout_ms_;
};

}  // namespace supervision
}  // namespace warden
