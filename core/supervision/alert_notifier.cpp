#include "alert_notifier.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace warden {
namespace supervision {

AlertNotifier::AlertNotifier(process::ICommandRunner &runner, std::vector<std::string> command, int timeout_ms)
    : runner_(runner), command_(std::move(command)), timeout_ms_(timeout_ms) {}

bool AlertNotifier::notify(const std::string &message) {
    if (!enabled()) {
        return true;
    }

    std::vector<std::string> argv = command_;
    argv.push_back(message);

    auto result = runner_.run(argv, timeout_ms_);
    if (!result.ok()) {
        std::string why = result.error;
        if (why.empty()) {
            why = "exit code " + std::to_string(result.exit_code);
        }
        LOG_WARN("[Alert] Notification via '" << command_.front() << "' failed: " << why);
        return false;
    }
    return true;
}

}  // namespace supervision
}  // namespace warden
