#pragma once

#include <string>
#include <vector>

#include "process/i_command_runner.hpp"
#include "runtime/config.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace install {

enum class InstallStatus {
    INSTALLED,         // Unit written, enabled, started and reported active
    PERMISSION_ERROR,  // Caller may not write or register init-system units
    FAILED             // Any other failure (systemctl error, activation never confirmed)
};

const char *to_string(InstallStatus status);

struct InstallResult {
    InstallStatus status = InstallStatus::FAILED;
    std::string unit_path;
    std::string error;
};

// How the init system should start the watchdog
struct UnitInvocation {
    std::string executable;         // Absolute path of the watchdog binary
    std::string config_path;        // Absolute config path, empty = built-in defaults
    std::string working_directory;
};

// Installer persists a systemd unit that keeps the supervision loop running
// across crashes and reboots, then enables and starts it. Re-running it
// overwrites the same unit file.
class Installer {
public:
    Installer(const runtime::InstallConfig &config, process::ICommandRunner &runner);

    InstallResult install(const service::ServiceDescriptor &descriptor, const UnitInvocation &invocation);

    // Full text of the unit file
    std::string render_unit(const service::ServiceDescriptor &descriptor, const UnitInvocation &invocation) const;

    // <unit_dir>/<unit_name>.service
    std::string unit_path() const;
    std::string unit_file_name() const { return config_.unit_name + ".service"; }

private:
    bool write_unit(const std::string &content, InstallResult &result);
    bool systemctl(const std::vector<std::string> &args, InstallResult &result);
    bool wait_for_activation(InstallResult &result);

    runtime::InstallConfig config_;
    process::ICommandRunner &runner_;
};

}  // namespace install
}  // namespace warden
