#pragma once

#include <string>
#include <vector>

#include "../service/service_descriptor.hpp"

namespace warden {
namespace runtime {

// Container runtime backend settings (runtime: in YAML)
struct ContainerRuntimeConfig {
    std::string docker_binary = "docker";  // Resolved through PATH
    int command_timeout_ms = 120000;       // Bound for stop/rm/run/logs (run may pull the image)
    int log_tail_lines = 10;               // Lines shown by the status report
};

struct SupervisionConfig {
    int tick_ms = 200;                        // Cancellation poll tick while sleeping
    std::vector<int> backoff_ms;              // Extra sleep after consecutive failures (empty = none)
    int alarm_after_failures = 0;             // Consecutive failures before a CRITICAL alarm (0 = off)
    std::vector<std::string> alert_command = {"wall"};  // Operator notification command, empty disables
};

struct LoggingConfig {
    std::string level = "info";                            // debug, info, warn, error, critical
    std::string file = "/var/log/moongate_monitor.log";    // Append-only log, empty disables
};

struct InstallConfig {
    std::string unit_name = "moongate-monitor";
    std::string unit_dir = "/etc/systemd/system";
    std::string description = "Moongate Health Monitor for SP1 CUDA";
    std::string systemctl = "systemctl";
    std::string after = "docker.service";  // Also used for Requires=
    std::string user = "root";
    int restart_sec = 10;
    std::string log_target = "journal";    // StandardOutput/StandardError target
    std::string working_directory;         // Empty = current directory at install time
    int activation_checks = 10;            // is-active polls before giving up
    int activation_interval_ms = 500;
};

struct WatchdogConfig {
    service::ServiceDescriptor service;
    ContainerRuntimeConfig runtime;
    SupervisionConfig supervision;
    LoggingConfig logging;
    InstallConfig install;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, WatchdogConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const WatchdogConfig &config, std::string &error);

}  // namespace runtime
}  // namespace warden
