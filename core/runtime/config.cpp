#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "../logging/logger.hpp"

namespace warden {
namespace runtime {

namespace {

std::vector<std::string> read_string_list(const YAML::Node &node) {
    std::vector<std::string> values;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            values.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    }
    return values;
}

std::string join(const std::vector<std::string> &parts) {
    std::string out;
    for (const auto &part : parts) {
        if (!out.empty()) {
            out += " ";
        }
        out += part;
    }
    return out;
}

}  // namespace

bool validate_config(const WatchdogConfig &config, std::string &error) {
    const auto &svc = config.service;

    // Validate service descriptor
    if (svc.container_name.empty()) {
        error = "service.container_name must not be empty";
        return false;
    }
    if (svc.image.empty()) {
        error = "service.image must not be empty";
        return false;
    }
    if (svc.host.empty()) {
        error = "service.host must not be empty";
        return false;
    }
    if (svc.port < 1 || svc.port > 65535) {
        error = "service.port must be between 1 and 65535";
        return false;
    }
    if (svc.container_port < 1 || svc.container_port > 65535) {
        error = "service.container_port must be between 1 and 65535";
        return false;
    }
    if (svc.probe_timeout_ms < 100 || svc.probe_timeout_ms > 5000) {
        error = "service.probe_timeout_ms must be between 100 and 5000ms";
        return false;
    }
    if (svc.max_attempts < 1) {
        error = "service.max_attempts must be >= 1";
        return false;
    }
    if (svc.poll_interval_ms < 1) {
        error = "service.poll_interval_ms must be >= 1ms";
        return false;
    }
    if (svc.check_interval_ms < 1) {
        error = "service.check_interval_ms must be >= 1ms";
        return false;
    }

    // Validate runtime backend
    if (config.runtime.docker_binary.empty()) {
        error = "runtime.docker_binary must not be empty";
        return false;
    }
    if (config.runtime.command_timeout_ms < 1000) {
        error = "runtime.command_timeout_ms must be >= 1000ms";
        return false;
    }
    if (config.runtime.log_tail_lines < 0 || config.runtime.log_tail_lines > 10000) {
        error = "runtime.log_tail_lines must be between 0 and 10000";
        return false;
    }

    // Validate supervision settings
    if (config.supervision.tick_ms < 1) {
        error = "supervision.tick_ms must be >= 1ms";
        return false;
    }
    for (size_t i = 0; i < config.supervision.backoff_ms.size(); ++i) {
        if (config.supervision.backoff_ms[i] < 0) {
            error = "supervision.backoff_ms[" + std::to_string(i) + "] must be >= 0";
            return false;
        }
    }
    if (config.supervision.alarm_after_failures < 0) {
        error = "supervision.alarm_after_failures must be >= 0";
        return false;
    }

    // Validate Logging settings
    const auto &lvl = config.logging.level;
    if (lvl != "debug" && lvl != "info" && lvl != "warn" && lvl != "warning" && lvl != "error" &&
        lvl != "critical") {
        error = "Invalid log level: " + lvl;
        return false;
    }

    // Validate install settings
    if (config.install.unit_name.empty()) {
        error = "install.unit_name must not be empty";
        return false;
    }
    if (config.install.unit_name.find('/') != std::string::npos) {
        error = "install.unit_name must not contain '/'";
        return false;
    }
    if (config.install.unit_dir.empty()) {
        error = "install.unit_dir must not be empty";
        return false;
    }
    if (config.install.restart_sec < 0) {
        error = "install.restart_sec must be >= 0";
        return false;
    }
    if (config.install.activation_checks < 1) {
        error = "install.activation_checks must be >= 1";
        return false;
    }
    if (config.install.activation_interval_ms < 0) {
        error = "install.activation_interval_ms must be >= 0";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, WatchdogConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"service", "runtime", "supervision", "logging", "install"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load service descriptor
        if (yaml["service"]) {
            const auto &s = yaml["service"];
            auto &svc = config.service;

            if (s["container_name"]) {
                svc.container_name = s["container_name"].as<std::string>();
            }
            if (s["image"]) {
                svc.image = s["image"].as<std::string>();
            }
            if (s["host"]) {
                svc.host = s["host"].as<std::string>();
            }
            if (s["port"]) {
                svc.port = s["port"].as<int>();
                // Publish the same port inside the container unless told otherwise
                svc.container_port = svc.port;
            }
            if (s["container_port"]) {
                svc.container_port = s["container_port"].as<int>();
            }
            if (s["gpus"]) {
                svc.flags.gpus = s["gpus"].as<std::string>();
            }
            if (s["restart_policy"]) {
                svc.flags.restart_policy = s["restart_policy"].as<std::string>();
            }
            if (s["extra_args"]) {
                svc.flags.extra_args = read_string_list(s["extra_args"]);
            }
            if (s["probe_timeout_ms"]) {
                svc.probe_timeout_ms = s["probe_timeout_ms"].as<int>();
            }
            if (s["max_attempts"]) {
                svc.max_attempts = s["max_attempts"].as<int>();
            }
            if (s["poll_interval_ms"]) {
                svc.poll_interval_ms = s["poll_interval_ms"].as<int>();
            }
            if (s["check_interval_ms"]) {
                svc.check_interval_ms = s["check_interval_ms"].as<int>();
            }
        }

        // Load runtime backend config
        if (yaml["runtime"]) {
            const auto &r = yaml["runtime"];
            if (r["docker_binary"]) {
                config.runtime.docker_binary = r["docker_binary"].as<std::string>();
            }
            if (r["command_timeout_ms"]) {
                config.runtime.command_timeout_ms = r["command_timeout_ms"].as<int>();
            }
            if (r["log_tail_lines"]) {
                config.runtime.log_tail_lines = r["log_tail_lines"].as<int>();
            }
        }

        // Load supervision config
        if (yaml["supervision"]) {
            const auto &sup = yaml["supervision"];
            if (sup["tick_ms"]) {
                config.supervision.tick_ms = sup["tick_ms"].as<int>();
            }
            if (sup["backoff_ms"]) {
                config.supervision.backoff_ms.clear();  // Ensure idempotent parsing
                for (const auto &backoff : sup["backoff_ms"]) {
                    config.supervision.backoff_ms.push_back(backoff.as<int>());
                }
            }
            if (sup["alarm_after_failures"]) {
                config.supervision.alarm_after_failures = sup["alarm_after_failures"].as<int>();
            }
            if (sup["alert_command"]) {
                config.supervision.alert_command = read_string_list(sup["alert_command"]);
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["file"]) {
                config.logging.file = yaml["logging"]["file"].as<std::string>();
            }
        }

        // Load install config
        if (yaml["install"]) {
            const auto &in = yaml["install"];
            auto &install = config.install;
            if (in["unit_name"]) {
                install.unit_name = in["unit_name"].as<std::string>();
            }
            if (in["unit_dir"]) {
                install.unit_dir = in["unit_dir"].as<std::string>();
            }
            if (in["description"]) {
                install.description = in["description"].as<std::string>();
            }
            if (in["systemctl"]) {
                install.systemctl = in["systemctl"].as<std::string>();
            }
            if (in["after"]) {
                install.after = in["after"].as<std::string>();
            }
            if (in["user"]) {
                install.user = in["user"].as<std::string>();
            }
            if (in["restart_sec"]) {
                install.restart_sec = in["restart_sec"].as<int>();
            }
            if (in["log_target"]) {
                install.log_target = in["log_target"].as<std::string>();
            }
            if (in["working_directory"]) {
                install.working_directory = in["working_directory"].as<std::string>();
            }
            if (in["activation_checks"]) {
                install.activation_checks = in["activation_checks"].as<int>();
            }
            if (in["activation_interval_ms"]) {
                install.activation_interval_ms = in["activation_interval_ms"].as<int>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        const auto &svc = config.service;
        LOG_INFO("[Config] Service: " << svc.container_name << " (" << svc.image << ")");
        LOG_INFO("[Config] Port: " << svc.host << ":" << svc.port << " -> " << svc.container_port);

        std::stringstream flags_msg;
        flags_msg << "[Config] Runtime flags: gpus=" << (svc.flags.gpus.empty() ? "none" : svc.flags.gpus)
                  << ", restart=" << (svc.flags.restart_policy.empty() ? "none" : svc.flags.restart_policy);
        if (!svc.flags.extra_args.empty()) {
            flags_msg << ", extra=[" << join(svc.flags.extra_args) << "]";
        }
        LOG_INFO(flags_msg.str());

        LOG_INFO("[Config] Readiness: " << svc.max_attempts << " x " << svc.poll_interval_ms << "ms, check every "
                                        << svc.check_interval_ms << "ms");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace warden
