#include "installer.hpp"

#include <errno.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"

namespace warden {
namespace install {

namespace {

constexpr int kSystemctlTimeoutMs = 30000;

bool is_permission_errno(int err) { return err == EACCES || err == EPERM || err == EROFS; }

bool mentions_permission(const std::string &text) {
    return text.find("Access denied") != std::string::npos ||
           text.find("Permission denied") != std::string::npos ||
           text.find("Interactive authentication required") != std::string::npos;
}

// systemd splits ExecStart on whitespace unless the word is quoted
std::string quote_arg(const std::string &arg) {
    if (arg.find_first_of(" \t\"\\") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string trim(const std::string &text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

const char *to_string(InstallStatus status) {
    switch (status) {
        case InstallStatus::INSTALLED:
            return "Installed";
        case InstallStatus::PERMISSION_ERROR:
            return "PermissionError";
        case InstallStatus::FAILED:
        default:
            return "Failed";
    }
}

Installer::Installer(const runtime::InstallConfig &config, process::ICommandRunner &runner)
    : config_(config), runner_(runner) {}

std::string Installer::unit_path() const { return (std::filesystem::path(config_.unit_dir) / unit_file_name()).string(); }

std::string Installer::render_unit(const service::ServiceDescriptor &descriptor,
                                   const UnitInvocation &invocation) const {
    std::ostringstream exec;
    exec << quote_arg(invocation.executable);
    if (!invocation.config_path.empty()) {
        exec << " --config " << quote_arg(invocation.config_path);
    }
    exec << " monitor";

    std::ostringstream unit;
    unit << "[Unit]\n";
    unit << "Description=" << config_.description << " (" << descriptor.container_name << ")\n";
    if (!config_.after.empty()) {
        unit << "After=" << config_.after << "\n";
        unit << "Requires=" << config_.after << "\n";
    }
    unit << "\n";
    unit << "[Service]\n";
    unit << "Type=simple\n";
    if (!config_.user.empty()) {
        unit << "User=" << config_.user << "\n";
    }
    if (!invocation.working_directory.empty()) {
        unit << "WorkingDirectory=" << invocation.working_directory << "\n";
    }
    unit << "ExecStart=" << exec.str() << "\n";
    unit << "Restart=always\n";
    unit << "RestartSec=" << config_.restart_sec << "\n";
    unit << "StandardOutput=" << config_.log_target << "\n";
    unit << "StandardError=" << config_.log_target << "\n";
    unit << "\n";
    unit << "[Install]\n";
    unit << "WantedBy=multi-user.target\n";
    return unit.str();
}

InstallResult Installer::install(const service::ServiceDescriptor &descriptor, const UnitInvocation &invocation) {
    InstallResult result;
    result.unit_path = unit_path();

    LOG_INFO("[Installer] Installing " << unit_file_name() << " for " << descriptor.container_name << "...");

    if (!write_unit(render_unit(descriptor, invocation), result)) {
        return result;
    }
    LOG_INFO("[Installer] Wrote " << result.unit_path);

    if (!systemctl({"daemon-reload"}, result)) {
        return result;
    }
    if (!systemctl({"enable", unit_file_name()}, result)) {
        return result;
    }
    // restart (not start) so a re-install picks up the rewritten unit
    if (!systemctl({"restart", unit_file_name()}, result)) {
        return result;
    }
    if (!wait_for_activation(result)) {
        return result;
    }

    result.status = InstallStatus::INSTALLED;
    LOG_INFO("[Installer] " << unit_file_name() << " installed and active");
    LOG_INFO("[Installer] Check status: " << config_.systemctl << " status " << config_.unit_name);
    LOG_INFO("[Installer] View logs: journalctl -u " << config_.unit_name << " -f");
    return result;
}

bool Installer::write_unit(const std::string &content, InstallResult &result) {
    namespace fs = std::filesystem;
    const fs::path dir(config_.unit_dir);

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            result.status = is_permission_errno(ec.value()) ? InstallStatus::PERMISSION_ERROR : InstallStatus::FAILED;
            result.error = "Cannot create " + dir.string() + ": " + ec.message();
            LOG_ERROR("[Installer] " << result.error);
            return false;
        }
    }

    if (access(dir.c_str(), W_OK) != 0) {
        int err = errno;
        result.status = is_permission_errno(err) ? InstallStatus::PERMISSION_ERROR : InstallStatus::FAILED;
        result.error = "Cannot write to " + dir.string() + ": " + std::strerror(err);
        LOG_ERROR("[Installer] " << result.error);
        return false;
    }

    // Write beside the target and rename over it: one unit, never a partial one
    const fs::path target(result.unit_path);
    const fs::path temp = target.string() + ".tmp";
    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file) {
            int err = errno;
            result.status = is_permission_errno(err) ? InstallStatus::PERMISSION_ERROR : InstallStatus::FAILED;
            result.error = "Cannot open " + temp.string() + ": " + std::strerror(err);
            LOG_ERROR("[Installer] " << result.error);
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            result.status = InstallStatus::FAILED;
            result.error = "Failed writing " + temp.string();
            LOG_ERROR("[Installer] " << result.error);
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        result.status = is_permission_errno(ec.value()) ? InstallStatus::PERMISSION_ERROR : InstallStatus::FAILED;
        result.error = "Cannot replace " + target.string() + ": " + ec.message();
        LOG_ERROR("[Installer] " << result.error);
        std::error_code ignored;
        fs::remove(temp, ignored);
        return false;
    }
    return true;
}

bool Installer::systemctl(const std::vector<std::string> &args, InstallResult &result) {
    std::vector<std::string> argv = {config_.systemctl};
    argv.insert(argv.end(), args.begin(), args.end());

    std::string command;
    for (const auto &arg : args) {
        command += (command.empty() ? "" : " ") + arg;
    }

    auto cmd = runner_.run(argv, kSystemctlTimeoutMs);
    if (cmd.ok()) {
        return true;
    }

    std::string detail = trim(cmd.stderr_data);
    if (!cmd.started || cmd.timed_out) {
        detail = cmd.error;
    } else if (detail.empty()) {
        detail = "exit code " + std::to_string(cmd.exit_code);
    }

    result.status = mentions_permission(cmd.stderr_data) ? InstallStatus::PERMISSION_ERROR : InstallStatus::FAILED;
    result.error = config_.systemctl + " " + command + " failed: " + detail;
    LOG_ERROR("[Installer] " << result.error);
    return false;
}

bool Installer::wait_for_activation(InstallResult &result) {
    std::string state;
    for (int check = 1; check <= config_.activation_checks; ++check) {
        // is-active exits non-zero while activating; only the printed state matters
        auto cmd = runner_.run({config_.systemctl, "is-active", unit_file_name()}, kSystemctlTimeoutMs);
        if (!cmd.started || cmd.timed_out) {
            result.status = InstallStatus::FAILED;
            result.error = config_.systemctl + " is-active failed: " + cmd.error;
            LOG_ERROR("[Installer] " << result.error);
            return false;
        }

        state = trim(cmd.stdout_data);
        if (state == "active") {
            return true;
        }
        LOG_DEBUG("[Installer] " << unit_file_name() << " is " << state << " (check " << check << "/"
                                 << config_.activation_checks << ")");
        if (check < config_.activation_checks) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.activation_interval_ms));
        }
    }

    result.status = InstallStatus::FAILED;
    result.error = unit_file_name() + " did not become active (last state: " + (state.empty() ? "unknown" : state) + ")";
    LOG_ERROR("[Installer] " << result.error);
    return false;
}

}  // namespace install
}  // namespace warden
