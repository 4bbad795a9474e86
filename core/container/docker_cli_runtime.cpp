#include "docker_cli_runtime.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>

#include "logging/logger.hpp"

namespace warden {
namespace container {

namespace {

std::string trim(const std::string &text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

void split_lines(const std::string &text, std::vector<std::string> &out) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out.push_back(line);
    }
}

}  // namespace

DockerCliRuntime::DockerCliRuntime(std::shared_ptr<process::ICommandRunner> runner, std::string docker_binary,
                                   int query_timeout_ms, int command_timeout_ms)
    : runner_(std::move(runner)),
      docker_binary_(std::move(docker_binary)),
      query_timeout_ms_(query_timeout_ms),
      command_timeout_ms_(command_timeout_ms) {}

bool is_no_such_container(const std::string &stderr_text) {
    return stderr_text.find("No such container") != std::string::npos ||
           stderr_text.find("No such object") != std::string::npos;
}

bool parse_container_state(const std::string &state_json, ContainerState &state, std::string &error) {
    try {
        auto j = nlohmann::json::parse(state_json);
        if (!j.is_object()) {
            error = "Unexpected inspect output (not an object)";
            return false;
        }
        state.exists = true;
        state.running = j.value("Running", false);
        state.status = j.value("Status", std::string{});
        state.started_at = j.value("StartedAt", std::string{});
        state.exit_code = j.value("ExitCode", 0);
        return true;
    } catch (const nlohmann::json::exception &e) {
        error = "Failed to parse inspect output: " + std::string(e.what());
        return false;
    }
}

bool parse_runtime_health(const std::string &state_json, health::RuntimeHealth &health, std::string &error) {
    try {
        auto j = nlohmann::json::parse(state_json);
        if (!j.is_object()) {
            error = "Unexpected inspect output (not an object)";
            return false;
        }

        if (!j.value("Running", false)) {
            health = health::RuntimeHealth::UNKNOWN;
            return true;
        }

        // A running container without a healthcheck has nothing negative to report
        auto it = j.find("Health");
        if (it == j.end() || it->is_null()) {
            health = health::RuntimeHealth::HEALTHY;
            return true;
        }

        const std::string status = it->value("Status", std::string{});
        if (status == "healthy") {
            health = health::RuntimeHealth::HEALTHY;
        } else if (status == "unhealthy") {
            health = health::RuntimeHealth::UNHEALTHY;
        } else {
            // "starting" or anything newer we do not know about
            health = health::RuntimeHealth::UNKNOWN;
        }
        return true;
    } catch (const nlohmann::json::exception &e) {
        error = "Failed to parse inspect output: " + std::string(e.what());
        return false;
    }
}

bool DockerCliRuntime::fail_from(const process::CommandResult &result, const std::string &what) {
    if (!result.started) {
        error_ = "Container runtime unavailable (" + what + "): " + result.error;
    } else if (result.timed_out) {
        error_ = what + " timed out: " + result.error;
    } else {
        std::string detail = trim(result.stderr_data);
        if (detail.empty()) {
            detail = "exit code " + std::to_string(result.exit_code);
        }
        error_ = what + " failed: " + detail;
    }
    return false;
}

bool DockerCliRuntime::inspect_state(const std::string &name, std::string &state_json, bool &found) {
    error_.clear();
    auto result = runner_->run({docker_binary_, "inspect", "--type", "container", "--format", "{{json .State}}", name},
                               query_timeout_ms_);
    if (result.started && !result.timed_out && result.exit_code != 0 && is_no_such_container(result.stderr_data)) {
        found = false;
        return true;
    }
    if (!result.ok()) {
        return fail_from(result, "docker inspect");
    }
    found = true;
    state_json = trim(result.stdout_data);
    return true;
}

bool DockerCliRuntime::inspect(const std::string &name, ContainerState &state) {
    std::string state_json;
    bool found = false;
    if (!inspect_state(name, state_json, found)) {
        return false;
    }

    state = ContainerState{};
    if (!found) {
        return true;
    }
    return parse_container_state(state_json, state, error_);
}

bool DockerCliRuntime::query_health(const std::string &name, health::RuntimeHealth &health) {
    std::string state_json;
    bool found = false;
    if (!inspect_state(name, state_json, found)) {
        return false;
    }

    if (!found) {
        health = health::RuntimeHealth::UNKNOWN;
        return true;
    }
    return parse_runtime_health(state_json, health, error_);
}

bool DockerCliRuntime::stop(const std::string &name) {
    error_.clear();
    auto result = runner_->run({docker_binary_, "stop", name}, command_timeout_ms_);
    if (result.started && !result.timed_out && result.exit_code != 0 && is_no_such_container(result.stderr_data)) {
        LOG_DEBUG("[Docker] stop: container '" << name << "' absent");
        return true;
    }
    if (!result.ok()) {
        return fail_from(result, "docker stop");
    }
    return true;
}

bool DockerCliRuntime::remove(const std::string &name) {
    error_.clear();
    auto result = runner_->run({docker_binary_, "rm", name}, command_timeout_ms_);
    if (result.started && !result.timed_out && result.exit_code != 0 && is_no_such_container(result.stderr_data)) {
        LOG_DEBUG("[Docker] rm: container '" << name << "' absent");
        return true;
    }
    if (!result.ok()) {
        return fail_from(result, "docker rm");
    }
    return true;
}

std::vector<std::string> DockerCliRuntime::build_run_args(const service::ServiceDescriptor &descriptor) const {
    std::vector<std::string> args = {docker_binary_, "run", "-d", "--name", descriptor.container_name};

    if (!descriptor.flags.restart_policy.empty()) {
        args.push_back("--restart");
        args.push_back(descriptor.flags.restart_policy);
    }

    args.push_back("-p");
    args.push_back(std::to_string(descriptor.port) + ":" + std::to_string(descriptor.container_port));

    if (!descriptor.flags.gpus.empty()) {
        args.push_back("--gpus");
        args.push_back(descriptor.flags.gpus);
    }

    for (const auto &extra : descriptor.flags.extra_args) {
        args.push_back(extra);
    }

    args.push_back(descriptor.image);
    return args;
}

bool DockerCliRuntime::run(const service::ServiceDescriptor &descriptor) {
    error_.clear();
    auto result = runner_->run(build_run_args(descriptor), command_timeout_ms_);
    if (!result.ok()) {
        return fail_from(result, "docker run");
    }
    LOG_DEBUG("[Docker] Created container " << trim(result.stdout_data));
    return true;
}

bool DockerCliRuntime::logs_tail(const std::string &name, int lines, std::vector<std::string> &out) {
    error_.clear();
    out.clear();
    auto result = runner_->run({docker_binary_, "logs", "--tail", std::to_string(lines), name}, command_timeout_ms_);
    if (!result.ok()) {
        return fail_from(result, "docker logs");
    }

    // Container stdout and stderr arrive on our stdout and stderr respectively
    split_lines(result.stdout_data, out);
    split_lines(result.stderr_data, out);
    if (lines >= 0 && out.size() > static_cast<size_t>(lines)) {
        out.erase(out.begin(), out.end() - lines);
    }
    return true;
}

}  // namespace container
}  // namespace warden
