#pragma once

#include <memory>
#include <string>
#include <vector>

#include "i_container_runtime.hpp"
#include "process/i_command_runner.hpp"

namespace warden {
namespace container {

// IContainerRuntime backed by the docker command line client
class DockerCliRuntime : public IContainerRuntime {
public:
    // query_timeout_ms bounds inspect/health queries (probe budget),
    // command_timeout_ms bounds stop/rm/run/logs.
    DockerCliRuntime(std::shared_ptr<process::ICommandRunner> runner, std::string docker_binary,
                     int query_timeout_ms, int command_timeout_ms);

    bool inspect(const std::string &name, ContainerState &state) override;
    bool query_health(const std::string &name, health::RuntimeHealth &health) override;
    bool stop(const std::string &name) override;
    bool remove(const std::string &name) override;
    bool run(const service::ServiceDescriptor &descriptor) override;
    bool logs_tail(const std::string &name, int lines, std::vector<std::string> &out) override;

    const std::string &last_error() const override { return error_; }

    // Argument vector used for `docker run`, exposed for inspection
    std::vector<std::string> build_run_args(const service::ServiceDescriptor &descriptor) const;

private:
    // Runs `docker inspect` for .State. found=false when the container does not exist.
    bool inspect_state(const std::string &name, std::string &state_json, bool &found);
    bool fail_from(const process::CommandResult &result, const std::string &what);

    std::shared_ptr<process::ICommandRunner> runner_;
    std::string docker_binary_;
    int query_timeout_ms_;
    int command_timeout_ms_;
    std::string error_;
};

// Parse the JSON printed by `docker inspect --format '{{json .State}}'`
bool parse_container_state(const std::string &state_json, ContainerState &state, std::string &error);

// Map .State.Health of the same JSON onto RuntimeHealth
bool parse_runtime_health(const std::string &state_json, health::RuntimeHealth &health, std::string &error);

// True if docker's stderr says the object does not exist
bool is_no_such_container(const std::string &stderr_text);

}  // namespace container
}  // namespace warden
