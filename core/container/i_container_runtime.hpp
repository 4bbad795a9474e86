#pragma once

#include <string>
#include <vector>

#include "health/health_types.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace container {

struct ContainerState {
    bool exists = false;
    bool running = false;
    std::string status;      // Runtime status word ("running", "exited", ...)
    std::string started_at;
    int exit_code = 0;
};

// Narrow view of a container runtime, enough to supervise one named container.
// Every call returns false only when the runtime itself failed (unreachable,
// timed out, unexpected error); last_error() then describes the failure.
class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    // Absent containers succeed with state.exists == false
    virtual bool inspect(const std::string &name, ContainerState &state) = 0;

    virtual bool query_health(const std::string &name, health::RuntimeHealth &health) = 0;

    // Idempotent: no-op on a stopped or absent container
    virtual bool stop(const std::string &name) = 0;

    // Idempotent: no-op on an absent container
    virtual bool remove(const std::string &name) = 0;

    // Create and start a container from the descriptor (image, port map, runtime flags)
    virtual bool run(const service::ServiceDescriptor &descriptor) = 0;

    virtual bool logs_tail(const std::string &name, int lines, std::vector<std::string> &out) = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace container
}  // namespace warden
