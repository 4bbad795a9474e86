#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "container/i_container_runtime.hpp"
#include "health/health_prober.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace status {

struct StatusReport {
    health::CompositeStatus composite = health::CompositeStatus::DOWN;
    health::HealthSignal signal;

    bool container_exists = false;
    std::string container_status;  // Runtime status word, or the inspect error
    std::string image;

    bool logs_available = false;
    std::vector<std::string> log_tail;
};

// StatusReporter answers one-shot status queries. It runs its own probe and
// never reads state from a running supervision loop, so it is safe to call
// while one is active.
class StatusReporter {
public:
    StatusReporter(container::IContainerRuntime &runtime, health::HealthProber &prober, int log_tail_lines);

    StatusReport status(const service::ServiceDescriptor &descriptor);

    // Human-readable table for operators
    static void render(const service::ServiceDescriptor &descriptor, const StatusReport &report, std::ostream &out);

private:
    container::IContainerRuntime &runtime_;
    health::HealthProber &prober_;
    int log_tail_lines_;
};

}  // namespace status
}  // namespace warden
