#include "health_prober.hpp"

#include "logging/logger.hpp"

namespace warden {
namespace health {

HealthProber::HealthProber(container::IContainerRuntime &runtime, IPortProbe &port_probe)
    : runtime_(runtime), port_probe_(port_probe) {}

HealthSignal HealthProber::probe(const service::ServiceDescriptor &descriptor) {
    HealthSignal signal;

    // Check 1: container running
    container::ContainerState state;
    if (runtime_.inspect(descriptor.container_name, state)) {
        signal.container_running = state.running;
        if (!state.exists) {
            signal.container_detail = "absent";
        } else {
            signal.container_detail = state.status.empty() ? (state.running ? "running" : "stopped") : state.status;
        }
    } else {
        signal.runtime_unavailable = true;
        signal.container_detail = runtime_.last_error();
        LOG_ERROR("[Prober] Container runtime unavailable: " << runtime_.last_error());
    }

    // Check 2: port reachable
    auto port = port_probe_.probe(descriptor.host, descriptor.port, descriptor.probe_timeout_ms);
    signal.port_reachable = port.reachable;
    signal.port_detail = port.detail;

    // Check 3: runtime health, only meaningful for a running container
    if (signal.container_running) {
        RuntimeHealth health = RuntimeHealth::UNKNOWN;
        if (runtime_.query_health(descriptor.container_name, health)) {
            signal.runtime_health = health;
            signal.health_detail = to_string(health);
        } else {
            signal.runtime_health = RuntimeHealth::UNKNOWN;
            signal.health_detail = runtime_.last_error();
            LOG_WARN("[Prober] Health query failed: " << runtime_.last_error());
        }
    } else {
        signal.health_detail = "not running";
    }

    LOG_DEBUG("[Prober] " << descriptor.container_name << ": running=" << signal.container_running
                          << " port=" << signal.port_reachable << " health=" << to_string(signal.runtime_health)
                          << " -> " << to_string(composite_of(signal)));
    return signal;
}

void HealthProber::log_signal(const service::ServiceDescriptor &descriptor, const HealthSignal &signal) {
    const auto status = composite_of(signal);
    if (status == CompositeStatus::HEALTHY) {
        LOG_INFO("[Prober] " << descriptor.container_name << " health check passed");
        return;
    }

    if (!signal.container_running) {
        LOG_ERROR("[Prober] Container " << descriptor.container_name << " is not running ("
                                        << signal.container_detail << ")");
    }
    if (!signal.port_reachable) {
        LOG_ERROR("[Prober] Port " << descriptor.port << " is not accessible (" << signal.port_detail << ")");
    }
    if (signal.container_running && signal.runtime_health != RuntimeHealth::HEALTHY) {
        LOG_ERROR("[Prober] Container reports " << to_string(signal.runtime_health) << " status ("
                                                << signal.health_detail << ")");
    }
}

}  // namespace health
}  // namespace warden
