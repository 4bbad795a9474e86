#pragma once

#include "container/i_container_runtime.hpp"
#include "health_types.hpp"
#include "port_probe.hpp"
#include "service/service_descriptor.hpp"

namespace warden {
namespace health {

// HealthProber runs the three atomic checks against one service:
// - container running (runtime inspect)
// - published port reachable (TCP connect)
// - runtime-reported health (container healthcheck)
// Each sub-check is bounded by descriptor.probe_timeout_ms. A failing sub-check
// turns into a negative signal for its axis, never into an error of probe().
class HealthProber {
public:
    HealthProber(container::IContainerRuntime &runtime, IPortProbe &port_probe);

    HealthSignal probe(const service::ServiceDescriptor &descriptor);

    // Log each negative axis at ERROR, or one INFO line when everything passed
    static void log_signal(const service::ServiceDescriptor &descriptor, const HealthSignal &signal);

private:
    container::IContainerRuntime &runtime_;
    IPortProbe &port_probe_;
};

}  // namespace health
}  // namespace warden
