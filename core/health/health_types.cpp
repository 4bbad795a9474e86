#include "health_types.hpp"

namespace warden {
namespace health {

CompositeStatus composite_of(const HealthSignal &signal) {
    if (!signal.container_running) {
        return CompositeStatus::DOWN;
    }
    if (signal.port_reachable && signal.runtime_health == RuntimeHealth::HEALTHY) {
        return CompositeStatus::HEALTHY;
    }
    return CompositeStatus::DEGRADED;
}

const char *to_string(CompositeStatus status) {
    switch (status) {
        case CompositeStatus::HEALTHY:
            return "Healthy";
        case CompositeStatus::DEGRADED:
            return "Degraded";
        case CompositeStatus::DOWN:
            return "Down";
        default:
            return "Unknown";
    }
}

const char *to_string(RuntimeHealth health) {
    switch (health) {
        case RuntimeHealth::HEALTHY:
            return "Healthy";
        case RuntimeHealth::UNHEALTHY:
            return "Unhealthy";
        case RuntimeHealth::UNKNOWN:
        default:
            return "Unknown";
    }
}

}  // namespace health
}  // namespace warden
