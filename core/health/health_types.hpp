#pragma once

#include <string>

namespace warden {
namespace health {

// Health as reported by the container runtime's own healthcheck
enum class RuntimeHealth { HEALTHY, UNHEALTHY, UNKNOWN };

// Derived three-valued summary of a HealthSignal
enum class CompositeStatus { HEALTHY, DEGRADED, DOWN };

// Result of one probe cycle. Recomputed every time, never persisted.
struct HealthSignal {
    bool container_running = false;
    bool port_reachable = false;
    RuntimeHealth runtime_health = RuntimeHealth::UNKNOWN;

    // Per-axis detail for operators ("connection refused", "timed out after 5000ms", ...)
    std::string container_detail;
    std::string port_detail;
    std::string health_detail;

    // True when the container runtime itself could not be reached
    bool runtime_unavailable = false;
};

// HEALTHY iff all three signals are positive, DOWN iff the container is not running,
// DEGRADED otherwise.
CompositeStatus composite_of(const HealthSignal &signal);

const char *to_string(CompositeStatus status);
const char *to_string(RuntimeHealth health);

}  // namespace health
}  // namespace warden
