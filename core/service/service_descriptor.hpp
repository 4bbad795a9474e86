#pragma once

#include <string>
#include <vector>

namespace warden {
namespace service {

// Runtime flags passed to the container runtime on create
struct RuntimeFlags {
    std::string gpus = "all";                        // --gpus value, empty disables GPU passthrough
    std::string restart_policy = "unless-stopped";   // --restart value, empty omits the flag
    std::vector<std::string> extra_args;             // Appended verbatim before the image
};

// Immutable description of the one supervised service instance.
// Built once from configuration and passed by const reference everywhere.
struct ServiceDescriptor {
    std::string container_name = "sp1-gpu";
    std::string image = "public.ecr.aws/succinct-labs/moongate:v5.0.0";
    std::string host = "127.0.0.1";  // Where the published port is probed
    int port = 3000;                 // Published (host-side) port
    int container_port = 3000;       // Port inside the container
    RuntimeFlags flags;

    int probe_timeout_ms = 5000;     // Budget for each individual sub-check
    int max_attempts = 30;           // Readiness poll attempts per recovery cycle
    int poll_interval_ms = 2000;     // Spacing between readiness polls
    int check_interval_ms = 30000;   // Sleep between supervision cycles

    // Upper bound of a readiness poll (default 60s)
    int readiness_timeout_ms() const { return max_attempts * poll_interval_ms; }
};

}  // namespace service
}  // namespace warden
