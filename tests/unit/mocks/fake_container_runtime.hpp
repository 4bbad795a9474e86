#pragma once

#include <string>
#include <vector>

#include "container/i_container_runtime.hpp"
#include "health/port_probe.hpp"

namespace warden::tests {

// Stateful in-memory container runtime: one container slot per fake.
// Tracks calls and supports fault injection, so recovery sequences can be
// checked end to end without a real container engine.
class FakeContainerRuntime : public container::IContainerRuntime {
public:
    // Current container state
    bool exists = false;
    bool running = false;
    health::RuntimeHealth health_after_start = health::RuntimeHealth::HEALTHY;
    health::RuntimeHealth current_health = health::RuntimeHealth::UNKNOWN;
    int polls_until_ready = 0;  // query_health calls reporting UNKNOWN after each run()

    // Fault injection
    bool fail_inspect = false;
    bool fail_stop = false;
    bool fail_remove = false;
    bool fail_run = false;

    // Call accounting
    int inspect_calls = 0;
    int health_calls = 0;
    int stop_calls = 0;
    int remove_calls = 0;
    int run_calls = 0;
    int containers_created = 0;
    std::vector<std::string> log_lines;

    bool inspect(const std::string &, container::ContainerState &state) override {
        inspect_calls++;
        if (fail_inspect) {
            error_ = "Container runtime unavailable: Cannot connect to the Docker daemon";
            return false;
        }
        state = container::ContainerState{};
        state.exists = exists;
        state.running = running;
        state.status = exists ? (running ? "running" : "exited") : "";
        return true;
    }

    bool query_health(const std::string &, health::RuntimeHealth &health) override {
        health_calls++;
        if (fail_inspect) {
            error_ = "Container runtime unavailable";
            return false;
        }
        if (!running) {
            health = health::RuntimeHealth::UNKNOWN;
            return true;
        }
        if (pending_polls_ > 0) {
            pending_polls_--;
            health = health::RuntimeHealth::UNKNOWN;
            return true;
        }
        health = current_health;
        return true;
    }

    bool stop(const std::string &) override {
        stop_calls++;
        if (fail_stop) {
            error_ = "docker stop failed: daemon error";
            return false;
        }
        running = false;
        return true;
    }

    bool remove(const std::string &) override {
        remove_calls++;
        if (fail_remove) {
            error_ = "docker rm failed: daemon error";
            return false;
        }
        if (running) {
            error_ = "You cannot remove a running container";
            return false;
        }
        exists = false;
        return true;
    }

    bool run(const service::ServiceDescriptor &) override {
        run_calls++;
        if (fail_run) {
            error_ = "docker run failed: could not select device driver \"\" with capabilities: [[gpu]]";
            return false;
        }
        if (exists) {
            error_ = "Conflict. The container name is already in use";
            return false;
        }
        exists = true;
        running = true;
        containers_created++;
        current_health = health_after_start;
        pending_polls_ = polls_until_ready;
        return true;
    }

    bool logs_tail(const std::string &, int lines, std::vector<std::string> &out) override {
        if (!exists) {
            error_ = "No such container";
            return false;
        }
        out = log_lines;
        if (lines >= 0 && out.size() > static_cast<size_t>(lines)) {
            out.erase(out.begin(), out.end() - lines);
        }
        return true;
    }

    const std::string &last_error() const override { return error_; }

private:
    std::string error_;
    int pending_polls_ = 0;
};

// Port probe that follows a FakeContainerRuntime: reachable while the container runs
class FakePortProbe : public health::IPortProbe {
public:
    explicit FakePortProbe(const FakeContainerRuntime &runtime) : runtime_(runtime) {}

    bool port_blocked = false;  // Simulate a closed port even with a running container
    int calls = 0;

    health::PortProbeResult probe(const std::string &host, int port, int) override {
        calls++;
        health::PortProbeResult r;
        r.reachable = runtime_.running && !port_blocked;
        r.detail = host + ":" + std::to_string(port) + (r.reachable ? " accepting connections" : " Connection refused");
        return r;
    }

private:
    const FakeContainerRuntime &runtime_;
};

}  // namespace warden::tests
