#pragma once

#include <memory>
#include <ostream>

#include "cancellation.hpp"
#include "config.hpp"
#include "container/i_container_runtime.hpp"
#include "health/health_prober.hpp"
#include "health/port_probe.hpp"
#include "install/installer.hpp"
#include "process/i_command_runner.hpp"
#include "recovery/recovery_controller.hpp"
#include "status/status_reporter.hpp"
#include "supervision/alert_notifier.hpp"
#include "supervision/recovery_tracker.hpp"
#include "supervision/supervision_loop.hpp"

namespace warden {
namespace runtime {

// Process exit codes of the CLI subcommands
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Watchdog owns the component graph for one service and maps each CLI
// subcommand onto it.
class Watchdog {
public:
    // Production wiring: CommandRunner, DockerCliRuntime, TcpPortProbe
    explicit Watchdog(const WatchdogConfig &config);

    // Injected backends (tests, alternative runtimes)
    Watchdog(const WatchdogConfig &config, std::shared_ptr<process::ICommandRunner> runner,
             std::shared_ptr<container::IContainerRuntime> container_runtime,
             std::shared_ptr<health::IPortProbe> port_probe);

    // One probe, prints the composite status. 0 if Healthy, 1 otherwise.
    int check(std::ostream &out);

    // Status table. Always 0.
    int status(std::ostream &out);

    // One forced recovery cycle. 0 on Succeeded, 1 otherwise.
    int start();

    // Supervision loop in the foreground until cancelled
    int monitor();

    // Persist + enable + start the init-system unit. 0 on success, 1 otherwise.
    int install(const install::UnitInvocation &invocation);

    // Triggers monitor()/start() to wind down
    void stop() { cancel_.cancel(); }

    CancellationToken &cancellation() { return cancel_; }
    supervision::SupervisionLoop &loop() { return *loop_; }
    const service::ServiceDescriptor &descriptor() const { return config_.service; }

private:
    void wire();

    WatchdogConfig config_;
    CancellationToken cancel_;

    std::shared_ptr<process::ICommandRunner> runner_;
    std::shared_ptr<container::IContainerRuntime> container_runtime_;
    std::shared_ptr<health::IPortProbe> port_probe_;

    std::unique_ptr<health::HealthProber> prober_;
    std::unique_ptr<recovery::RecoveryController> recovery_;
    std::unique_ptr<supervision::RecoveryTracker> tracker_;
    std::unique_ptr<supervision::AlertNotifier> alerts_;
    std::unique_ptr<supervision::SupervisionLoop> loop_;
    std::unique_ptr<status::StatusReporter> reporter_;
};

}  // namespace runtime
}  // namespace warden
