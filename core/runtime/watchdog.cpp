#include "watchdog.hpp"

#include <chrono>
#include <utility>

#include "container/docker_cli_runtime.hpp"
#include "logging/logger.hpp"
#include "process/command_runner.hpp"

namespace warden {
namespace runtime {

Watchdog::Watchdog(const WatchdogConfig &config)
    : config_(config), cancel_(std::chrono::milliseconds(config.supervision.tick_ms)) {
    runner_ = std::make_shared<process::CommandRunner>();
    container_runtime_ = std::make_shared<container::DockerCliRuntime>(
        runner_, config_.runtime.docker_binary, config_.service.probe_timeout_ms, config_.runtime.command_timeout_ms);
    port_probe_ = std::make_shared<health::TcpPortProbe>();
    wire();
}

Watchdog::Watchdog(const WatchdogConfig &config, std::shared_ptr<process::ICommandRunner> runner,
                   std::shared_ptr<container::IContainerRuntime> container_runtime,
                   std::shared_ptr<health::IPortProbe> port_probe)
    : config_(config),
      cancel_(std::chrono::milliseconds(config.supervision.tick_ms)),
      runner_(std::move(runner)),
      container_runtime_(std::move(container_runtime)),
      port_probe_(std::move(port_probe)) {
    wire();
}

void Watchdog::wire() {
    prober_ = std::make_unique<health::HealthProber>(*container_runtime_, *port_probe_);

    recovery_ = std::make_unique<recovery::RecoveryController>(*container_runtime_, *prober_);
    recovery_->set_cancellation(&cancel_);

    tracker_ = std::make_unique<supervision::RecoveryTracker>(config_.supervision.backoff_ms,
                                                              config_.supervision.alarm_after_failures);
    alerts_ = std::make_unique<supervision::AlertNotifier>(*runner_, config_.supervision.alert_command);

    loop_ = std::make_unique<supervision::SupervisionLoop>(config_.service, *prober_, *recovery_, *tracker_, cancel_,
                                                           alerts_.get());
    loop_->on_transition([](supervision::LoopState from, supervision::LoopState to) {
        if (to == supervision::LoopState::STOPPED) {
            LOG_INFO("[Watchdog] Cancellation observed in " << supervision::to_string(from) << " state");
        }
    });

    reporter_ = std::make_unique<status::StatusReporter>(*container_runtime_, *prober_, config_.runtime.log_tail_lines);
}

int Watchdog::check(std::ostream &out) {
    auto signal = prober_->probe(config_.service);
    health::HealthProber::log_signal(config_.service, signal);

    auto status = health::composite_of(signal);
    out << health::to_string(status) << "\n";
    return status == health::CompositeStatus::HEALTHY ? kExitOk : kExitFailure;
}

int Watchdog::status(std::ostream &out) {
    auto report = reporter_->status(config_.service);
    status::StatusReporter::render(config_.service, report, out);
    return kExitOk;
}

int Watchdog::start() {
    auto attempt = recovery_->recover(config_.service);
    if (attempt.outcome == recovery::RecoveryOutcome::SUCCEEDED) {
        LOG_INFO("[Watchdog] " << config_.service.container_name << " is up (" << attempt.elapsed.count() << "ms)");
        return kExitOk;
    }

    LOG_ERROR("[Watchdog] Recovery of " << config_.service.container_name << " ended "
                                        << recovery::to_string(attempt.outcome)
                                        << (attempt.error.empty() ? "" : ": " + attempt.error));
    return kExitFailure;
}

int Watchdog::monitor() {
    loop_->run();
    return kExitOk;
}

int Watchdog::install(const install::UnitInvocation &invocation) {
    install::Installer installer(config_.install, *runner_);
    auto result = installer.install(config_.service, invocation);
    if (result.status == install::InstallStatus::INSTALLED) {
        return kExitOk;
    }

    if (result.status == install::InstallStatus::PERMISSION_ERROR) {
        LOG_ERROR("[Watchdog] Installing requires root privileges (run with sudo): " << result.error);
    }
    return kExitFailure;
}

}  // namespace runtime
}  // namespace warden
