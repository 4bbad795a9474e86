#include "status_reporter.hpp"

#include <iomanip>

#include "logging/logger.hpp"

namespace warden {
namespace status {

namespace {

void row(std::ostream &out, const std::string &label, bool ok, const std::string &value) {
    out << "  " << (ok ? "[ OK ]" : "[FAIL]") << " " << std::left << std::setw(16) << label << value << "\n";
}

}  // namespace

StatusReporter::StatusReporter(container::IContainerRuntime &runtime, health::HealthProber &prober,
                               int log_tail_lines)
    : runtime_(runtime), prober_(prober), log_tail_lines_(log_tail_lines) {}

StatusReport StatusReporter::status(const service::ServiceDescriptor &descriptor) {
    StatusReport report;
    report.image = descriptor.image;

    report.signal = prober_.probe(descriptor);
    report.composite = health::composite_of(report.signal);

    container::ContainerState state;
    if (runtime_.inspect(descriptor.container_name, state)) {
        report.container_exists = state.exists;
        report.container_status = state.exists ? state.status : "absent";
    } else {
        report.container_status = runtime_.last_error();
    }

    if (report.container_exists && log_tail_lines_ > 0) {
        if (runtime_.logs_tail(descriptor.container_name, log_tail_lines_, report.log_tail)) {
            report.logs_available = true;
        } else {
            LOG_DEBUG("[Status] No logs for " << descriptor.container_name << ": " << runtime_.last_error());
        }
    }

    return report;
}

void StatusReporter::render(const service::ServiceDescriptor &descriptor, const StatusReport &report,
                            std::ostream &out) {
    const auto &sig = report.signal;

    out << "=== " << descriptor.container_name << " Service Status ===\n";
    row(out, "Container:", sig.container_running, sig.container_running ? "Running" : "Not running");
    row(out, "Exists:", report.container_exists,
        report.container_exists ? "yes (" + report.container_status + ")" : "no (" + report.container_status + ")");
    row(out, "Port " + std::to_string(descriptor.port) + ":", sig.port_reachable,
        std::string(sig.port_reachable ? "Accessible" : "Not accessible") + " - " + sig.port_detail);
    row(out, "Health:", sig.runtime_health == health::RuntimeHealth::HEALTHY,
        std::string(health::to_string(sig.runtime_health)) +
            (sig.health_detail.empty() ? "" : " - " + sig.health_detail));
    row(out, "Overall:", report.composite == health::CompositeStatus::HEALTHY, health::to_string(report.composite));

    out << "\nContainer details:\n";
    out << "  Name:   " << descriptor.container_name << "\n";
    out << "  Image:  " << report.image << "\n";
    out << "  Ports:  " << descriptor.host << ":" << descriptor.port << " -> " << descriptor.container_port << "\n";

    out << "\nRecent logs:\n";
    if (!report.logs_available || report.log_tail.empty()) {
        out << "  No logs available\n";
        return;
    }
    for (const auto &line : report.log_tail) {
        out << "  " << line << "\n";
    }
}

}  // namespace status
}  // namespace warden
