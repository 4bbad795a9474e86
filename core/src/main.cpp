// Warden service watchdog
// Keeps one containerized GPU service alive: check, status, start, monitor, install

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <string>
#include "runtime/watchdog.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

namespace
{

    void print_usage(std::ostream &out)
    {
        out << "Warden - container service health monitor & auto-restart\n\n";
        out << "Usage: warden [OPTIONS] COMMAND\n\n";
        out << "Commands:\n";
        out << "  check      Run a single health check (exit 0 if Healthy)\n";
        out << "  status     Show service status and recent container logs\n";
        out << "  start      Start/recreate the service container\n";
        out << "  monitor    Run continuous monitoring in the foreground\n";
        out << "  install    Install and start the watchdog as a systemd service\n\n";
        out << "Options:\n";
        out << "  --config=PATH    Path to config file (default: built-in settings)\n";
        out << "  --help, -h       Show this help\n";
    }

    std::string self_executable(const char *argv0)
    {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec)
        {
            return self.string();
        }
        return std::filesystem::absolute(argv0, ec).string();
    }

} // namespace

int main(int argc, char **argv)
{
    using warden::runtime::kExitFailure;
    using warden::runtime::kExitUsage;

    // Parse CLI arguments
    std::string config_path;
    std::string command;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage(std::cout);
            return 0;
        }
        else if (command.empty() && !arg.empty() && arg[0] != '-')
        {
            command = arg;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return kExitUsage;
        }
    }

    if (command != "check" && command != "status" && command != "start" && command != "monitor" &&
        command != "install")
    {
        if (!command.empty())
        {
            std::cerr << "Unknown command: " << command << "\n\n";
        }
        print_usage(std::cerr);
        return kExitUsage;
    }

    // Load configuration
    warden::runtime::WatchdogConfig config;
    std::string error;

    if (!config_path.empty())
    {
        // Check if config exists
        if (!std::filesystem::exists(config_path))
        {
            // Using cerr here as logger might not be configured
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return kExitFailure;
        }

        if (!warden::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " + error);
            return kExitFailure;
        }
    }

    // Initialize logger level and file sink
    warden::logging::Logger::init(warden::logging::string_to_level(config.logging.level));

    if (!config.logging.file.empty())
    {
        if (!warden::logging::Logger::open_file(config.logging.file, error))
        {
            if (command == "monitor")
            {
                LOG_ERROR(error);
                return kExitFailure;
            }
            // One-shot commands still work for unprivileged operators
            LOG_WARN(error << " (logging to stderr only)");
        }
    }

    warden::runtime::Watchdog watchdog(config);

    // Install signal handler for graceful shutdown
    warden::runtime::SignalHandler::install(watchdog.cancellation());

    if (command == "check")
    {
        return watchdog.check(std::cout);
    }
    if (command == "status")
    {
        return watchdog.status(std::cout);
    }
    if (command == "start")
    {
        int rc = watchdog.start();
        if (warden::runtime::SignalHandler::is_shutdown_requested())
        {
            LOG_WARN("Start interrupted by signal");
        }
        return rc;
    }
    if (command == "install")
    {
        warden::install::UnitInvocation invocation;
        invocation.executable = self_executable(argv[0]);
        if (!config_path.empty())
        {
            invocation.config_path = std::filesystem::absolute(config_path).string();
        }
        invocation.working_directory = config.install.working_directory.empty()
                                           ? std::filesystem::current_path().string()
                                           : config.install.working_directory;
        return watchdog.install(invocation);
    }

    LOG_INFO("Warden watchdog starting (pid " << getpid() << ")");

    // Run main loop (blocking)
    int rc = watchdog.monitor();

    if (warden::runtime::SignalHandler::is_shutdown_requested())
    {
        LOG_INFO("Shutdown requested by signal");
    }
    LOG_INFO("Shutdown complete");
    return rc;
}
