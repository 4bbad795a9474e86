#pragma once

#include <sys/types.h>

#include "i_command_runner.hpp"

namespace warden
{
    namespace process
    {

        // CommandRunner executes short-lived external tools (docker, systemctl)
        // Responsibilities:
        // - Spawn process with stdout/stderr captured through pipes
        // - Enforce a hard deadline
        // - Forced termination and reaping on timeout
        class CommandRunner : public ICommandRunner
        {
        public:
            CommandRunner() = default;

            CommandResult run(const std::vector<std::string> &argv, int timeout_ms) override;

        private:
            bool wait_for_exit(pid_t pid, int timeout_ms, int &status);
            void force_terminate(pid_t pid);
        };

    } // namespace process
} // namespace warden
