#pragma once

#include <atomic>

#include "cancellation.hpp"

namespace warden
{
    namespace runtime
    {

        // Routes SIGINT/SIGTERM into a CancellationToken
        class SignalHandler
        {
        public:
            static void install(CancellationToken &token);

            static bool is_shutdown_requested();

        private:
            static void handle_signal(int signal);
            static std::atomic<CancellationToken *> token_;
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace warden
