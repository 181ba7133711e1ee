#include "Shutdown.hpp"

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace gavel {

    namespace {
        std::atomic<bool> g_shutdown(false);

        void signal_handler(int signum) {
            (void)signum;
            g_shutdown = true;
        }
    }

    bool installShutdownHandlers() {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0; // sin SA_RESTART: getline() debe volver con EINTR

        for (int signum : {SIGINT, SIGTERM}) {
            if (sigaction(signum, &action, nullptr) != 0) {
                std::cerr << "Could not install handler for signal " << signum << ": "
                          << std::strerror(errno) << std::endl;
                return false;
            }
        }
        return true;
    }

    bool shutdownRequested() {
        return g_shutdown.load();
    }

    bool setShutdownSignalsBlocked(bool blocked) {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);

        const int result = pthread_sigmask(blocked ? SIG_BLOCK : SIG_UNBLOCK, &signals, nullptr);
        if (result != 0) {
            std::cerr << "Could not change signal mask: " << std::strerror(result) << std::endl;
            return false;
        }
        return true;
    }

} // namespace gavel
