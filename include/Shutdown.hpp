#ifndef GAVEL_SHUTDOWN_HPP
#define GAVEL_SHUTDOWN_HPP

namespace gavel {

    /**
     * Installs SIGINT/SIGTERM handlers that flag a shutdown request. The handlers are
     * installed without SA_RESTART, so a blocking read on stdin returns with EINTR
     * instead of waiting for the next line.
     *
     * @return false if the handlers could not be installed.
     */
    bool installShutdownHandlers();

    bool shutdownRequested();

    /**
     * Blocks or unblocks SIGINT/SIGTERM for the calling thread. Threads started while
     * the signals are blocked inherit the mask, which keeps the signals on the thread
     * that reads stdin.
     */
    bool setShutdownSignalsBlocked(bool blocked);

} // namespace gavel

#endif // GAVEL_SHUTDOWN_HPP
