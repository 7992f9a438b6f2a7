/**
 * @file StopSignal.h
 * @brief Blocks the main thread until the operator asks to stop
 */

#pragma once

#include <string>

namespace QrShare {

/**
 * @brief What ended the wait
 */
enum class StopReason {
    ENTER,   ///< A line was read from the input descriptor
    SIGNAL   ///< SIGINT/SIGTERM or notify()
};

/**
 * @class StopSignal
 * @brief Self-pipe bridge from SIGINT/SIGTERM to a blocking wait
 *
 * The signal handler only writes one byte to a pipe; waitForStop() polls that
 * pipe together with the input descriptor. When the input reaches EOF (stdin
 * redirected from /dev/null, a closed terminal) the wait continues on the
 * signal pipe alone.
 */
class StopSignal {
public:
    /**
     * @brief Create the pipe and install the SIGINT/SIGTERM handlers
     * @return false if the pipe or sigaction() fails
     */
    static bool install(std::string& errorMsg);

    /**
     * @brief Restore default signal dispositions and close the pipe
     */
    static void uninstall();

    /**
     * @brief Request stop as if a signal had arrived (async-signal-safe)
     */
    static void notify();

    /**
     * @brief Block until Enter on inputFd or a stop signal
     * @param inputFd Descriptor to read lines from (stdin by default)
     */
    static StopReason waitForStop(int inputFd = 0);

private:
    static void handleSignal(int signal);

    static int s_pipe[2];
};

}  // namespace QrShare
