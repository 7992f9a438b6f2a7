/**
 * @file StopSignal.cpp
 * @brief Blocks the main thread until the operator asks to stop
 */

#include "qrshare/StopSignal.h"
#include "qrshare/Debug.h"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace QrShare {

int StopSignal::s_pipe[2] = {-1, -1};

bool StopSignal::install(std::string& errorMsg) {
    if (s_pipe[0] < 0) {
        if (::pipe2(s_pipe, O_CLOEXEC | O_NONBLOCK) != 0) {
            errorMsg = std::string("pipe2() failed: ") + std::strerror(errno);
            s_pipe[0] = s_pipe[1] = -1;
            return false;
        }
    }

    struct sigaction sa{};
    sa.sa_handler = &StopSignal::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
        errorMsg = std::string("sigaction() failed: ") + std::strerror(errno);
        uninstall();
        return false;
    }
    return true;
}

void StopSignal::uninstall() {
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    for (int& fd : s_pipe) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

void StopSignal::notify() {
    const int saved = errno;
    if (s_pipe[1] >= 0) {
        const char byte = 1;
        // Pipe full means a stop is already pending
        (void)!::write(s_pipe[1], &byte, 1);
    }
    errno = saved;
}

void StopSignal::handleSignal(int signal) {
    (void)signal;
    notify();
}

StopReason StopSignal::waitForStop(int inputFd) {
    bool inputOpen = inputFd >= 0;

    while (true) {
        pollfd fds[2]{};
        nfds_t count = 0;
        if (s_pipe[0] >= 0) {
            fds[count].fd = s_pipe[0];
            fds[count].events = POLLIN;
            ++count;
        }
        const nfds_t inputIndex = count;
        if (inputOpen) {
            fds[count].fd = inputFd;
            fds[count].events = POLLIN;
            ++count;
        }

        if (count == 0) {
            // Nothing can wake us; treat as an immediate stop
            LOG_WARNING("[StopSignal] No input and no signal pipe, stopping");
            return StopReason::SIGNAL;
        }

        const int ready = ::poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[StopSignal] poll() failed: " << std::strerror(errno));
            return StopReason::SIGNAL;
        }

        if (s_pipe[0] >= 0 && (fds[0].revents & POLLIN)) {
            char drain[16];
            while (::read(s_pipe[0], drain, sizeof(drain)) > 0) {
            }
            return StopReason::SIGNAL;
        }

        if (inputOpen && fds[inputIndex].revents != 0) {
            char buf[256];
            const ssize_t n = ::read(inputFd, buf, sizeof(buf));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                // EOF: keep waiting for a signal only
                inputOpen = false;
                continue;
            }
            if (std::memchr(buf, '\n', static_cast<size_t>(n)) != nullptr) {
                return StopReason::ENTER;
            }
        }
    }
}

}  // namespace QrShare
