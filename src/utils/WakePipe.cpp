#include "utils/WakePipe.h"
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

WakePipe::WakePipe() {
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "failed to create wake pipe");
    }
    // A full pipe already means "signaled"; never block the signaller.
    fcntl(fds[1], F_SETFL, fcntl(fds[1], F_GETFL) | O_NONBLOCK);
}

WakePipe::~WakePipe() {
    for (int fd : fds) {
        if (fd >= 0) close(fd);
    }
}

void WakePipe::signal() {
    const char byte = 1;
    ssize_t n = write(fds[1], &byte, 1);
    (void)n;
}

bool WakePipe::isSignaled() const {
    pollfd pfd{fds[0], POLLIN, 0};
    return poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
}
