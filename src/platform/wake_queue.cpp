#include "wake_queue.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

WakeQueue::WakeQueue() {
    int fds[2];
    if (pipe(fds) != 0) return;
    // Both ends non-blocking: a full pipe already means "wake up"
    for (int fd : fds) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
}

WakeQueue::~WakeQueue() {
    if (read_fd_ >= 0) close(read_fd_);
    if (write_fd_ >= 0) close(write_fd_);
}

void WakeQueue::post(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(text));
    }
    if (write_fd_ < 0) return;
    char byte = 1;
    while (write(write_fd_, &byte, 1) < 0 && errno == EINTR) {}
}

std::vector<std::string> WakeQueue::drain() {
    if (read_fd_ >= 0) {
        char buf[64];
        for (;;) {
            ssize_t n = read(read_fd_, buf, sizeof(buf));
            if (n > 0) continue;
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
}

} // namespace platform
