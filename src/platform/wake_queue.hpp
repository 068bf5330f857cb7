#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>

namespace platform {

// Hands text from background threads to the thread that owns the terminal.
// post() queues a message and makes read_fd() readable; the owner polls
// read_fd() next to stdin and calls drain() when it fires.
class WakeQueue {
public:
    WakeQueue();
    ~WakeQueue();

    WakeQueue(const WakeQueue&) = delete;
    WakeQueue& operator=(const WakeQueue&) = delete;

    // False if the pipe could not be created; post() then only queues.
    bool valid() const { return read_fd_ >= 0; }
    int read_fd() const { return read_fd_; }

    void post(std::string text);

    // Clears the wakeup and returns everything posted so far, oldest first.
    std::vector<std::string> drain();

private:
    int read_fd_ = -1;
    int write_fd_ = -1;
    std::mutex mutex_;
    std::deque<std::string> pending_;
};

} // namespace platform
