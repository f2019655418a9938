#pragma once

/**
 * @brief Self-pipe used to interrupt a blocking poll(2).
 *
 * signal() makes readFd() readable until the pipe is destroyed. Both ends
 * are close-on-exec so a spawned shell never inherits them.
 */
class WakePipe {
public:
    WakePipe();
    ~WakePipe();

    WakePipe(const WakePipe&) = delete;
    WakePipe& operator=(const WakePipe&) = delete;

    // Async-signal-safe.
    void signal();
    bool isSignaled() const;

    int readFd() const { return fds[0]; }

private:
    int fds[2] = {-1, -1};
};
