#pragma once
#include <functional>
#include <mutex>

/**
 * @brief Per-request cancellation flag.
 *
 * The router hands one token to every request handler and cancels it on
 * notifications/cancelled or shutdown. Whoever is blocked on behalf of the
 * request installs a callback that wakes it; the callback runs under the
 * token lock, so clearCallback() returning means it is no longer running.
 */
class CancellationToken {
public:
    void cancel() {
        std::lock_guard<std::mutex> lock(mtx);
        if (cancelled) return;
        cancelled = true;
        if (callback) callback();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mtx);
        return cancelled;
    }

    // Runs immediately when the token is already cancelled.
    void setCallback(std::function<void()> cb) {
        std::lock_guard<std::mutex> lock(mtx);
        callback = std::move(cb);
        if (cancelled && callback) callback();
    }

    void clearCallback() {
        std::lock_guard<std::mutex> lock(mtx);
        callback = nullptr;
    }

private:
    mutable std::mutex mtx;
    bool cancelled = false;
    std::function<void()> callback;
};
