#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include "shell/BashSession.h"
#include "core/ShellEnvironment.h"
#include "utils/CancellationToken.h"

/**
 * @brief Owns the single bash session and serializes every command.
 *
 * Shell state (cwd, exports) only stays coherent when commands run one at a
 * time, so the manager lock is held for the whole execution. A dead session
 * is always closed (process reaped) before its replacement is created.
 */
class BashManager {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{600};

    // A zero timeout selects kDefaultTimeout.
    BashManager(std::chrono::milliseconds timeout, ShellEnvironment env);
    ~BashManager();

    BashManager(const BashManager&) = delete;
    BashManager& operator=(const BashManager&) = delete;

    // Throws SessionError.
    std::string executeCommand(const std::string& command, CancellationToken* token = nullptr);

    // Close and recreate unconditionally. Throws SessionError(SpawnFailed).
    void restartSession();

    // Closes the active session; later commands are refused.
    void shutdown();

    bool hasSession() const;
    pid_t sessionPid() const;
    std::chrono::milliseconds timeout() const { return defaultTimeout; }

private:
    mutable std::mutex sessionMutex;
    std::unique_ptr<BashSession> session;
    std::chrono::milliseconds defaultTimeout;
    ShellEnvironment environment;
    bool stopped = false;

    void createSession();
};
