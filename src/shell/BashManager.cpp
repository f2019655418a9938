#include "shell/BashManager.h"
#include "utils/Logger.h"

BashManager::BashManager(std::chrono::milliseconds timeout, ShellEnvironment env)
    : defaultTimeout(timeout.count() > 0 ? timeout : std::chrono::milliseconds(kDefaultTimeout)),
      environment(std::move(env)) {}

BashManager::~BashManager() {
    shutdown();
}

std::string BashManager::executeCommand(const std::string& command, CancellationToken* token) {
    std::lock_guard<std::mutex> lock(sessionMutex);

    if (stopped) {
        throw SessionError(SessionError::Kind::ShutDown, "bash manager is shut down");
    }
    // Queued behind another command and cancelled meanwhile: leave the shell alone.
    if (token && token->isCancelled()) {
        throw SessionError(SessionError::Kind::Cancelled, "command was cancelled");
    }

    if (!session || !session->isRunning()) {
        if (session) {
            Logger::getInstance().info("Cleaning up dead session before creating new one (PID: " +
                                       std::to_string(session->pid()) + ")");
            session->close();
            session.reset();
        }
        createSession();
    }

    return session->execute(command, defaultTimeout, token);
}

void BashManager::restartSession() {
    std::lock_guard<std::mutex> lock(sessionMutex);

    if (stopped) {
        throw SessionError(SessionError::Kind::ShutDown, "bash manager is shut down");
    }
    if (session) {
        session->close();
        session.reset();
    }
    createSession();
}

void BashManager::shutdown() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    stopped = true;
    if (session) {
        session->close();
        session.reset();
    }
}

bool BashManager::hasSession() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    return session != nullptr;
}

pid_t BashManager::sessionPid() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    return session ? session->pid() : -1;
}

void BashManager::createSession() {
    try {
        session = std::make_unique<BashSession>(environment);
    } catch (const SessionError& e) {
        session.reset();
        throw SessionError(SessionError::Kind::SpawnFailed,
                           std::string("failed to create bash session: ") + e.what());
    }
}
