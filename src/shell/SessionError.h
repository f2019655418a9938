#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Failure of a bash session or of the manager owning it.
 *
 * Every kind except SpawnFailed and ShutDown leaves the session marked as
 * not running; the manager replaces it on the next command.
 */
class SessionError : public std::runtime_error {
public:
    enum class Kind {
        NotRunning,
        WriteFailed,
        Timeout,
        Cancelled,
        ReadFailed,
        SpawnFailed,
        ShutDown
    };

    SessionError(Kind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    Kind kind() const { return errorKind; }

private:
    Kind errorKind;
};
