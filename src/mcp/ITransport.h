#pragma once
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

/**
 * @brief Carries frames between a client and the router.
 *
 * The handler gets one raw frame and returns the response frame, or nullopt
 * when nothing must be sent back. Transports may invoke it concurrently.
 */
class ITransport {
public:
    using MessageHandler = std::function<std::optional<nlohmann::json>(const std::string& frame)>;

    virtual ~ITransport() = default;

    // Blocks until the input ends or stop() is called.
    virtual void run(MessageHandler handler) = 0;

    // Safe to call from another thread or a signal watcher.
    virtual void stop() = 0;
};
