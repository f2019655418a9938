#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <fstream>
#include <atomic>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

/**
 * @brief Process-wide logger.
 *
 * stdout belongs to the protocol, so everything goes to stderr and,
 * when configured, to a log file.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    // Empty path disables file logging.
    void setLogFile(const std::string& path);

    void setDebug(bool enabled) { debugEnabled = enabled; }

    bool isDebug() const { return debugEnabled; }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;
        printToConsole(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

    // Cuts long payloads (command output, frames) before they reach the log.
    static std::string truncate(const std::string& text, size_t maxLen);

private:
    Logger();
    LogCallback callback;
    std::mutex mtx;
    std::ofstream logFile;
    std::atomic<bool> debugEnabled{false};
    bool useColor = false;

    void printToConsole(LogLevel level, const std::string& message);
};
