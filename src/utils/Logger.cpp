#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <unistd.h>

namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";
}

Logger::Logger() : useColor(isatty(STDERR_FILENO) == 1) {}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) logFile.close();
    if (path.empty()) return;
    logFile.open(path, std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "Could not open log file: " << path << std::endl;
    }
}

std::string Logger::truncate(const std::string& text, size_t maxLen) {
    if (text.size() <= maxLen) return text;
    return text.substr(0, maxLen) + "...[truncated]";
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (logFile.is_open()) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        logFile << std::put_time(&local, "[%Y-%m-%d %H:%M:%S] ");
        switch (level) {
            case LogLevel::ERROR: logFile << "[ERROR] "; break;
            case LogLevel::WARNING: logFile << "[WARN] "; break;
            case LogLevel::INFO: logFile << "[INFO] "; break;
            case LogLevel::SUCCESS: logFile << "[OK] "; break;
            default: logFile << "[DEBUG] "; break;
        }
        logFile << trimmedMsg << std::endl;
    }

    std::string prefix;
    std::string color;
    switch (level) {
        case LogLevel::INFO:
            prefix = "[Info] ";
            color = CYAN;
            break;
        case LogLevel::SUCCESS:
            prefix = "[OK] ";
            color = GREEN;
            break;
        case LogLevel::WARNING:
            prefix = "[Warn] ";
            color = YELLOW;
            break;
        case LogLevel::ERROR:
            prefix = "[Error] ";
            color = RED + BOLD;
            break;
        case LogLevel::DEBUG:
            prefix = "[Debug] ";
            color = GRAY;
            break;
    }
    if (useColor) prefix = color + prefix + RESET;

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << '\n';
    }
    std::cerr.flush();
}
