#include "shell/CompletionMarker.h"
#include <atomic>
#include <chrono>
#include <cctype>
#include <algorithm>

CompletionMarker::CompletionMarker(std::string token) : markerToken(std::move(token)) {}

CompletionMarker CompletionMarker::generate() {
    static std::atomic<unsigned long long> sequence{0};
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    return CompletionMarker("__BASH_CMD_DONE_" + std::to_string(nanos) + "_" +
                            std::to_string(++sequence) + "__");
}

std::string CompletionMarker::frame(const std::string& command) const {
    return command + "\necho '" + markerToken + "'$?\n";
}

bool CompletionMarker::match(const std::string& line, std::string& leading, std::string& exitCode) const {
    auto pos = line.rfind(markerToken);
    if (pos == std::string::npos) return false;

    std::string digits = line.substr(pos + markerToken.size());
    if (digits.empty()) return false;
    bool allDigits = std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!allDigits) return false;

    leading = line.substr(0, pos);
    exitCode = digits;
    return true;
}
