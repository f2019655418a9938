#pragma once
#include <string>
#include <chrono>
#include <csignal>
#include <filesystem>
#include "core/ShellEnvironment.h"

// Small, predictable environment for the shells spawned by tests.
inline ShellEnvironment testShellEnvironment() {
    std::filesystem::path sockets = std::filesystem::temp_directory_path() / "bashmcp_test_sockets";
    return ShellEnvironment::fromVariables({"HOME=/tmp", "LANG=C", "PATH=/usr/bin:/bin"}, sockets.string());
}

inline void ignoreSigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

inline bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}
