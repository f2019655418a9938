#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <sys/types.h>

/**
 * @brief Child process with stdin, stdout and stderr pipes.
 *
 * terminate() signals and reaps at most once; every close is idempotent.
 */
class ProcessHandle {
public:
    ProcessHandle() = default;
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // env entries are KEY=VALUE. On failure error is filled and nothing leaks.
    bool spawn(const std::string& executable,
               const std::vector<std::string>& args,
               const std::vector<std::string>& env,
               std::string& error);

    bool writeInput(const std::string& data);

    int stdoutFd() const { return stdoutRead; }
    int stderrFd() const { return stderrRead; }
    pid_t pid() const { return childPid; }
    bool isReaped() const { return reaped; }

    void closeInput();
    void closeOutputs();

    // SIGKILL + waitpid. Returns false when the process was already reaped.
    bool terminate();

    // Reaps the child if it exits within timeout; returns its exit code
    // (128 + signal for a signalled child).
    std::optional<int> waitExit(std::chrono::milliseconds timeout);

private:
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    bool reaped = false;
    std::optional<int> exitCode;

    static void closeFd(int& fd);
    static int decodeStatus(int status);
};
