#include "shell/ProcessHandle.h"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <thread>
#include <unistd.h>
#include <fcntl.h>
#include <sys/wait.h>

namespace {
// Close-on-exec from creation, so a fork on another thread cannot inherit them.
bool makePipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

void closePair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}
} // namespace

ProcessHandle::~ProcessHandle() {
    closeInput();
    terminate();
    closeOutputs();
}

void ProcessHandle::closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int ProcessHandle::decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool ProcessHandle::spawn(const std::string& executable,
                          const std::vector<std::string>& args,
                          const std::vector<std::string>& env,
                          std::string& error) {
    if (childPid > 0) {
        error = "process already started";
        return false;
    }

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (!makePipe(inPipe)) {
        error = std::string("failed to create stdin pipe: ") + std::strerror(errno);
        return false;
    }
    if (!makePipe(outPipe)) {
        error = std::string("failed to create stdout pipe: ") + std::strerror(errno);
        closePair(inPipe);
        return false;
    }
    if (!makePipe(errPipe)) {
        error = std::string("failed to create stderr pipe: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        return false;
    }

    // Build argv/envp before fork; the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (const auto& entry : env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("failed to fork: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        return false;
    }

    if (pid == 0) { // Child
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        // The server ignores SIGPIPE; commands expect the default.
        signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        execve(executable.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Parent
    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);
    stdinWrite = inPipe[1];
    stdoutRead = outPipe[0];
    stderrRead = errPipe[0];
    childPid = pid;
    reaped = false;
    exitCode.reset();
    return true;
}

bool ProcessHandle::writeInput(const std::string& data) {
    if (stdinWrite < 0) return false;
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = write(stdinWrite, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

void ProcessHandle::closeInput() {
    closeFd(stdinWrite);
}

void ProcessHandle::closeOutputs() {
    closeFd(stdoutRead);
    closeFd(stderrRead);
}

bool ProcessHandle::terminate() {
    if (childPid <= 0 || reaped) return false;
    kill(childPid, SIGKILL);
    int status = 0;
    while (waitpid(childPid, &status, 0) < 0 && errno == EINTR) {
    }
    exitCode = decodeStatus(status);
    reaped = true;
    return true;
}

std::optional<int> ProcessHandle::waitExit(std::chrono::milliseconds timeout) {
    if (childPid <= 0) return std::nullopt;
    if (reaped) return exitCode;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t r = waitpid(childPid, &status, WNOHANG);
        if (r == childPid) {
            reaped = true;
            exitCode = decodeStatus(status);
            return exitCode;
        }
        if (r < 0 && errno != EINTR) return std::nullopt;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}
