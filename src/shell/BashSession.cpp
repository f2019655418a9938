#include "shell/BashSession.h"
#include "utils/Logger.h"
#include <cstring>
#include <cerrno>
#include <thread>

namespace {
const auto kStderrGracePeriod = std::chrono::milliseconds(50);
const auto kDrainerJoinTimeout = std::chrono::seconds(2);
const auto kExitReapTimeout = std::chrono::milliseconds(500);
// Enough of an overlong line's end to still hold the marker and its status.
const size_t kMarkerTailSize = 128;

std::string formatDuration(std::chrono::milliseconds d) {
    if (d.count() % 1000 == 0) return std::to_string(d.count() / 1000) + "s";
    return std::to_string(d.count()) + "ms";
}

// terminated: the piece was a full line and gets its newline back.
void appendCapped(std::string& output, bool& truncated, const std::string& text, bool terminated) {
    if (truncated) return;
    size_t needed = text.size() + (terminated ? 1 : 0);
    if (output.size() + needed <= BashSession::kMaxOutputSize) {
        output += text;
        if (terminated) output += '\n';
        return;
    }
    truncated = true;
    output += BashSession::truncationNotice();
}
} // namespace

std::string BashSession::truncationNotice() {
    return "\n... [output truncated at " + std::to_string(kMaxOutputSize) + " bytes] ...\n";
}

BashSession::BashSession(const ShellEnvironment& env) : stderrBuffer(kMaxOutputSize) {
    if (env.shellPath.empty()) {
        throw SessionError(SessionError::Kind::SpawnFailed, "bash executable not found in PATH");
    }

    std::string error;
    if (!process.spawn(env.shellPath, {}, env.variables, error)) {
        throw SessionError(SessionError::Kind::SpawnFailed, "failed to start bash: " + error);
    }

    stdoutReader = std::make_unique<LineReader>(process.stdoutFd(), kMaxScanBufferSize, kMarkerTailSize);
    running = true;
    stderrDone = std::async(std::launch::async, &BashSession::drainStderr, this);

    Logger::getInstance().info("Created new bash session (PID: " + std::to_string(process.pid()) + ")");
}

BashSession::~BashSession() {
    close();
}

void BashSession::drainStderr() {
    LineReader reader(process.stderrFd(), kMaxScanBufferSize);
    std::string line;
    const std::vector<int> wakeFds = {shutdownPipe.readFd()};
    while (true) {
        auto status = reader.readLine(line, wakeFds);
        if (status == LineReader::Status::Line || status == LineReader::Status::TooLong) {
            stderrBuffer.appendLine(line);
            continue;
        }
        if (status == LineReader::Status::Error) {
            Logger::getInstance().warn(std::string("Stderr drainer error: ") + std::strerror(reader.lastError()));
        }
        return;
    }
}

BashSession::ScanResult BashSession::scanOutput(const CompletionMarker& marker, int wakeFd) {
    ScanResult result;
    std::string line;
    std::string leading;
    std::string exitCode;
    const std::vector<int> wakeFds = {wakeFd, shutdownPipe.readFd()};

    while (true) {
        auto status = stdoutReader->readLine(line, wakeFds);
        switch (status) {
            case LineReader::Status::Line:
                if (marker.match(line, leading, exitCode)) {
                    if (!leading.empty()) appendCapped(result.output, result.truncated, leading, false);
                    if (exitCode != "0") {
                        result.output += "\n[Exit code: " + exitCode + "]";
                    }
                    result.outcome = ScanResult::Outcome::Completed;
                    return result;
                }
                appendCapped(result.output, result.truncated, line, true);
                break;
            case LineReader::Status::TooLong:
                appendCapped(result.output, result.truncated, line, true);
                break;
            case LineReader::Status::Eof:
                result.outcome = ScanResult::Outcome::Eof;
                return result;
            case LineReader::Status::Woken:
                result.outcome = ScanResult::Outcome::Woken;
                return result;
            case LineReader::Status::Error:
                result.outcome = ScanResult::Outcome::Failed;
                result.error = std::strerror(stdoutReader->lastError());
                return result;
        }
    }
}

std::string BashSession::finishOutput(std::string output, bool truncated) {
    // A truncated result keeps the notice intact as its suffix.
    while (!truncated && !output.empty() && output.back() == '\n') {
        output.pop_back();
    }

    // Give stderr a brief moment to flush, then collect it
    std::this_thread::sleep_for(kStderrGracePeriod);
    std::string stderrOutput = stderrBuffer.consume();
    if (!stderrOutput.empty()) {
        output += "\n\nSTDERR:\n" + stderrOutput;
    }
    return output;
}

std::string BashSession::execute(const std::string& command,
                                 std::chrono::milliseconds timeout,
                                 CancellationToken* token) {
    std::lock_guard<std::mutex> lock(execMutex);

    if (!running) {
        throw SessionError(SessionError::Kind::NotRunning, "bash session is not running");
    }
    if (token && token->isCancelled()) {
        throw SessionError(SessionError::Kind::Cancelled, "command was cancelled");
    }

    // Drop stderr left over from earlier commands
    stderrBuffer.consume();

    // Created before the write: once the command is in flight nothing may throw.
    WakePipe callWake;
    CompletionMarker marker = CompletionMarker::generate();
    if (!process.writeInput(marker.frame(command))) {
        int err = errno;
        running = false;
        throw SessionError(SessionError::Kind::WriteFailed,
                           std::string("failed to write command: ") + std::strerror(err));
    }

    auto scan = std::async(std::launch::async, [this, &marker, &callWake] {
        return scanOutput(marker, callWake.readFd());
    });
    if (token) {
        token->setCallback([&callWake] { callWake.signal(); });
    }

    auto waitStatus = scan.wait_for(timeout);
    if (token) token->clearCallback();

    if (waitStatus != std::future_status::ready) {
        running = false;
        callWake.signal();
        scan.wait();
        throw SessionError(SessionError::Kind::Timeout, "command timed out after " + formatDuration(timeout));
    }

    ScanResult result = scan.get();
    switch (result.outcome) {
        case ScanResult::Outcome::Completed:
            return finishOutput(std::move(result.output), result.truncated);

        case ScanResult::Outcome::Woken:
            running = false;
            if (shutdownPipe.isSignaled()) {
                throw SessionError(SessionError::Kind::ReadFailed, "bash session was closed");
            }
            throw SessionError(SessionError::Kind::Cancelled, "command was cancelled");

        case ScanResult::Outcome::Eof: {
            running = false;
            // The shell itself exited (e.g. `exit 7`): report its status as the command's.
            auto exitStatus = process.waitExit(kExitReapTimeout);
            if (!exitStatus) {
                throw SessionError(SessionError::Kind::ReadFailed,
                                   "stdout closed before command completion marker was received");
            }
            Logger::getInstance().info("Bash session exited with status " + std::to_string(*exitStatus) +
                                       " (PID: " + std::to_string(process.pid()) + ")");
            if (*exitStatus != 0) {
                result.output += "\n[Exit code: " + std::to_string(*exitStatus) + "]";
            }
            return finishOutput(std::move(result.output), result.truncated);
        }

        case ScanResult::Outcome::Failed:
            break;
    }
    running = false;
    throw SessionError(SessionError::Kind::ReadFailed, "error reading output: " + result.error);
}

void BashSession::close() {
    bool wasRunning = running.exchange(false);
    // Unblocks the drainer and a scanner still waiting on stdout.
    shutdownPipe.signal();

    std::lock_guard<std::mutex> lock(execMutex);
    if (closed) return;
    closed = true;

    pid_t pid = process.pid();
    process.closeInput();
    process.terminate();

    bool drainerStopped = true;
    if (stderrDone.valid() &&
        stderrDone.wait_for(kDrainerJoinTimeout) != std::future_status::ready) {
        drainerStopped = false;
        Logger::getInstance().warn("Stderr drainer did not exit within timeout");
    }
    // A late drainer may still be reading; its descriptor is closed by the destructor.
    if (drainerStopped) {
        process.closeOutputs();
    }

    if (wasRunning) {
        Logger::getInstance().info("Closed bash session (PID: " + std::to_string(pid) + ")");
    } else {
        Logger::getInstance().info("Cleaned up dead bash session (PID: " + std::to_string(pid) + ")");
    }
}
