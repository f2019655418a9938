#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <chrono>
#include "shell/ProcessHandle.h"
#include "utils/LineReader.h"
#include "shell/DiagnosticBuffer.h"
#include "shell/CompletionMarker.h"
#include "shell/SessionError.h"
#include "utils/WakePipe.h"
#include "utils/CancellationToken.h"
#include "core/ShellEnvironment.h"

/**
 * @brief One persistent bash process.
 *
 * Commands share the shell's state (working directory, exported variables)
 * and are framed on stdout with a CompletionMarker. A single drainer task
 * keeps stderr flowing into a capped buffer for the whole session lifetime.
 */
class BashSession {
public:
    static constexpr size_t kMaxScanBufferSize = 1024 * 1024;
    static constexpr size_t kMaxOutputSize = 512 * 1024;

    // Spawns the shell; throws SessionError(SpawnFailed).
    explicit BashSession(const ShellEnvironment& env);
    ~BashSession();

    BashSession(const BashSession&) = delete;
    BashSession& operator=(const BashSession&) = delete;

    /**
     * @brief Runs one command and returns its captured output.
     *
     * A non-zero exit status is appended as "[Exit code: N]", stderr written
     * during the command as a trailing "STDERR:" section. Throws SessionError;
     * on timeout, cancellation or a broken stream the session stops running.
     */
    std::string execute(const std::string& command,
                        std::chrono::milliseconds timeout,
                        CancellationToken* token = nullptr);

    // Idempotent. Kills and reaps the shell and stops the drainer.
    void close();

    bool isRunning() const { return running; }
    pid_t pid() const { return process.pid(); }

    static std::string truncationNotice();

private:
    struct ScanResult {
        enum class Outcome { Completed, Eof, Woken, Failed };
        Outcome outcome = Outcome::Failed;
        std::string output;
        bool truncated = false;
        std::string error;
    };

    ProcessHandle process;
    std::unique_ptr<LineReader> stdoutReader;
    DiagnosticBuffer stderrBuffer;
    WakePipe shutdownPipe;
    std::atomic<bool> running{false};
    std::mutex execMutex;
    bool closed = false;
    std::future<void> stderrDone;

    ScanResult scanOutput(const CompletionMarker& marker, int wakeFd);
    void drainStderr();
    std::string finishOutput(std::string output, bool truncated);
};
