#pragma once
#include <iostream>
#include <list>
#include <future>
#include <mutex>
#include <unistd.h>
#include "mcp/ITransport.h"
#include "utils/WakePipe.h"

/**
 * @brief Newline-delimited JSON-RPC over a descriptor pair (stdin/stdout).
 *
 * The reader loop never processes a frame inline: each one runs on its own
 * task, so a cancellation or a second request is still read while a long
 * command is executing. Responses are written whole under a write lock.
 */
class StdioTransport : public ITransport {
public:
    static constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

    explicit StdioTransport(int inputFd = STDIN_FILENO, std::ostream& output = std::cout);
    ~StdioTransport() override;

    void run(MessageHandler handler) override;
    void stop() override;

    void sendFrame(const nlohmann::json& frame);

private:
    int inputFd;
    std::ostream& output;
    std::mutex writeMutex;
    WakePipe stopPipe;
    std::list<std::future<void>> tasks;

    void handleAndRespond(const MessageHandler& handler, const std::string& frame);
    void reapFinishedTasks();
};
