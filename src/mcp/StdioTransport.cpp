#include "mcp/StdioTransport.h"
#include "mcp/Protocol.h"
#include "utils/LineReader.h"
#include "utils/Logger.h"
#include <cstring>

namespace {
const size_t kMaxMsgLog = 200;
}

StdioTransport::StdioTransport(int inputFd, std::ostream& output)
    : inputFd(inputFd), output(output) {}

StdioTransport::~StdioTransport() {
    for (auto& task : tasks) {
        if (task.valid()) task.wait();
    }
}

void StdioTransport::run(MessageHandler handler) {
    LineReader reader(inputFd, kMaxFrameSize);
    const std::vector<int> wakeFds = {stopPipe.readFd()};
    std::string line;

    while (true) {
        auto status = reader.readLine(line, wakeFds);
        if (status == LineReader::Status::Eof) {
            Logger::getInstance().info("Received EOF from stdin, exiting");
            break;
        }
        if (status == LineReader::Status::Woken) {
            Logger::getInstance().info("Transport stopped");
            break;
        }
        if (status == LineReader::Status::Error) {
            Logger::getInstance().error(std::string("Error reading from stdin: ") + std::strerror(reader.lastError()));
            break;
        }
        if (status == LineReader::Status::TooLong) {
            Logger::getInstance().error("Dropping frame larger than " + std::to_string(kMaxFrameSize) + " bytes");
            continue;
        }
        if (line.empty()) continue;

        if (line.size() > kMaxMsgLog) {
            Logger::getInstance().debug("Received message (" + std::to_string(line.size()) + " bytes): " +
                                        Logger::truncate(line, kMaxMsgLog));
        } else {
            Logger::getInstance().debug("Received message: " + line);
        }

        reapFinishedTasks();
        tasks.push_back(std::async(std::launch::async, [this, handler, frame = line] {
            handleAndRespond(handler, frame);
        }));
    }

    for (auto& task : tasks) {
        task.wait();
    }
    tasks.clear();
}

void StdioTransport::stop() {
    stopPipe.signal();
}

void StdioTransport::sendFrame(const nlohmann::json& frame) {
    std::string payload = Protocol::serialize(frame);
    payload += '\n';

    std::lock_guard<std::mutex> lock(writeMutex);
    output.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    output.flush();
    if (!output) {
        Logger::getInstance().error("Error writing response");
        output.clear();
        return;
    }
    Logger::getInstance().debug("Response sent (" + std::to_string(payload.size()) + " bytes)");
}

void StdioTransport::handleAndRespond(const MessageHandler& handler, const std::string& frame) {
    try {
        auto response = handler(frame);
        if (!response) return;
        sendFrame(*response);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Error processing request: ") + e.what());
    }
}

void StdioTransport::reapFinishedTasks() {
    for (auto it = tasks.begin(); it != tasks.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks.erase(it);
        } else {
            ++it;
        }
    }
}
