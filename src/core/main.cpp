#include <iostream>
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <vector>
#include <filesystem>
#include <system_error>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include "core/ConfigManager.h"
#include "core/ShellEnvironment.h"
#include "core/ServerContext.h"
#include "mcp/StdioTransport.h"
#include "mcp/HttpTransport.h"
#include "utils/Logger.h"
#include "utils/WakePipe.h"

namespace fs = std::filesystem;

namespace {

WakePipe* g_signalPipe = nullptr;

void onTerminationSignal(int) {
    if (g_signalPipe) g_signalPipe->signal();
}

struct Options {
    std::string configPath;
    int timeoutSeconds = -1;
    bool debug = false;
};

void printUsage() {
    std::cerr << "Usage: " << ServerContext::kServerName << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH       Use this config file instead of the default lookup\n"
              << "  --timeout SECONDS   Command timeout (overrides commandTimeout)\n"
              << "  --debug             Enable debug logging\n"
              << "  --version           Print version and exit\n"
              << "  --help              Show this help\n"
              << "\n"
              << "Without --config, config.json is read from the executable's directory,\n"
              << "then from the working directory; otherwise a default one is created.\n";
}

fs::path executableDir() {
    std::error_code ec;
    fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (ec) return fs::current_path();
    return exe.parent_path();
}

// Returns -1 to continue, otherwise the exit code.
int parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << ServerContext::kServerName << " " << ServerContext::kServerVersion << std::endl;
            return 0;
        }
        if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                size_t used = 0;
                opts.timeoutSeconds = std::stoi(value, &used);
                if (used != value.size() || opts.timeoutSeconds < 0) throw std::invalid_argument(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid --timeout value: " << value << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }
    return -1;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int parsed = parseArgs(argc, argv, opts);
    if (parsed >= 0) return parsed;

    Config cfg;
    std::string configPath;
    try {
        if (!opts.configPath.empty()) {
            configPath = opts.configPath;
            cfg = Config::load(configPath);
        } else {
            cfg = Config::loadOrCreate(executableDir(), fs::current_path(), configPath);
        }
        if (opts.timeoutSeconds >= 0) {
            cfg.commandTimeout = opts.timeoutSeconds;
            cfg.validate();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setDebug(cfg.debug || opts.debug);
    if (!cfg.logFile.empty()) logger.setLogFile(cfg.logFile);

    // A client closing its end must surface as EPIPE, not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    logger.info(std::string("Starting ") + ServerContext::kServerName + " " + ServerContext::kServerVersion);
    logger.info("Loaded configuration from: " + configPath);
    logger.info("Command timeout: " + std::to_string(cfg.commandTimeout) + "s");

    ShellEnvironment env = ShellEnvironment::build(cfg.socketDir);
    if (env.shellPath.empty()) {
        logger.warn("bash not found in PATH; commands will fail until it is installed");
    } else {
        logger.debug("Using shell: " + env.shellPath);
    }

    try {
        ServerContext context(cfg, std::move(env));

        std::unique_ptr<ITransport> transport;
        if (cfg.network.enabled) {
            auto http = std::make_unique<HttpTransport>(cfg.network);
            http->bind();
            transport = std::move(http);
        } else {
            transport = std::make_unique<StdioTransport>();
        }

        WakePipe signalPipe;
        WakePipe watcherStop;
        g_signalPipe = &signalPipe;
        std::signal(SIGINT, onTerminationSignal);
        std::signal(SIGTERM, onTerminationSignal);

        std::thread watcher([&] {
            pollfd fds[2] = {
                {signalPipe.readFd(), POLLIN, 0},
                {watcherStop.readFd(), POLLIN, 0}
            };
            while (true) {
                int rc = poll(fds, 2, -1);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    logger.error("Signal watcher failed: " + std::string(std::strerror(errno)));
                    return;
                }
                if (fds[1].revents) return;
                if (fds[0].revents) {
                    logger.info("Received termination signal, shutting down");
                    context.server().cancelAll();
                    transport->stop();
                    return;
                }
            }
        });

        logger.success("Server ready");
        int exitCode = 0;
        try {
            transport->run([&context](const std::string& frame) { return context.handleFrame(frame); });
        } catch (const std::exception& e) {
            logger.error(std::string("Transport failed: ") + e.what());
            exitCode = 1;
        }

        watcherStop.signal();
        watcher.join();
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_signalPipe = nullptr;

        context.shutdown();
        if (exitCode != 0) return exitCode;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    logger.info("Server stopped");
    return 0;
}
