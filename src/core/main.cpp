#include <csignal>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <pthread.h>
#include "core/ConfigManager.h"
#include "core/ExecutionService.h"
#include "mcp/MCPManager.h"
#include "utils/Logger.h"
#include "utils/PathSandbox.h"

namespace {
void configureLogger(const Config& cfg) {
    auto& log = Logger::getInstance();
    log.setLevel(Logger::parseLevel(cfg.logging.level));
    log.setFormat(Logger::parseFormat(cfg.logging.format));
    log.setLogFile(cfg.logging.file);
    log.setServiceInfo(cfg.service.name, cfg.service.version);
}
} // namespace

int main() {
    // Pipe writes to a dead worker must surface as errors, not kill the service.
    std::signal(SIGPIPE, SIG_IGN);

    // SIGINT/SIGTERM are taken by a dedicated thread; block them before any other thread exists.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    Config cfg;
    try {
        cfg = Config::fromEnvironment();
        configureLogger(cfg);
        cfg.mcpServers = Config::loadWorkers(cfg.mcp.configPath, cfg.mcp.defaultTimeout);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto& log = Logger::getInstance();
    log.info("Starting " + cfg.service.name + " v" + cfg.service.version);
    log.info("Loaded " + std::to_string(cfg.mcpServers.size()) + " MCP server configurations from " +
             cfg.mcp.configPath);

    std::unique_ptr<MCPManager> manager;
    try {
        PathSandbox sandbox(cfg.mcp.sandboxDirectory);
        log.info("Sandbox directory: " + sandbox.sandboxRoot().u8string());
        manager = std::make_unique<MCPManager>(cfg.mcpServers, sandbox,
                                               std::chrono::seconds(cfg.mcp.stopGraceSeconds));
        manager->initialize();
    } catch (const std::exception& e) {
        log.error(std::string("Startup failed: ") + e.what());
        return 1;
    }

    ExecutionService service(*manager, cfg.service.name, cfg.service.version);

    // A signal sent during startup is still pending here and stops the service before it listens.
    std::thread signalWaiter([&service, &log, stopSignals]() {
        int sig = 0;
        if (sigwait(&stopSignals, &sig) == 0) {
            log.info("Received signal " + std::to_string(sig) + ", shutting down");
            service.stop();
        }
    });

    bool served = service.run(cfg.service.host, cfg.service.port);
    if (!served) {
        // Wake the waiter so it can be joined.
        pthread_kill(signalWaiter.native_handle(), SIGTERM);
    }
    signalWaiter.join();

    try {
        manager->shutdown();
    } catch (const std::exception& e) {
        log.error(std::string("Shutdown error: ") + e.what());
    }
    log.info("Service stopped");
    return served ? 0 : 1;
}
