#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/MCPManager.h"

namespace httplib {
class Server;
}

/**
 * @brief HTTP front of the execution service.
 *
 * Each route has a handler that returns the status code and JSON body, so
 * the routing logic can be exercised without a socket. run() binds them to
 * an httplib::Server.
 */
class ExecutionService {
public:
    struct Reply {
        int status = 200;
        nlohmann::json body;
    };

    ExecutionService(MCPManager& manager, std::string serviceName, std::string serviceVersion);
    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // GET /
    Reply handleRoot() const;
    // GET /health: "healthy" only when every configured worker is running.
    Reply handleHealth() const;
    // GET /tools
    Reply handleTools() const;
    // POST /execute. Tool failures are 200 with status "error"; only a bad body is 422.
    Reply handleExecute(const std::string& requestBody) const;

    // Blocks until stop() is called. Returns false if the address cannot be bound.
    // Returns true at once if stop() came first.
    bool run(const std::string& host, int port);
    // Safe from any thread, before or during run().
    void stop();
    bool isRunning() const { return running; }

private:
    MCPManager& manager;
    std::string serviceName;
    std::string serviceVersion;
    std::unique_ptr<httplib::Server> server;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};

    static Reply detail(int status, const std::string& message);
};
