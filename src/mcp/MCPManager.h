#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/MCPClient.h"
#include "mcp/McpTypes.h"
#include "mcp/ProcessSupervisor.h"
#include "utils/PathSandbox.h"

/**
 * @brief Connection manager for the whole worker fleet.
 *
 * Owns one ProcessSupervisor and one client per configured worker, builds
 * the tool-name -> worker routing table and routes tool calls.
 *
 * Lifecycle: Uninitialized -> Initializing -> Ready -> ShuttingDown -> Uninitialized.
 * Only initialize() is valid before Ready. The worker map and the routing
 * table are written by initialize()/refreshRegistry() and cleared by
 * shutdown(); calls for different workers run concurrently.
 */
class MCPManager {
public:
    enum class State {
        Uninitialized,
        Initializing,
        Ready,
        ShuttingDown
    };

    using ClientFactory =
        std::function<std::unique_ptr<IMCPClient>(const WorkerConfig&, ProcessSupervisor&)>;

    // factory defaults to MCPClient; tests substitute fakes.
    MCPManager(std::vector<WorkerConfig> configs, PathSandbox sandbox,
               std::chrono::milliseconds stopGracePeriod = std::chrono::seconds(5),
               ClientFactory factory = nullptr);
    ~MCPManager();

    MCPManager(const MCPManager&) = delete;
    MCPManager& operator=(const MCPManager&) = delete;

    /**
     * @brief Connects every configured worker and builds the routing table.
     *
     * A worker that fails to spawn, handshake or list its tools is logged and
     * left out; it never aborts the others.
     * @throws ManagerStateError unless the manager is Uninitialized.
     */
    void initialize();

    // Rebuilds the routing table from live tools/list calls. Requires Ready.
    void refreshRegistry();

    // Live query of every connected worker; failing workers are skipped.
    std::vector<ToolDescriptor> listAllTools();

    /**
     * @brief Validates path arguments, routes the call and times it.
     *
     * Per-call failures (unknown tool, sandbox violation, unavailable worker,
     * timeout, protocol errors) come back as an error response, never as an exception.
     * @throws ManagerStateError if the manager is not Ready.
     */
    ExecuteResponse executeTool(const std::string& toolName, nlohmann::json arguments,
                                std::optional<int> timeoutSeconds = std::nullopt);

    // Disconnects every worker (errors logged), then clears all state.
    void shutdown();

    // "running" or "stopped" for every configured worker, from the OS view.
    std::map<std::string, std::string> getServerStatus();

    State state() const { return state_; }
    bool isReady() const { return state_ == State::Ready; }
    std::optional<std::string> toolOwner(const std::string& toolName) const;
    std::vector<std::string> connectedWorkers() const;
    std::vector<std::string> toolCollisions() const;
    const std::vector<WorkerConfig>& workerConfigs() const { return configs; }
    const PathSandbox& pathSandbox() const { return sandbox; }

private:
    std::vector<WorkerConfig> configs;
    PathSandbox sandbox;
    ProcessSupervisor supervisor;
    ClientFactory factory;
    std::map<std::string, std::unique_ptr<IMCPClient>> clients;
    std::map<std::string, std::string> toolRegistry;
    std::vector<std::string> collisions;
    std::atomic<State> state_{State::Uninitialized};
    mutable std::shared_mutex mtx;

    void buildToolRegistry();
    nlohmann::json dispatch(const std::string& toolName, nlohmann::json& arguments,
                            std::optional<int> timeoutSeconds);
};
