#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/McpTypes.h"
#include "mcp/ProcessSupervisor.h"

constexpr const char* kMcpProtocolVersion = "2024-11-05";

class IMCPClient {
public:
    virtual ~IMCPClient() = default;
    virtual const std::string& name() const = 0;
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual std::vector<ToolDescriptor> listTools() = 0;
    virtual nlohmann::json callTool(const std::string& toolName, const nlohmann::json& arguments,
                                    std::optional<int> timeoutSeconds) = 0;
};

struct ClientIdentity {
    std::string name = "toolhost-execution";
    std::string version = "0.1.0";
};

/**
 * @brief JSON-RPC client for one stdio MCP worker.
 *
 * States: Disconnected -> Handshaking -> Connected, or Handshaking -> Failed.
 * A disconnected or failed client is not reused; build a new one instead.
 *
 * Calls on the same client are serialized. Responses are matched by id, so
 * a late answer to a request that already timed out is dropped instead of
 * being returned to the next caller.
 */
class MCPClient : public IMCPClient {
public:
    enum class State {
        Disconnected,
        Handshaking,
        Connected,
        Failed
    };

    MCPClient(WorkerConfig config, ProcessSupervisor& supervisor, ClientIdentity identity = ClientIdentity());
    ~MCPClient() override = default;

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    const std::string& name() const override { return config.name; }

    /**
     * @brief Starts the worker and performs the initialize handshake.
     *
     * No-op when already connected.
     * @throws SpawnError if the worker cannot be started (state stays Disconnected).
     * @throws HandshakeError if initialize fails; the worker is stopped and the state becomes Failed.
     */
    void connect() override;

    // Stops the worker through the supervisor. No-op unless connected.
    void disconnect() override;

    bool isConnected() const override { return state_ == State::Connected; }
    State state() const { return state_; }
    const ServerInfo& serverInfo() const { return info; }
    const WorkerConfig& workerConfig() const { return config; }

    /**
     * @brief Sends one request and waits for its response.
     * @param timeoutSeconds overrides the worker's configured timeout for this call only.
     * @return The response's result member ({} when absent).
     * @throws NotConnectedError, TimeoutError, ProtocolError, MalformedResponseError, ConnectionClosedError
     */
    nlohmann::json call(const std::string& method, const nlohmann::json& params,
                        std::optional<int> timeoutSeconds = std::nullopt);

    std::vector<ToolDescriptor> listTools() override;

    // Returns the raw tools/call result; callers decide what counts as success.
    nlohmann::json callTool(const std::string& toolName, const nlohmann::json& arguments,
                            std::optional<int> timeoutSeconds) override;

private:
    WorkerConfig config;
    ProcessSupervisor& supervisor;
    ClientIdentity identity;
    std::shared_ptr<WorkerChannel> channel;
    long long requestId = 0;
    std::atomic<State> state_{State::Disconnected};
    bool discarded = false;
    ServerInfo info;
    std::mutex callMtx;

    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params, int timeoutSeconds);
    void sendNotification(const std::string& method, const nlohmann::json& params = nullptr);
};
