#include "mcp/MCPClient.h"
#include "mcp/JsonRpc.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <chrono>
#include <utility>
#include <variant>

namespace {
std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}
} // namespace

MCPClient::MCPClient(WorkerConfig config, ProcessSupervisor& supervisor, ClientIdentity identity)
    : config(std::move(config)), supervisor(supervisor), identity(std::move(identity)) {}

void MCPClient::connect() {
    auto& log = Logger::getInstance();
    std::lock_guard<std::mutex> lock(callMtx);
    if (state_ == State::Connected) {
        log.debug("Already connected to " + config.name);
        return;
    }
    if (state_ == State::Failed || discarded) {
        throw HandshakeError("Client for " + config.name + " cannot be reused; create a new client");
    }

    log.info("Connecting to MCP server: " + config.name);
    channel = supervisor.start(config);
    state_ = State::Handshaking;

    try {
        nlohmann::json params = {
            {"protocolVersion", kMcpProtocolVersion},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", identity.name}, {"version", identity.version}}}
        };
        auto result = sendRequest("initialize", params, config.timeoutSeconds);
        if (!result.is_object()) {
            throw MalformedResponseError("initialize result is not an object");
        }

        info = ServerInfo();
        info.protocolVersion = stringField(result, "protocolVersion");
        if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
            info.name = stringField(result["serverInfo"], "name");
            info.version = stringField(result["serverInfo"], "version");
        }
        if (result.contains("capabilities") && result["capabilities"].is_object()) {
            info.capabilities = result["capabilities"];
        }
        log.info("MCP server " + config.name + " initialized: protocol=" +
                 (info.protocolVersion.empty() ? "unknown" : info.protocolVersion) +
                 ", server=" + (info.name.empty() ? "unknown" : info.name));

        sendNotification("notifications/initialized");
    } catch (const std::exception& e) {
        state_ = State::Failed;
        channel.reset();
        supervisor.stop(config.name);
        throw HandshakeError("Handshake with " + config.name + " failed: " + e.what());
    }

    state_ = State::Connected;
    log.success("Connected to MCP server: " + config.name);
}

void MCPClient::disconnect() {
    std::lock_guard<std::mutex> lock(callMtx);
    if (state_ != State::Connected) return;

    Logger::getInstance().info("Disconnecting from MCP server: " + config.name);
    supervisor.stop(config.name);
    channel.reset();
    state_ = State::Disconnected;
    discarded = true;
}

nlohmann::json MCPClient::call(const std::string& method, const nlohmann::json& params,
                               std::optional<int> timeoutSeconds) {
    if (state_ != State::Connected) {
        throw NotConnectedError(config.name);
    }
    std::lock_guard<std::mutex> lock(callMtx);
    // Re-check: a disconnect may have won the lock
    if (state_ != State::Connected) {
        throw NotConnectedError(config.name);
    }
    return sendRequest(method, params, timeoutSeconds.value_or(config.timeoutSeconds));
}

std::vector<ToolDescriptor> MCPClient::listTools() {
    auto& log = Logger::getInstance();
    log.info("Listing tools from " + config.name);
    auto result = call("tools/list", nlohmann::json::object());

    std::vector<ToolDescriptor> tools;
    if (!result.contains("tools") || !result["tools"].is_array()) {
        log.info("Found 0 tools from " + config.name);
        return tools;
    }
    for (const auto& item : result["tools"]) {
        auto tool = ToolDescriptor::fromJson(item);
        if (!tool) {
            log.warn("Ignoring tool without a name from " + config.name + ": " + item.dump());
            continue;
        }
        tools.push_back(std::move(*tool));
    }
    log.info("Found " + std::to_string(tools.size()) + " tools from " + config.name);
    return tools;
}

nlohmann::json MCPClient::callTool(const std::string& toolName, const nlohmann::json& arguments,
                                   std::optional<int> timeoutSeconds) {
    auto& log = Logger::getInstance();
    log.info("Calling tool " + toolName + " on " + config.name);
    log.debug("Arguments: " + arguments.dump());

    nlohmann::json params = {{"name", toolName}, {"arguments", arguments}};
    auto result = call("tools/call", params, timeoutSeconds);

    log.info("Tool " + toolName + " executed successfully");
    return result;
}

nlohmann::json MCPClient::sendRequest(const std::string& method, const nlohmann::json& params, int timeoutSeconds) {
    auto& log = Logger::getInstance();
    const long long id = ++requestId;
    log.debug("Sending request to " + config.name + ": " + method + " (id=" + std::to_string(id) + ")");
    channel->writeLine(jsonrpc::serialize(jsonrpc::makeRequest(id, method, params)));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);
    while (true) {
        auto line = channel->readLine(deadline);
        if (!line) {
            throw TimeoutError(config.name, timeoutSeconds);
        }
        if (line->empty()) continue;

        jsonrpc::Message message;
        try {
            message = jsonrpc::parseMessage(*line);
        } catch (const MalformedResponseError& e) {
            throw MalformedResponseError("Invalid JSON response from " + config.name + ": " + e.what());
        }

        if (const auto* note = std::get_if<jsonrpc::Notification>(&message)) {
            log.debug("Notification from " + config.name + ": " + note->method);
            continue;
        }
        if (const auto* req = std::get_if<jsonrpc::Request>(&message)) {
            // Server-initiated requests (sampling, roots, ...) are not offered by this client
            log.warn("Rejecting request " + req->method + " from " + config.name);
            channel->writeLine(jsonrpc::serialize(jsonrpc::ErrorResponse{req->id, -32601, "Method not found", nullptr}));
            continue;
        }

        // A null id only comes back when the worker could not parse what we sent.
        nlohmann::json rid = jsonrpc::responseId(message);
        bool matches = rid.is_null() || (rid.is_number_integer() && rid.get<long long>() == id);
        if (!matches) {
            log.warn("Discarding stale response from " + config.name + " (id=" + rid.dump() +
                     ", expected " + std::to_string(id) + ")");
            continue;
        }

        if (const auto* err = std::get_if<jsonrpc::ErrorResponse>(&message)) {
            throw ProtocolError(err->code, err->message);
        }
        return std::get<jsonrpc::SuccessResponse>(message).result;
    }
}

void MCPClient::sendNotification(const std::string& method, const nlohmann::json& params) {
    Logger::getInstance().debug("Sending notification to " + config.name + ": " + method);
    channel->writeLine(jsonrpc::serialize(jsonrpc::makeNotification(method, params)));
}
