#include "mcp/MCPManager.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <iterator>
#include <mutex>
#include <utility>

MCPManager::MCPManager(std::vector<WorkerConfig> configs, PathSandbox sandbox,
                       std::chrono::milliseconds stopGracePeriod, ClientFactory factory)
    : configs(std::move(configs)),
      sandbox(std::move(sandbox)),
      supervisor(stopGracePeriod),
      factory(std::move(factory)) {
    if (!this->factory) {
        this->factory = [](const WorkerConfig& config, ProcessSupervisor& sup) {
            return std::make_unique<MCPClient>(config, sup);
        };
    }
}

MCPManager::~MCPManager() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Error during connection manager teardown: ") + e.what());
    }
}

void MCPManager::initialize() {
    auto& log = Logger::getInstance();
    std::unique_lock<std::shared_mutex> lock(mtx);
    if (state_ != State::Uninitialized) {
        throw ManagerStateError("Connection manager already initialized");
    }
    state_ = State::Initializing;
    log.info("Initializing MCP connections...");

    for (const auto& config : configs) {
        if (clients.count(config.name)) {
            log.error("Duplicate worker name " + config.name + ", ignoring the later entry");
            continue;
        }
        try {
            auto client = factory(config, supervisor);
            client->connect();
            clients[config.name] = std::move(client);
            log.info("Initialized connection to " + config.name);
        } catch (const std::exception& e) {
            log.error("Failed to initialize " + config.name + ": " + e.what());
        }
    }

    buildToolRegistry();
    state_ = State::Ready;
    log.success("Connection manager initialized with " + std::to_string(clients.size()) + " of " +
                std::to_string(configs.size()) + " servers");
}

void MCPManager::refreshRegistry() {
    std::unique_lock<std::shared_mutex> lock(mtx);
    if (state_ != State::Ready) {
        throw ManagerStateError("Connection manager not initialized");
    }
    buildToolRegistry();
}

// Configured order decides collisions: the last worker declaring a name owns it.
void MCPManager::buildToolRegistry() {
    auto& log = Logger::getInstance();
    log.info("Building tool registry...");
    toolRegistry.clear();
    collisions.clear();

    for (const auto& config : configs) {
        auto it = clients.find(config.name);
        if (it == clients.end()) continue;

        try {
            for (const auto& tool : it->second->listTools()) {
                auto existing = toolRegistry.find(tool.name);
                if (existing != toolRegistry.end() && existing->second != config.name) {
                    log.warn("Tool " + tool.name + " already registered by " + existing->second +
                             ", overwriting with " + config.name);
                    collisions.push_back(tool.name);
                }
                toolRegistry[tool.name] = config.name;
                log.debug("Registered tool " + tool.name + " from " + config.name);
            }
        } catch (const std::exception& e) {
            log.error("Failed to list tools from " + config.name + ": " + e.what());
        }
    }

    log.info("Tool registry built with " + std::to_string(toolRegistry.size()) + " tools");
}

std::vector<ToolDescriptor> MCPManager::listAllTools() {
    std::shared_lock<std::shared_mutex> lock(mtx);
    if (state_ != State::Ready) {
        throw ManagerStateError("Connection manager not initialized");
    }

    std::vector<ToolDescriptor> all;
    for (const auto& config : configs) {
        auto it = clients.find(config.name);
        if (it == clients.end()) continue;
        try {
            auto tools = it->second->listTools();
            all.insert(all.end(), std::make_move_iterator(tools.begin()), std::make_move_iterator(tools.end()));
        } catch (const std::exception& e) {
            Logger::getInstance().error("Failed to get tools from " + config.name + ": " + e.what());
        }
    }
    return all;
}

ExecuteResponse MCPManager::executeTool(const std::string& toolName, nlohmann::json arguments,
                                        std::optional<int> timeoutSeconds) {
    auto& log = Logger::getInstance();
    const auto start = std::chrono::steady_clock::now();

    std::shared_lock<std::shared_mutex> lock(mtx);
    if (state_ != State::Ready) {
        throw ManagerStateError("Connection manager not initialized");
    }

    ExecuteResponse response;
    log.info("Executing tool: " + toolName);
    try {
        response.output = dispatch(toolName, arguments, timeoutSeconds);
        response.success = true;
    } catch (const ToolNotFoundError& e) {
        log.warn(std::string("Tool not found: ") + e.what());
        response.error = e.what();
    } catch (const PathValidationError& e) {
        log.error("Path validation failed for " + toolName + ": " + e.what());
        response.error = std::string("Path validation failed: ") + e.what();
    } catch (const std::exception& e) {
        log.error(std::string("Tool execution failed: ") + e.what());
        response.error = e.what();
    }

    response.executionTimeMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return response;
}

nlohmann::json MCPManager::dispatch(const std::string& toolName, nlohmann::json& arguments,
                                    std::optional<int> timeoutSeconds) {
    auto& log = Logger::getInstance();
    if (PathSandbox::isFilesystemTool(toolName)) {
        log.info("Validating paths for filesystem tool: " + toolName);
        size_t count = sandbox.rewritePathArguments(arguments);
        if (count > 0) {
            log.info("Validated " + std::to_string(count) + " paths for " + toolName);
        }
    }

    auto owner = toolRegistry.find(toolName);
    if (owner == toolRegistry.end()) {
        throw ToolNotFoundError(toolName);
    }

    auto client = clients.find(owner->second);
    if (client == clients.end() || !client->second->isConnected()) {
        throw WorkerUnavailableError(owner->second);
    }

    log.info("Executing tool " + toolName + " on server " + owner->second);
    return client->second->callTool(toolName, arguments, timeoutSeconds);
}

void MCPManager::shutdown() {
    auto& log = Logger::getInstance();
    std::unique_lock<std::shared_mutex> lock(mtx);
    if (state_ == State::Uninitialized) return;
    state_ = State::ShuttingDown;
    log.info("Shutting down connection manager...");

    for (const auto& config : configs) {
        auto it = clients.find(config.name);
        if (it == clients.end()) continue;
        try {
            it->second->disconnect();
        } catch (const std::exception& e) {
            log.error("Error disconnecting from " + config.name + ": " + e.what());
        }
    }

    clients.clear();
    toolRegistry.clear();
    collisions.clear();
    supervisor.stopAll();
    state_ = State::Uninitialized;
    log.info("Connection manager shutdown complete");
}

std::map<std::string, std::string> MCPManager::getServerStatus() {
    std::map<std::string, std::string> status;
    for (const auto& config : configs) {
        status[config.name] = supervisor.isRunning(config.name) ? "running" : "stopped";
    }
    return status;
}

std::optional<std::string> MCPManager::toolOwner(const std::string& toolName) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto it = toolRegistry.find(toolName);
    if (it == toolRegistry.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> MCPManager::connectedWorkers() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    std::vector<std::string> names;
    for (const auto& config : configs) {
        auto it = clients.find(config.name);
        if (it != clients.end() && it->second->isConnected()) names.push_back(config.name);
    }
    return names;
}

std::vector<std::string> MCPManager::toolCollisions() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return collisions;
}
