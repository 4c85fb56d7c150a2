#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/McpTypes.h"

struct Config {
    struct Service {
        std::string name = "execution-service";
        std::string version = "0.1.0";
        std::string host = "0.0.0.0";
        int port = 8002;
    } service;

    struct Logging {
        std::string level = "info";
        std::string format = "console";
        std::string file;  // empty: no log file
    } logging;

    struct MCP {
        std::string configPath = "config/mcp_servers.json";
        int defaultTimeout = 30;
        std::string sandboxDirectory = "/tmp/execution-sandbox";
        int stopGraceSeconds = 5;
    } mcp;

    std::vector<WorkerConfig> mcpServers;

    /**
     * @brief Reads the service settings from environment variables, defaults otherwise.
     *
     * SERVICE_NAME, SERVICE_VERSION, HOST, PORT, LOG_LEVEL, LOG_FORMAT, LOG_FILE,
     * MCP_CONFIG_PATH, DEFAULT_TIMEOUT, SANDBOX_DIRECTORY, STOP_GRACE_SECONDS.
     * The worker list is not loaded here; see loadWorkers().
     * @throws std::runtime_error naming the variable when a number is invalid.
     */
    static Config fromEnvironment();

    /**
     * @brief Loads {"servers": [...]} from a JSON file.
     * @throws std::runtime_error if the file is missing, unparsable or invalid.
     */
    static std::vector<WorkerConfig> loadWorkers(const std::string& path, int defaultTimeout);

    static std::vector<WorkerConfig> parseWorkers(const nlohmann::json& j, int defaultTimeout);
};
