#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Static description of one MCP worker process.
 *
 * Built once from configuration and never mutated afterwards.
 */
struct WorkerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // overrides merged onto the service environment
    int timeoutSeconds = 30;
    std::string description;
};

// A timeout in whole seconds: an integer in [1, INT_MAX], else nullopt.
std::optional<int> timeoutSecondsFromJson(const nlohmann::json& value);

/**
 * @brief A tool as advertised by a worker through tools/list.
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();

    nlohmann::json toJson() const;
    // Returns std::nullopt when the entry has no string "name".
    static std::optional<ToolDescriptor> fromJson(const nlohmann::json& j);
};

// Metadata returned by the worker in the initialize result.
struct ServerInfo {
    std::string protocolVersion;
    std::string name;
    std::string version;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct ExecuteRequest {
    std::string toolName;
    nlohmann::json arguments = nlohmann::json::object();
    std::optional<int> timeoutSeconds;

    // Throws std::invalid_argument describing the first malformed field.
    static ExecuteRequest fromJson(const nlohmann::json& j);
};

struct ExecuteResponse {
    bool success = false;
    nlohmann::json output;   // set on success
    std::string error;       // set on failure
    double executionTimeMs = 0.0;

    nlohmann::json toJson() const;
};
