#include "mcp/McpTypes.h"
#include <limits>
#include <stdexcept>
#include <string>

std::optional<int> timeoutSecondsFromJson(const nlohmann::json& value) {
    // Read wide first; get<int>() wraps 4294967297 to 1.
    constexpr long long kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const auto v = value.get<unsigned long long>();
        if (v == 0 || v > static_cast<unsigned long long>(kMax)) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        const auto v = value.get<long long>();
        if (v <= 0 || v > kMax) return std::nullopt;
        return static_cast<int>(v);
    }
    return std::nullopt;
}

nlohmann::json ToolDescriptor::toJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", inputSchema}
    };
}

std::optional<ToolDescriptor> ToolDescriptor::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }
    ToolDescriptor tool;
    tool.name = j["name"].get<std::string>();
    if (tool.name.empty()) return std::nullopt;
    if (j.contains("description") && j["description"].is_string()) {
        tool.description = j["description"].get<std::string>();
    }
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        tool.inputSchema = j["inputSchema"];
    }
    return tool;
}

ExecuteRequest ExecuteRequest::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }
    if (!j.contains("tool_name") || !j["tool_name"].is_string()) {
        throw std::invalid_argument("tool_name must be a string");
    }
    if (!j.contains("arguments") || !j["arguments"].is_object()) {
        throw std::invalid_argument("arguments must be an object");
    }

    ExecuteRequest req;
    req.toolName = j["tool_name"].get<std::string>();
    req.arguments = j["arguments"];
    if (j.contains("timeout") && !j["timeout"].is_null()) {
        auto timeout = timeoutSecondsFromJson(j["timeout"]);
        if (!timeout) {
            throw std::invalid_argument("timeout must be a positive integer no larger than " +
                                        std::to_string(std::numeric_limits<int>::max()));
        }
        req.timeoutSeconds = *timeout;
    }
    return req;
}

nlohmann::json ExecuteResponse::toJson() const {
    nlohmann::json j = {
        {"status", success ? "success" : "error"},
        {"output", nullptr},
        {"error", nullptr},
        {"execution_time_ms", executionTimeMs}
    };
    if (success) {
        j["output"] = output;
    } else {
        j["error"] = error;
    }
    return j;
}
