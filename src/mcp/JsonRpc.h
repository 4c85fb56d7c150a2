#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

// Newline-delimited JSON-RPC 2.0 framing used on worker stdio.
namespace jsonrpc {

constexpr const char* kVersion = "2.0";

struct Request {
    nlohmann::json id;  // integer or string
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Notification {
    std::string method;
    nlohmann::json params;  // null when absent
};

struct SuccessResponse {
    nlohmann::json id;
    nlohmann::json result = nlohmann::json::object();
};

struct ErrorResponse {
    nlohmann::json id;  // may be null when the peer could not read our id
    int code = 0;
    std::string message;
    nlohmann::json data;
};

using Message = std::variant<Request, Notification, SuccessResponse, ErrorResponse>;

/**
 * @brief Parses one framed line into its message kind.
 * @throws MalformedResponseError if the line is not JSON or fits no message shape.
 */
Message parseMessage(const std::string& line);

// Single-line serialization, without the trailing newline.
std::string serialize(const Message& message);

Request makeRequest(long long id, const std::string& method, const nlohmann::json& params);
Notification makeNotification(const std::string& method, const nlohmann::json& params = nullptr);

// Id carried by a response, or null json for requests/notifications.
nlohmann::json responseId(const Message& message);

} // namespace jsonrpc
