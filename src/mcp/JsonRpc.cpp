#include "mcp/JsonRpc.h"
#include "mcp/McpErrors.h"

namespace jsonrpc {

namespace {

bool isValidId(const nlohmann::json& id) {
    return id.is_number_integer() || id.is_string();
}

std::string truncate(const std::string& s, size_t maxChars = 200) {
    if (s.size() <= maxChars) return s;
    return s.substr(0, maxChars) + "...";
}

ErrorResponse parseError(const nlohmann::json& j) {
    ErrorResponse resp;
    resp.id = j.contains("id") ? j["id"] : nlohmann::json(nullptr);
    const auto& err = j["error"];
    if (err.is_object()) {
        if (err.contains("code") && err["code"].is_number_integer()) {
            resp.code = err["code"].get<int>();
        }
        if (err.contains("message") && err["message"].is_string()) {
            resp.message = err["message"].get<std::string>();
        }
        if (err.contains("data")) {
            resp.data = err["data"];
        }
    } else if (err.is_string()) {
        resp.message = err.get<std::string>();
    }
    if (resp.message.empty()) resp.message = "Unknown error";
    return resp;
}

} // namespace

Message parseMessage(const std::string& line) {
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        throw MalformedResponseError("Invalid JSON: " + truncate(line));
    }
    if (!j.is_object()) {
        throw MalformedResponseError("JSON-RPC message must be an object: " + truncate(line));
    }

    const auto versionIt = j.find("jsonrpc");
    if (versionIt == j.end() || !versionIt->is_string() || *versionIt != kVersion) {
        throw MalformedResponseError("jsonrpc must be \"2.0\": " + truncate(line));
    }

    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            throw MalformedResponseError("method must be a string");
        }
        nlohmann::json params = j.contains("params") ? j["params"] : nlohmann::json(nullptr);
        if (!params.is_null() && !params.is_object() && !params.is_array()) {
            throw MalformedResponseError("params must be an object or an array");
        }
        if (!j.contains("id")) {
            return Notification{j["method"].get<std::string>(), params};
        }
        if (!isValidId(j["id"])) {
            throw MalformedResponseError("JSON-RPC id must be an integer or a string");
        }
        return Request{j["id"], j["method"].get<std::string>(),
                       params.is_null() ? nlohmann::json::object() : params};
    }

    if (j.contains("error")) {
        return parseError(j);
    }

    if (!j.contains("id") || !isValidId(j["id"])) {
        throw MalformedResponseError("Response without a valid id: " + truncate(line));
    }
    SuccessResponse resp;
    resp.id = j["id"];
    if (j.contains("result") && !j["result"].is_null()) {
        resp.result = j["result"];
    }
    return resp;
}

std::string serialize(const Message& message) {
    nlohmann::json j = {{"jsonrpc", kVersion}};
    if (const auto* req = std::get_if<Request>(&message)) {
        j["id"] = req->id;
        j["method"] = req->method;
        j["params"] = req->params.is_null() ? nlohmann::json::object() : req->params;
    } else if (const auto* note = std::get_if<Notification>(&message)) {
        j["method"] = note->method;
        if (!note->params.is_null()) j["params"] = note->params;
    } else if (const auto* ok = std::get_if<SuccessResponse>(&message)) {
        j["id"] = ok->id;
        j["result"] = ok->result;
    } else if (const auto* err = std::get_if<ErrorResponse>(&message)) {
        j["id"] = err->id;
        j["error"] = {{"code", err->code}, {"message", err->message}};
        if (!err->data.is_null()) j["error"]["data"] = err->data;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Request makeRequest(long long id, const std::string& method, const nlohmann::json& params) {
    return Request{id, method, params.is_null() ? nlohmann::json::object() : params};
}

Notification makeNotification(const std::string& method, const nlohmann::json& params) {
    return Notification{method, params};
}

nlohmann::json responseId(const Message& message) {
    if (const auto* ok = std::get_if<SuccessResponse>(&message)) return ok->id;
    if (const auto* err = std::get_if<ErrorResponse>(&message)) return err->id;
    return nullptr;
}

} // namespace jsonrpc
