/**
 * mock_mcp_worker: scriptable stdio MCP worker used by the integration tests.
 *
 *   --name N               serverInfo.name (default "mock-worker")
 *   --tools a,b            advertised tools (default "echo")
 *   --slow TOOL:MS         sleep MS before answering tools/call for TOOL
 *   --fail-init            answer initialize with a JSON-RPC error
 *   --silent               read requests, never answer
 *   --garbage              answer tools/call with a line that is not JSON
 *   --notify               send a notification before every response
 *   --crash-on-call        exit(2) when tools/call arrives
 *   --exit-on-start        exit(3) before reading anything
 *   --ignore-sigterm       keep running on SIGTERM and after stdin closes
 *   --stderr TEXT          write TEXT to stderr at startup
 *
 * tools/call answers {"content":[{"type":"text","text":"<tool> <arguments json>"}]}.
 * The tool named "explode" answers error -32000; unknown tools answer -32602.
 */
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/JsonRpc.h"
#include "mcp/McpErrors.h"

namespace {

struct Options {
    std::string name = "mock-worker";
    std::vector<std::string> tools{"echo"};
    std::map<std::string, int> slowMs;
    bool failInit = false;
    bool silent = false;
    bool garbage = false;
    bool notify = false;
    bool crashOnCall = false;
    bool ignoreSigterm = false;
};

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void emit(const jsonrpc::Message& message) {
    std::cout << jsonrpc::serialize(message) << '\n';
    std::cout.flush();
}

nlohmann::json toolsList(const Options& opts) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : opts.tools) {
        tools.push_back({
            {"name", tool},
            {"description", "Mock tool " + tool},
            {"inputSchema", {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}}}
        });
    }
    return {{"tools", tools}};
}

jsonrpc::Message handle(const Options& opts, const jsonrpc::Request& req) {
    if (req.method == "initialize") {
        if (opts.failInit) {
            return jsonrpc::ErrorResponse{req.id, -32603, "initialization refused", nullptr};
        }
        return jsonrpc::SuccessResponse{req.id, {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", opts.name}, {"version", "1.0.0"}}}
        }};
    }
    if (req.method == "tools/list") {
        return jsonrpc::SuccessResponse{req.id, toolsList(opts)};
    }
    if (req.method == "tools/call") {
        if (opts.crashOnCall) std::exit(2);
        const std::string tool = req.params.value("name", "");
        nlohmann::json args = req.params.contains("arguments") ? req.params["arguments"] : nlohmann::json::object();

        auto slow = opts.slowMs.find(tool);
        if (slow != opts.slowMs.end()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(slow->second));
        }
        if (tool == "explode") {
            return jsonrpc::ErrorResponse{req.id, -32000, "tool exploded", nullptr};
        }
        bool known = false;
        for (const auto& t : opts.tools) known = known || t == tool;
        if (!known) {
            return jsonrpc::ErrorResponse{req.id, -32602, "Unknown tool: " + tool, nullptr};
        }
        nlohmann::json content = nlohmann::json::array();
        content.push_back({{"type", "text"}, {"text", tool + " " + args.dump()}});
        return jsonrpc::SuccessResponse{req.id, {{"content", content}}};
    }
    return jsonrpc::ErrorResponse{req.id, -32601, "Method not found", nullptr};
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                std::exit(64);
            }
            return argv[++i];
        };
        if (arg == "--name") opts.name = next();
        else if (arg == "--tools") opts.tools = splitList(next());
        else if (arg == "--slow") {
            std::string slowArg = next();
            auto colon = slowArg.find(':');
            if (colon == std::string::npos) {
                std::cerr << "--slow expects TOOL:MS" << std::endl;
                return 64;
            }
            opts.slowMs[slowArg.substr(0, colon)] = std::atoi(slowArg.c_str() + colon + 1);
        }
        else if (arg == "--fail-init") opts.failInit = true;
        else if (arg == "--silent") opts.silent = true;
        else if (arg == "--garbage") opts.garbage = true;
        else if (arg == "--notify") opts.notify = true;
        else if (arg == "--crash-on-call") opts.crashOnCall = true;
        else if (arg == "--exit-on-start") return 3;
        else if (arg == "--ignore-sigterm") {
            opts.ignoreSigterm = true;
            std::signal(SIGTERM, SIG_IGN);
        }
        else if (arg == "--stderr") std::cerr << next() << std::endl;
        else {
            std::cerr << "unknown flag " << arg << std::endl;
            return 64;
        }
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty() || opts.silent) continue;

        jsonrpc::Message message;
        try {
            message = jsonrpc::parseMessage(line);
        } catch (const MalformedResponseError& e) {
            std::cerr << "mock_mcp_worker: " << e.what() << std::endl;
            emit(jsonrpc::ErrorResponse{nullptr, -32700, "Parse error", nullptr});
            continue;
        }

        const auto* req = std::get_if<jsonrpc::Request>(&message);
        if (!req) continue;  // notifications and stray responses need no answer

        if (opts.garbage && req->method == "tools/call") {
            std::cout << "this is not json" << std::endl;
            continue;
        }
        if (opts.notify) {
            emit(jsonrpc::makeNotification("notifications/message", {{"level", "info"}, {"data", "working"}}));
        }
        emit(handle(opts, *req));
    }
    while (opts.ignoreSigterm) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return 0;
}
