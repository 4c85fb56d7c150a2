#include "core/ExecutionService.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {
constexpr const char* kJsonType = "application/json";

void send(httplib::Response& res, const ExecutionService::Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJsonType);
}
} // namespace

ExecutionService::ExecutionService(MCPManager& manager, std::string serviceName, std::string serviceVersion)
    : manager(manager),
      serviceName(std::move(serviceName)),
      serviceVersion(std::move(serviceVersion)),
      server(std::make_unique<httplib::Server>()) {
    server->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        send(res, handleRoot());
    });
    server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, handleHealth());
    });
    server->Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        send(res, handleTools());
    });
    server->Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, handleExecute(req.body));
    });
    server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        }
        Logger::getInstance().error("Unhandled error on " + req.path + ": " + message);
        send(res, detail(500, message));
    });
}

ExecutionService::~ExecutionService() {
    stop();
}

ExecutionService::Reply ExecutionService::detail(int status, const std::string& message) {
    return {status, {{"detail", message}}};
}

ExecutionService::Reply ExecutionService::handleRoot() const {
    return {200, {{"service", serviceName}, {"version", serviceVersion}, {"status", "running"}}};
}

ExecutionService::Reply ExecutionService::handleHealth() const {
    auto status = manager.getServerStatus();
    bool healthy = true;
    nlohmann::json servers = nlohmann::json::object();
    for (const auto& [name, state] : status) {
        servers[name] = state;
        if (state != "running") healthy = false;
    }
    return {200, {{"status", healthy ? "healthy" : "unhealthy"},
                  {"version", serviceVersion},
                  {"mcp_servers", servers}}};
}

ExecutionService::Reply ExecutionService::handleTools() const {
    if (!manager.isReady()) {
        return detail(503, "Connection manager not initialized");
    }
    try {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& tool : manager.listAllTools()) {
            tools.push_back(tool.toJson());
        }
        return {200, {{"tools", tools}}};
    } catch (const ManagerStateError& e) {
        return detail(503, e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Failed to list tools: ") + e.what());
        return detail(500, e.what());
    }
}

ExecutionService::Reply ExecutionService::handleExecute(const std::string& requestBody) const {
    ExecuteRequest request;
    try {
        request = ExecuteRequest::fromJson(nlohmann::json::parse(requestBody));
    } catch (const nlohmann::json::parse_error& e) {
        return detail(422, std::string("Invalid JSON body: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return detail(422, e.what());
    }

    if (!manager.isReady()) {
        return detail(503, "Connection manager not initialized");
    }
    try {
        auto response = manager.executeTool(request.toolName, std::move(request.arguments), request.timeoutSeconds);
        return {200, response.toJson()};
    } catch (const ManagerStateError& e) {
        return detail(503, e.what());
    }
}

bool ExecutionService::run(const std::string& host, int port) {
    auto& log = Logger::getInstance();
    if (stopRequested) {
        log.info("Stop requested before the HTTP server started");
        return true;
    }
    if (!server->bind_to_port(host, port)) {
        log.error("Could not bind " + host + ":" + std::to_string(port));
        return false;
    }
    // stop() sets stopRequested then reads running; the order here is the mirror image.
    running = true;
    if (stopRequested) {
        running = false;
        log.info("Stop requested before the HTTP server started");
        return true;
    }
    log.success("Listening on " + host + ":" + std::to_string(port));
    bool ok = server->listen_after_bind();
    running = false;
    return ok;
}

void ExecutionService::stop() {
    stopRequested = true;
    // Between bind and the accept loop httplib ignores stop(); wait for one side to settle.
    while (running && !server->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (server->is_running()) {
        Logger::getInstance().info("Stopping HTTP server");
        server->stop();
    }
}
