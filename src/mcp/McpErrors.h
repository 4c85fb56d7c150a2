#pragma once
#include <stdexcept>
#include <string>

// Base of every failure raised by the MCP runtime.
class McpError : public std::runtime_error {
public:
    explicit McpError(const std::string& message) : std::runtime_error(message) {}
};

// The worker executable could not be launched.
class SpawnError : public McpError {
public:
    using McpError::McpError;
};

// initialize failed (timeout, malformed reply, or protocol error); the worker is not usable.
class HandshakeError : public McpError {
public:
    using McpError::McpError;
};

class NotConnectedError : public McpError {
public:
    explicit NotConnectedError(const std::string& worker)
        : McpError("Not connected to " + worker), workerName(worker) {}

    const std::string workerName;
};

class TimeoutError : public McpError {
public:
    TimeoutError(const std::string& worker, int seconds)
        : McpError("Request to " + worker + " timed out after " + std::to_string(seconds) + "s"),
          workerName(worker), timeoutSeconds(seconds) {}

    const std::string workerName;
    const int timeoutSeconds;
};

// The worker answered with a JSON-RPC error object.
class ProtocolError : public McpError {
public:
    ProtocolError(int code, const std::string& remoteMessage)
        : McpError("MCP error: " + remoteMessage), code(code), remoteMessage(remoteMessage) {}

    const int code;
    const std::string remoteMessage;
};

class MalformedResponseError : public McpError {
public:
    using McpError::McpError;
};

// The worker closed its stdout while a response was awaited.
class ConnectionClosedError : public McpError {
public:
    using McpError::McpError;
};

class ToolNotFoundError : public McpError {
public:
    explicit ToolNotFoundError(const std::string& tool)
        : McpError("Tool " + tool + " not found in registry"), toolName(tool) {}

    const std::string toolName;
};

class WorkerUnavailableError : public McpError {
public:
    explicit WorkerUnavailableError(const std::string& worker)
        : McpError("Server " + worker + " not available"), workerName(worker) {}

    const std::string workerName;
};

class PathValidationError : public McpError {
public:
    using McpError::McpError;
};

// Operation invoked while the connection manager is in a state that does not allow it.
class ManagerStateError : public McpError {
public:
    using McpError::McpError;
};
