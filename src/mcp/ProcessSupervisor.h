#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "mcp/McpTypes.h"

/**
 * @brief Line-oriented view of a worker's stdin/stdout pipes.
 *
 * Handed out by ProcessSupervisor::start. The supervisor closes the
 * descriptors when the worker is stopped; any later read or write on the
 * channel raises ConnectionClosedError instead of touching a stale fd.
 */
class WorkerChannel {
public:
    WorkerChannel(const std::string& workerName, int stdinFd, int stdoutFd);
    ~WorkerChannel();

    WorkerChannel(const WorkerChannel&) = delete;
    WorkerChannel& operator=(const WorkerChannel&) = delete;

    // Writes line + '\n' completely. Throws ConnectionClosedError if the pipe is gone.
    void writeLine(const std::string& line);

    /**
     * @brief Reads the next newline-terminated line.
     * @return The line without its terminator, or std::nullopt once the deadline passes.
     * @throws ConnectionClosedError on EOF; MalformedResponseError if a line exceeds the size limit.
     */
    std::optional<std::string> readLine(std::chrono::steady_clock::time_point deadline);

    void close();
    bool isOpen() const { return !closed; }
    const std::string& name() const { return workerName; }

private:
    std::string workerName;
    int stdinFd;
    int stdoutFd;
    std::string buffer;
    std::atomic<bool> closed{false};

    std::optional<std::string> takeLine();
};

/**
 * @brief Owns the OS-level lifecycle of MCP worker processes.
 *
 * Knows nothing about the protocol spoken on the pipes. One record per
 * worker name; callers must not start the same name twice.
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(std::chrono::milliseconds gracePeriod = std::chrono::seconds(5));
    virtual ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief Spawns config.command with config.args and config.env merged onto the current environment.
     * @throws SpawnError if the executable cannot be launched.
     */
    virtual std::shared_ptr<WorkerChannel> start(const WorkerConfig& config);

    // SIGTERM, wait for the grace period, then SIGKILL. Unknown names are ignored.
    virtual void stop(const std::string& name);
    virtual void stopAll();
    virtual bool isRunning(const std::string& name);

    pid_t pid(const std::string& name);
    std::vector<std::string> names();

private:
    struct WorkerProcess {
        std::string name;
        pid_t pid = -1;
        std::shared_ptr<WorkerChannel> channel;
        int stderrFd = -1;
        std::shared_ptr<std::atomic<bool>> stopDrain;
        std::thread stderrDrain;
        bool exited = false;
        int exitStatus = 0;
    };

    std::chrono::milliseconds gracePeriod;
    std::mutex mtx;
    std::map<std::string, std::unique_ptr<WorkerProcess>> processes;

    void terminate(WorkerProcess& proc);
    static void drainStderr(std::string name, int fd, std::shared_ptr<std::atomic<bool>> stopFlag);
};
