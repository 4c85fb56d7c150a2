#include "mcp/ProcessSupervisor.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
constexpr size_t kMaxLineBytes = 16 * 1024 * 1024;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a worker whose stdin is gone must surface as EPIPE, not kill the service.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::string lookupEnv(const std::vector<std::string>& env, const std::string& key) {
    const std::string prefix = key + "=";
    for (const auto& entry : env) {
        if (entry.rfind(prefix, 0) == 0) return entry.substr(prefix.size());
    }
    return "";
}

bool isExecutableFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// PATH lookup against the worker's merged environment, like execvpe would do.
std::optional<std::string> resolveExecutable(const std::string& command, const std::string& pathVar) {
    if (command.empty()) return std::nullopt;
    if (command.find('/') != std::string::npos) {
        if (isExecutableFile(command)) return command;
        return std::nullopt;
    }
    std::stringstream ss(pathVar.empty() ? std::string("/usr/local/bin:/usr/bin:/bin") : pathVar);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + command;
        if (isExecutableFile(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string describeCommand(const WorkerConfig& config) {
    std::string cmd = config.command;
    for (const auto& arg : config.args) cmd += " " + arg;
    return cmd;
}

// Child side only: must stay async-signal-safe.
void redirect(int fd, int target) {
    if (fd == target) {
        ::fcntl(fd, F_SETFD, 0);
    } else {
        ::dup2(fd, target);
    }
}
} // namespace

WorkerChannel::WorkerChannel(const std::string& workerName, int stdinFd, int stdoutFd)
    : workerName(workerName), stdinFd(stdinFd), stdoutFd(stdoutFd) {}

WorkerChannel::~WorkerChannel() {
    close();
}

void WorkerChannel::close() {
    if (closed.exchange(true)) return;
    closeFd(stdinFd);
    closeFd(stdoutFd);
}

void WorkerChannel::writeLine(const std::string& line) {
    if (closed) {
        throw ConnectionClosedError("Connection to " + workerName + " is closed");
    }
    std::string payload = line + "\n";
    size_t total = 0;
    while (total < payload.size()) {
        ssize_t n = ::write(stdinFd, payload.data() + total, payload.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConnectionClosedError("Failed to write to " + workerName + ": " + std::strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
}

std::optional<std::string> WorkerChannel::takeLine() {
    auto pos = buffer.find('\n');
    if (pos == std::string::npos) return std::nullopt;
    std::string line = buffer.substr(0, pos);
    buffer.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<std::string> WorkerChannel::readLine(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        if (auto line = takeLine()) return line;
        if (closed) {
            throw ConnectionClosedError("Connection to " + workerName + " is closed");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return std::nullopt;

        pollfd pfd{stdoutFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, INT_MAX)));
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw ConnectionClosedError("Failed to poll " + workerName + ": " + std::strerror(errno));
        }

        char temp[4096];
        ssize_t n = ::read(stdoutFd, temp, sizeof(temp));
        if (n == 0) {
            throw ConnectionClosedError(workerName + " closed its stdout");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw ConnectionClosedError("Failed to read from " + workerName + ": " + std::strerror(errno));
        }
        buffer.append(temp, static_cast<size_t>(n));
        if (buffer.size() > kMaxLineBytes && buffer.find('\n') == std::string::npos) {
            buffer.clear();
            throw MalformedResponseError("Response line from " + workerName + " exceeds " +
                                         std::to_string(kMaxLineBytes) + " bytes");
        }
    }
}

ProcessSupervisor::ProcessSupervisor(std::chrono::milliseconds gracePeriod) : gracePeriod(gracePeriod) {
    ignoreSigpipe();
}

ProcessSupervisor::~ProcessSupervisor() {
    stopAll();
}

std::shared_ptr<WorkerChannel> ProcessSupervisor::start(const WorkerConfig& config) {
    auto& log = Logger::getInstance();
    log.info("Starting MCP server: " + config.name);
    log.debug("Command: " + describeCommand(config));

    std::vector<std::string> env = buildEnvironment(config.env);
    auto executable = resolveExecutable(config.command, lookupEnv(env, "PATH"));
    if (!executable) {
        log.error("Failed to start MCP server " + config.name + ": command not found: " + config.command);
        throw SpawnError("Failed to start MCP server " + config.name + ": command not found: " + config.command);
    }

    // argv/envp are built before fork; the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(config.args.size() + 2);
    argv.push_back(const_cast<char*>(config.command.c_str()));
    for (const auto& arg : config.args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    // O_CLOEXEC keeps one worker's pipe ends from leaking into the next worker we spawn.
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        log.error("Failed to start MCP server " + config.name + ": pipe: " + std::strerror(err));
        throw SpawnError("Failed to start MCP server " + config.name + ": " + std::strerror(err));
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        closeAll();
        log.error("Failed to start MCP server " + config.name + ": fork: " + std::strerror(err));
        throw SpawnError("Failed to start MCP server " + config.name + ": " + std::strerror(err));
    }

    if (child == 0) {
        // Mask and ignored dispositions survive execve; workers start clean.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &dfl, nullptr);
        redirect(inPipe[0], STDIN_FILENO);
        redirect(outPipe[1], STDOUT_FILENO);
        redirect(errPipe[1], STDERR_FILENO);
        ::execve(executable->c_str(), argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // EOF on the status pipe means execve succeeded and closed it.
    int childErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
        closeAll();
        log.error("Failed to start MCP server " + config.name + ": " + std::strerror(childErr));
        throw SpawnError("Failed to start MCP server " + config.name + ": " + std::strerror(childErr));
    }

    auto proc = std::make_unique<WorkerProcess>();
    proc->name = config.name;
    proc->pid = child;
    proc->channel = std::make_shared<WorkerChannel>(config.name, inPipe[1], outPipe[0]);
    proc->stderrFd = errPipe[0];
    proc->stopDrain = std::make_shared<std::atomic<bool>>(false);
    proc->stderrDrain = std::thread(&ProcessSupervisor::drainStderr, config.name, errPipe[0], proc->stopDrain);
    auto channel = proc->channel;

    std::unique_ptr<WorkerProcess> previous;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = processes.find(config.name);
        if (it != processes.end()) {
            previous = std::move(it->second);
        }
        processes[config.name] = std::move(proc);
    }
    if (previous) {
        log.warn("MCP server " + config.name + " was already running; stopping the old process");
        terminate(*previous);
    }

    log.info("MCP server " + config.name + " started with PID " + std::to_string(child));
    return channel;
}

void ProcessSupervisor::stop(const std::string& name) {
    std::unique_ptr<WorkerProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = processes.find(name);
        if (it == processes.end()) {
            Logger::getInstance().warn("Server " + name + " not found in active processes");
            return;
        }
        proc = std::move(it->second);
        processes.erase(it);
    }

    try {
        terminate(*proc);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Error stopping server " + name + ": " + e.what());
    }
}

void ProcessSupervisor::stopAll() {
    auto all = names();
    if (all.empty()) return;
    Logger::getInstance().info("Stopping all MCP servers...");
    for (const auto& name : all) {
        stop(name);
    }
    Logger::getInstance().info("All MCP servers stopped");
}

bool ProcessSupervisor::isRunning(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = processes.find(name);
    if (it == processes.end()) return false;

    auto& proc = *it->second;
    if (proc.exited) return false;
    int status = 0;
    pid_t r = ::waitpid(proc.pid, &status, WNOHANG);
    if (r == 0) return true;
    // Reaped now, or already gone (ECHILD)
    proc.exited = true;
    if (r == proc.pid) proc.exitStatus = status;
    return false;
}

pid_t ProcessSupervisor::pid(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = processes.find(name);
    return it == processes.end() ? -1 : it->second->pid;
}

std::vector<std::string> ProcessSupervisor::names() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> out;
    out.reserve(processes.size());
    for (const auto& [name, proc] : processes) out.push_back(name);
    return out;
}

void ProcessSupervisor::terminate(WorkerProcess& proc) {
    auto& log = Logger::getInstance();
    log.info("Stopping MCP server: " + proc.name + " (PID " + std::to_string(proc.pid) + ")");

    // Closing stdin first lets well-behaved stdio servers exit on EOF.
    if (proc.channel) proc.channel->close();

    if (!proc.exited && proc.pid > 0) {
        if (::kill(proc.pid, SIGTERM) != 0 && errno != ESRCH) {
            log.error("Failed to signal " + proc.name + ": " + std::strerror(errno));
        }

        auto deadline = std::chrono::steady_clock::now() + gracePeriod;
        bool reaped = false;
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(proc.pid, &status, WNOHANG);
            if (r == proc.pid) {
                proc.exitStatus = status;
                reaped = true;
                break;
            }
            if (r < 0 && errno != EINTR) {
                reaped = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (reaped) {
            log.info("Server " + proc.name + " terminated gracefully");
        } else {
            log.warn("Server " + proc.name + " did not terminate, killing...");
            ::kill(proc.pid, SIGKILL);
            int status = 0;
            while (::waitpid(proc.pid, &status, 0) < 0 && errno == EINTR) {}
            proc.exitStatus = status;
            log.info("Server " + proc.name + " killed");
        }
        proc.exited = true;
    }

    if (proc.stopDrain) proc.stopDrain->store(true);
    if (proc.stderrDrain.joinable()) {
        try {
            proc.stderrDrain.join();
        } catch (const std::system_error& e) {
            log.error("Failed to join stderr reader for " + proc.name + ": " + e.what());
            proc.stderrDrain.detach();
        }
    }
    closeFd(proc.stderrFd);
}

void ProcessSupervisor::drainStderr(std::string name, int fd, std::shared_ptr<std::atomic<bool>> stopFlag) {
    std::string pending;
    char temp[4096];
    while (!stopFlag->load()) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 200);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        ssize_t n = ::read(fd, temp, sizeof(temp));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) break;
        pending.append(temp, static_cast<size_t>(n));

        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty()) Logger::getInstance().debug("[" + name + "] " + line);
        }
    }
    if (!pending.empty()) Logger::getInstance().debug("[" + name + "] " + pending);
}
