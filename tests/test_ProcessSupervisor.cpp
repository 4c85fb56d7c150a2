#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include <signal.h>

#include "mcp/JsonRpc.h"
#include "mcp/McpErrors.h"
#include "mcp/ProcessSupervisor.h"

namespace fs = std::filesystem;

namespace {
WorkerConfig mockWorker(const std::string& name, std::vector<std::string> args = {}) {
    WorkerConfig config;
    config.name = name;
    config.command = MOCK_WORKER_PATH;
    config.args = std::move(args);
    config.timeoutSeconds = 5;
    return config;
}

std::chrono::steady_clock::time_point in(std::chrono::milliseconds d) {
    return std::chrono::steady_clock::now() + d;
}
} // namespace

TEST(ProcessSupervisor, MissingExecutableIsSpawnError) {
    ProcessSupervisor supervisor;
    WorkerConfig config;
    config.name = "ghost";
    config.command = "definitely-not-a-real-command-toolhost";
    EXPECT_THROW(supervisor.start(config), SpawnError);
    EXPECT_FALSE(supervisor.isRunning("ghost"));
    EXPECT_TRUE(supervisor.names().empty());
}

TEST(ProcessSupervisor, NonExecutableFileIsSpawnError) {
    fs::path script = fs::temp_directory_path() / "toolhost_not_executable.sh";
    {
        std::ofstream f(script);
        f << "#!/bin/sh\nexit 0\n";
    }
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);

    ProcessSupervisor supervisor;
    WorkerConfig config;
    config.name = "not-exec";
    config.command = script.u8string();
    EXPECT_THROW(supervisor.start(config), SpawnError);
    EXPECT_FALSE(supervisor.isRunning("not-exec"));
    fs::remove(script);
}

TEST(ProcessSupervisor, ChannelCarriesLinesBothWays) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    auto channel = supervisor.start(mockWorker("echo"));
    ASSERT_TRUE(channel);
    EXPECT_TRUE(supervisor.isRunning("echo"));
    EXPECT_GT(supervisor.pid("echo"), 0);

    channel->writeLine(jsonrpc::serialize(jsonrpc::makeRequest(1, "tools/list", nlohmann::json::object())));
    auto line = channel->readLine(in(std::chrono::seconds(5)));
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["tools"][0]["name"], "echo");

    supervisor.stop("echo");
    EXPECT_FALSE(supervisor.isRunning("echo"));
    EXPECT_EQ(supervisor.pid("echo"), -1);
}

TEST(ProcessSupervisor, ReadLineReturnsNulloptAtDeadline) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    auto channel = supervisor.start(mockWorker("quiet", {"--silent"}));
    auto startedAt = std::chrono::steady_clock::now();
    auto line = channel->readLine(in(std::chrono::milliseconds(300)));
    EXPECT_FALSE(line.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - startedAt, std::chrono::milliseconds(250));
}

TEST(ProcessSupervisor, ChannelIsClosedAfterStop) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    auto channel = supervisor.start(mockWorker("closing"));
    supervisor.stop("closing");
    EXPECT_FALSE(channel->isOpen());
    EXPECT_THROW(channel->writeLine("{}"), ConnectionClosedError);
    EXPECT_THROW(channel->readLine(in(std::chrono::milliseconds(100))), ConnectionClosedError);
}

TEST(ProcessSupervisor, WorkerExitIsSeenAsNotRunning) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    auto channel = supervisor.start(mockWorker("short-lived", {"--exit-on-start"}));
    EXPECT_THROW(channel->readLine(in(std::chrono::seconds(5))), ConnectionClosedError);

    auto deadline = in(std::chrono::seconds(5));
    while (supervisor.isRunning("short-lived") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(supervisor.isRunning("short-lived"));
    // The record stays until stop(); stopping an exited worker is harmless.
    supervisor.stop("short-lived");
}

TEST(ProcessSupervisor, StopEscalatesToSigkill) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(300));
    supervisor.start(mockWorker("stubborn", {"--ignore-sigterm"}));
    pid_t pid = supervisor.pid("stubborn");
    ASSERT_GT(pid, 0);
    // Let the worker install its SIGTERM handler.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto startedAt = std::chrono::steady_clock::now();
    supervisor.stop("stubborn");
    auto took = std::chrono::steady_clock::now() - startedAt;

    EXPECT_GE(took, std::chrono::milliseconds(250));
    EXPECT_LT(took, std::chrono::seconds(5));
    EXPECT_FALSE(supervisor.isRunning("stubborn"));
    // Reaped: the pid no longer names a process of ours.
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST(ProcessSupervisor, StopUnknownNameIsNoOp) {
    ProcessSupervisor supervisor;
    EXPECT_NO_THROW(supervisor.stop("never-started"));
    EXPECT_FALSE(supervisor.isRunning("never-started"));
}

TEST(ProcessSupervisor, StopAllStopsEveryWorker) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    supervisor.start(mockWorker("one"));
    supervisor.start(mockWorker("two", {"--stderr", "hello from two"}));
    EXPECT_EQ(supervisor.names().size(), 2u);

    supervisor.stopAll();
    EXPECT_TRUE(supervisor.names().empty());
    EXPECT_FALSE(supervisor.isRunning("one"));
    EXPECT_FALSE(supervisor.isRunning("two"));
}

TEST(ProcessSupervisor, WorkerEnvironmentIsMergedOntoService) {
    ProcessSupervisor supervisor(std::chrono::milliseconds(500));
    WorkerConfig config;
    config.name = "env";
    config.command = "sh";
    config.args = {"-c", "echo \"$TOOLHOST_TEST_VALUE:${PATH:+has-path}\""};
    config.env["TOOLHOST_TEST_VALUE"] = "injected";

    auto channel = supervisor.start(config);
    auto line = channel->readLine(in(std::chrono::seconds(5)));
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "injected:has-path");
    supervisor.stop("env");
}
