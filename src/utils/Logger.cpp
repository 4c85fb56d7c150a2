#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <nlohmann/json.hpp>

namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string toLower(const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    std::string timestamp(const char* fmt) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::ostringstream oss;
        oss << std::put_time(std::localtime(&now), fmt);
        return oss.str();
    }

    std::string trimTrailingNewlines(std::string msg) {
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
            msg.pop_back();
        }
        return msg;
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error" || lower == "critical") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogFormat Logger::parseFormat(const std::string& name) {
    return toLower(name) == "json" ? LogFormat::JSON : LogFormat::CONSOLE;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::SUCCESS: return "SUCCESS";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;
    std::ofstream logFile(logFilePath, std::ios::app);
    if (!logFile.is_open()) return;
    logFile << "[" << timestamp("%Y-%m-%d %H:%M:%S") << "] [" << levelName(level) << "] "
            << trimTrailingNewlines(message) << std::endl;
}

void Logger::printJson(LogLevel level, const std::string& message) {
    nlohmann::json line = {
        {"timestamp", timestamp("%Y-%m-%dT%H:%M:%S")},
        {"level", toLower(levelName(level))},
        {"service", serviceName},
        {"version", serviceVersion},
        {"message", trimTrailingNewlines(message)}
    };
    // Invalid UTF-8 coming from worker stderr must not take the logger down.
    std::cerr << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
    }

    // Multi-line messages get the prefix on every line
    std::stringstream ss(trimTrailingNewlines(message));
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
