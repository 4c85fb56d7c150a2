#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

enum class LogFormat {
    CONSOLE,
    JSON
};

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    void setFormat(LogFormat format) {
        std::lock_guard<std::mutex> lock(mtx);
        this->format = format;
    }

    // Empty path disables the file sink.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setServiceInfo(const std::string& name, const std::string& version) {
        std::lock_guard<std::mutex> lock(mtx);
        serviceName = name;
        serviceVersion = version;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;

        writeToFile(level, message);
        if (format == LogFormat::JSON) {
            printJson(level, message);
        } else {
            printToConsole(level, message);
        }

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    // Accepts debug|info|warning|warn|error (any case); unknown names map to INFO.
    static LogLevel parseLevel(const std::string& name);
    static LogFormat parseFormat(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    LogFormat format = LogFormat::CONSOLE;
    std::string logFilePath;
    std::string serviceName = "toolhost";
    std::string serviceVersion;

    void printToConsole(LogLevel level, const std::string& message);
    void printJson(LogLevel level, const std::string& message);
    void writeToFile(LogLevel level, const std::string& message);
};
