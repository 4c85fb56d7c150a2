#include "core/ConfigManager.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace {
std::string getEnvStr(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

int getEnvInt(const char* name, int fallback, int minValue) {
    std::string raw = getEnvStr(name);
    if (raw.empty()) return fallback;
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer, got '" + raw + "'");
    }
    if (consumed != raw.size()) {
        throw std::runtime_error(std::string(name) + " must be an integer, got '" + raw + "'");
    }
    if (value < minValue) {
        throw std::runtime_error(std::string(name) + " must be at least " + std::to_string(minValue));
    }
    return value;
}

// "${VAR}" references in worker env values are taken from the service environment.
std::string expandEnvReferences(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        auto start = value.find("${", pos);
        if (start == std::string::npos) break;
        auto end = value.find('}', start + 2);
        if (end == std::string::npos) break;
        out += value.substr(pos, start - pos);
        out += getEnvStr(value.substr(start + 2, end - start - 2).c_str());
        pos = end + 1;
    }
    out += value.substr(pos);
    return out;
}
} // namespace

Config Config::fromEnvironment() {
    Config cfg;
    if (auto v = getEnvStr("SERVICE_NAME"); !v.empty()) cfg.service.name = v;
    if (auto v = getEnvStr("SERVICE_VERSION"); !v.empty()) cfg.service.version = v;
    if (auto v = getEnvStr("HOST"); !v.empty()) cfg.service.host = v;
    cfg.service.port = getEnvInt("PORT", cfg.service.port, 1);
    if (cfg.service.port > 65535) {
        throw std::runtime_error("PORT must be in range 1..65535");
    }

    if (auto v = getEnvStr("LOG_LEVEL"); !v.empty()) cfg.logging.level = v;
    if (auto v = getEnvStr("LOG_FORMAT"); !v.empty()) cfg.logging.format = v;
    cfg.logging.file = getEnvStr("LOG_FILE");

    if (auto v = getEnvStr("MCP_CONFIG_PATH"); !v.empty()) cfg.mcp.configPath = v;
    if (auto v = getEnvStr("SANDBOX_DIRECTORY"); !v.empty()) cfg.mcp.sandboxDirectory = v;
    cfg.mcp.defaultTimeout = getEnvInt("DEFAULT_TIMEOUT", cfg.mcp.defaultTimeout, 1);
    cfg.mcp.stopGraceSeconds = getEnvInt("STOP_GRACE_SECONDS", cfg.mcp.stopGraceSeconds, 0);
    return cfg;
}

std::vector<WorkerConfig> Config::loadWorkers(const std::string& pathStr, int defaultTimeout) {
    std::filesystem::path path = std::filesystem::u8path(pathStr);
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("MCP config file not found: " + pathStr);
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open MCP config file: " + pathStr);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON Parse Error in " + pathStr + ": " + e.what());
    }
    return parseWorkers(j, defaultTimeout);
}

std::vector<WorkerConfig> Config::parseWorkers(const nlohmann::json& j, int defaultTimeout) {
    std::vector<WorkerConfig> workers;
    if (!j.is_object()) {
        throw std::runtime_error("MCP config must be a JSON object with a \"servers\" array");
    }
    if (!j.contains("servers")) return workers;
    if (!j["servers"].is_array()) {
        throw std::runtime_error("\"servers\" must be an array");
    }

    std::set<std::string> seen;
    size_t index = 0;
    for (const auto& item : j["servers"]) {
        const std::string where = "servers[" + std::to_string(index++) + "]";
        if (!item.is_object()) {
            throw std::runtime_error(where + " must be an object");
        }
        try {
            WorkerConfig worker;
            worker.name = item.at("name").get<std::string>();
            worker.command = item.at("command").get<std::string>();
            worker.args = item.value("args", std::vector<std::string>{});
            for (const auto& [key, value] : item.value("env", std::map<std::string, std::string>{})) {
                worker.env[key] = expandEnvReferences(value);
            }
            if (item.contains("timeout")) {
                auto timeout = timeoutSecondsFromJson(item["timeout"]);
                if (!timeout) throw std::runtime_error("timeout must be a positive integer that fits in int");
                worker.timeoutSeconds = *timeout;
            } else {
                worker.timeoutSeconds = defaultTimeout;
            }
            worker.description = item.value("description", "");

            if (worker.name.empty()) throw std::runtime_error("name must not be empty");
            if (worker.command.empty()) throw std::runtime_error("command must not be empty");
            if (worker.timeoutSeconds <= 0) throw std::runtime_error("timeout must be positive");
            if (!seen.insert(worker.name).second) {
                throw std::runtime_error("duplicate server name '" + worker.name + "'");
            }
            workers.push_back(std::move(worker));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(where + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(where + ": " + e.what());
        }
    }
    return workers;
}
