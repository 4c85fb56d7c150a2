#include "utils/PathSandbox.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <unordered_set>

namespace fs = std::filesystem;

namespace {
constexpr int kMaxSymlinkDepth = 40;
}

PathSandbox::PathSandbox(const std::string& rootDirectory)
    : configuredRoot(fs::u8path(rootDirectory)) {}

const std::vector<std::string>& PathSandbox::pathKeys() {
    static const std::vector<std::string> keys = {
        "path", "file", "filepath", "file_path", "directory", "dir",
        "source", "destination", "dest", "target",
        "paths"  // tools that accept several paths
    };
    return keys;
}

bool PathSandbox::isFilesystemTool(const std::string& toolName) {
    static const std::unordered_set<std::string> tools = {
        "read_file", "read_text_file", "read_media_file", "write_file", "edit_file",
        "create_directory", "list_directory", "move_file", "search_files", "get_file_info",
        "delete_file", "delete_directory", "read_multiple_files"
    };
    return tools.count(toolName) > 0;
}

fs::path PathSandbox::sandboxRoot() const {
    std::error_code ec;
    fs::path root = fs::absolute(configuredRoot, ec);
    if (ec) {
        throw PathValidationError("Invalid sandbox directory: " + configuredRoot.u8string());
    }
    if (!fs::exists(root, ec)) {
        Logger::getInstance().info("Creating sandbox directory: " + root.u8string());
        fs::create_directories(root, ec);
        if (ec) {
            throw PathValidationError("Cannot create sandbox directory " + root.u8string() + ": " + ec.message());
        }
    }
    fs::path canonicalRoot = fs::canonical(root, ec);
    if (ec) {
        throw PathValidationError("Cannot resolve sandbox directory " + root.u8string() + ": " + ec.message());
    }
    return canonicalRoot;
}

// Like realpath(3), but tolerates components that do not exist yet.
fs::path PathSandbox::resolve(const fs::path& absolutePath, int depth) {
    if (depth > kMaxSymlinkDepth) {
        throw PathValidationError("Too many levels of symbolic links: " + absolutePath.u8string());
    }

    fs::path current = absolutePath.root_path();
    for (const auto& part : absolutePath.relative_path()) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            current = current.parent_path();
            continue;
        }

        fs::path next = current / part;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(next, ec))) {
            fs::path target = fs::read_symlink(next, ec);
            if (ec) {
                throw PathValidationError("Cannot read symlink " + next.u8string() + ": " + ec.message());
            }
            current = resolve(target.is_absolute() ? target : current / target, depth + 1);
        } else {
            current = next;
        }
    }
    return current;
}

bool PathSandbox::isWithin(const fs::path& path, const fs::path& root) {
    auto pathIt = path.begin();
    for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt) {
        // A trailing separator shows up as an empty last element
        if (rootIt->empty()) continue;
        if (pathIt == path.end() || *pathIt != *rootIt) return false;
        ++pathIt;
    }
    return true;
}

fs::path PathSandbox::validate(const std::string& pathStr) const {
    if (pathStr.empty()) {
        throw PathValidationError("Invalid path: empty path");
    }

    fs::path root = sandboxRoot();
    fs::path input = fs::u8path(pathStr);
    fs::path resolved = resolve(input.is_absolute() ? input : root / input);

    if (!isWithin(resolved, root)) {
        throw PathValidationError("Path '" + pathStr + "' is outside sandbox directory '" + root.u8string() +
                                  "'. Resolved to: " + resolved.u8string());
    }

    Logger::getInstance().debug("Path validated: " + pathStr + " -> " + resolved.u8string());
    return resolved;
}

std::vector<fs::path> PathSandbox::validateMany(const std::vector<std::string>& paths) const {
    std::vector<fs::path> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(validate(p));
    }
    return out;
}

std::vector<std::string> PathSandbox::extractPathArguments(const nlohmann::json& arguments) {
    std::vector<std::string> paths;
    if (!arguments.is_object()) return paths;

    for (const auto& key : pathKeys()) {
        auto it = arguments.find(key);
        if (it == arguments.end()) continue;
        if (it->is_array()) {
            for (const auto& item : *it) {
                if (item.is_string() && !item.get<std::string>().empty()) {
                    paths.push_back(item.get<std::string>());
                }
            }
        } else if (it->is_string() && !it->get<std::string>().empty()) {
            paths.push_back(it->get<std::string>());
        }
    }
    return paths;
}

size_t PathSandbox::rewritePathArguments(nlohmann::json& arguments) const {
    if (!arguments.is_object()) return 0;

    // Work on a copy so a rejected path leaves the caller's arguments untouched
    nlohmann::json rewritten = arguments;
    size_t count = 0;
    for (const auto& key : pathKeys()) {
        auto it = rewritten.find(key);
        if (it == rewritten.end()) continue;
        if (it->is_array()) {
            for (auto& item : *it) {
                if (!item.is_string() || item.get<std::string>().empty()) continue;
                item = validate(item.get<std::string>()).u8string();
                ++count;
            }
        } else if (it->is_string() && !it->get<std::string>().empty()) {
            *it = validate(it->get<std::string>()).u8string();
            ++count;
        }
    }
    arguments = std::move(rewritten);
    return count;
}
