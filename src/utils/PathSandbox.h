#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Keeps filesystem tool arguments inside one sandbox directory.
 *
 * Relative paths are resolved against the sandbox root, absolute paths as
 * given. Every symlink on the way is followed (dangling ones included)
 * before the containment check, so a link inside the sandbox that points
 * outside of it is rejected.
 */
class PathSandbox {
public:
    explicit PathSandbox(const std::string& rootDirectory);

    /**
     * @brief Absolute, canonical sandbox root. Creates the directory (and parents) if needed.
     * @throws PathValidationError if the directory cannot be created.
     */
    std::filesystem::path sandboxRoot() const;

    /**
     * @brief Resolves a path and checks it lies at or under the sandbox root.
     * @throws PathValidationError naming the input and the resolved target.
     */
    std::filesystem::path validate(const std::string& path) const;

    // All-or-nothing: the first invalid path fails the whole batch.
    std::vector<std::filesystem::path> validateMany(const std::vector<std::string>& paths) const;

    // Values stored under the known path keys, list values flattened.
    static std::vector<std::string> extractPathArguments(const nlohmann::json& arguments);

    /**
     * @brief Replaces every path argument with its validated absolute form.
     * @return Number of rewritten values. arguments is left untouched if any path is rejected.
     */
    size_t rewritePathArguments(nlohmann::json& arguments) const;

    static bool isFilesystemTool(const std::string& toolName);
    static const std::vector<std::string>& pathKeys();

private:
    std::filesystem::path configuredRoot;

    static std::filesystem::path resolve(const std::filesystem::path& absolutePath, int depth = 0);
    static bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root);
};
