/**
 * @file ConfigLoader.hpp
 * @brief Loads monitor settings from a JSON file.
 *
 * Every key is optional; command-line flags override whatever the file provides.
 */

#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace foldernotify::infrastructure {

/** @brief Invalid or missing configuration. Fatal at startup. */
struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @struct FileSettings
 * @brief Values found in a config file. Absent keys stay nullopt.
 */
struct FileSettings {
    std::optional<std::string> path;
    std::optional<std::string> topic;
    std::optional<std::vector<std::string>> extensions;
    std::optional<bool> includeDirectories;
    std::optional<bool> recursive;
    std::optional<std::string> server;
    std::optional<std::string> logLevel;
};

class ConfigLoader {
public:
    /**
     * @brief Reads a JSON object with the keys "path", "topic", "extensions" (array or
     *        comma-separated string), "include_directories", "recursive", "server", "log_level".
     * @throws ConfigError if the file is missing, is not valid JSON or a key has the wrong type.
     */
    static FileSettings LoadFile(const std::string& configPath);

    /** @brief Splits a comma-separated list, trimming whitespace and dropping empty items. */
    static std::vector<std::string> SplitList(const std::string& list);

    /** @brief Lowercases each extension and prefixes it with '.' when missing. */
    static std::set<std::string> NormalizeExtensions(const std::vector<std::string>& extensions);
};

} // namespace foldernotify::infrastructure
