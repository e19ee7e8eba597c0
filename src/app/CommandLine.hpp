/**
 * @file CommandLine.hpp
 * @brief Command-line flags and their resolution into the run configuration.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/MonitorConfig.hpp"
#include "infrastructure/Logger.hpp"

namespace foldernotify::app {

/**
 * @struct CommandLineOptions
 * @brief Raw flag values. Unset value flags stay nullopt.
 */
struct CommandLineOptions {
    std::optional<std::string> path;
    std::optional<std::string> topic;
    std::optional<std::string> extensions;
    std::optional<std::string> server;
    std::optional<std::string> configFile;
    std::optional<std::string> logLevel;
    bool includeDirectories = false;
    bool recursive = false;
    bool help = false;
};

/**
 * @struct AppSettings
 * @brief Everything a run needs, after merging the config file and the flags.
 */
struct AppSettings {
    domain::MonitorConfig monitor;
    infrastructure::LogLevel logLevel = infrastructure::LogLevel::Info;
};

class CommandLine {
public:
    /**
     * @brief Parses "--flag value" and "--flag=value" forms.
     * @throws infrastructure::ConfigError on unknown flags, missing values or stray arguments.
     */
    static CommandLineOptions Parse(const std::vector<std::string>& args);

    /**
     * @brief Merges the optional config file with the flags; flags win.
     * @throws infrastructure::ConfigError if --path or --topic is missing, the config file is
     *         unreadable or the log level is unknown.
     */
    static AppSettings Resolve(const CommandLineOptions& options);

    static std::string Usage(const std::string& program);
};

} // namespace foldernotify::app
