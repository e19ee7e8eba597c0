/**
 * @file MonitorConfig.hpp
 * @brief Process-wide configuration, built once at startup.
 */

#pragma once
#include <set>
#include <string>

namespace foldernotify::domain {

constexpr const char* kDefaultRelayUrl = "https://ntfy.sh";

/**
 * @struct MonitorConfig
 * @brief Read-only settings shared by the filter, the notifier and the watcher.
 */
struct MonitorConfig {
    std::string topic;                     ///< Relay topic all notifications go to.
    std::set<std::string> allowedExtensions; ///< Lowercase, dot-prefixed. Empty means allow all.
    bool excludeDirectories = true;
    std::string rootPath;
    bool recursive = false;
    std::string serverUrl = kDefaultRelayUrl;
};

} // namespace foldernotify::domain
