/**
 * @file EventFilter.hpp
 * @brief Decides which filesystem events become notifications.
 */

#pragma once
#include <string>
#include "domain/FileEvent.hpp"
#include "domain/MonitorConfig.hpp"

namespace foldernotify::application {

/**
 * @brief Lowercase extension of the base filename, including the dot ("" when there is none).
 * @details "a/b.TXT" -> ".txt", "a/archive.tar.gz" -> ".gz", "a/.bashrc" -> "", "a/b." -> ".".
 */
std::string ExtensionOf(const std::string& path);

/**
 * @brief Pure predicate over an event and the configuration.
 *
 * Directory events are rejected when directories are excluded. When an extension allow-list is
 * set, file events must carry one of the listed extensions. Everything else is accepted.
 */
bool ShouldProcess(const domain::FileEvent& event, const domain::MonitorConfig& config);

/**
 * @class EventFilter
 * @brief Binds ShouldProcess to the process configuration.
 */
class EventFilter {
public:
    explicit EventFilter(const domain::MonitorConfig& config) : m_config(config) {}

    bool shouldProcess(const domain::FileEvent& event) const { return ShouldProcess(event, m_config); }

private:
    const domain::MonitorConfig& m_config;
};

} // namespace foldernotify::application
