/**
 * @file FolderMonitor.hpp
 * @brief Lifecycle of a monitoring run: start/stop notifications around the watcher.
 */

#pragma once
#include <memory>
#include "application/EventFilter.hpp"
#include "application/NotificationService.hpp"
#include "domain/FileWatcher.hpp"
#include "domain/MonitorConfig.hpp"
#include "infrastructure/Logger.hpp"

namespace foldernotify::application {

/**
 * @class FolderMonitor
 * @brief Wires watcher -> filter -> notifier and announces start and stop on the relay.
 */
class FolderMonitor {
public:
    FolderMonitor(const domain::MonitorConfig& config,
                  std::shared_ptr<domain::FileWatcher> watcher,
                  std::shared_ptr<NotificationService> notifier,
                  infrastructure::Logger& logger);

    /** @brief Sends the start notification, then begins watching. */
    void start();

    /**
     * @brief Sends the stop notification, then stops the watcher and waits for it. Idempotent.
     * @param reason Selects the log line and the notification body.
     */
    void stop(StopReason reason = StopReason::UserRequest);

    /** @brief Filters and notifies one event. Never throws. */
    void handleEvent(const domain::FileEvent& event);

    /** @brief True between start() and stop() while the watcher is alive. */
    bool isRunning() const;

private:
    const domain::MonitorConfig& m_config;
    std::shared_ptr<domain::FileWatcher> m_watcher;
    std::shared_ptr<NotificationService> m_notifier;
    infrastructure::Logger& m_logger;
    EventFilter m_filter;
    bool m_started = false;
};

} // namespace foldernotify::application
