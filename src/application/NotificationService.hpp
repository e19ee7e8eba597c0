/**
 * @file NotificationService.hpp
 * @brief Turns accepted filesystem events into relay notifications and delivers them.
 */

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "domain/FileEvent.hpp"
#include "domain/MonitorConfig.hpp"
#include "domain/NotificationChannel.hpp"
#include "domain/NotificationPayload.hpp"
#include "infrastructure/Logger.hpp"

namespace foldernotify::application {

/**
 * @brief Formats a byte count with two decimals in the first fitting unit of B, KB, MB, GB, TB.
 * @details 0 -> "0.00 B", 1536 -> "1.50 KB", 1073741824 -> "1.00 GB". Anything past GB stays in TB.
 */
std::string FormatHumanSize(std::uintmax_t bytes);

/**
 * @brief Title for a move: "File Renamed: a → b" when both paths share a parent directory,
 *        "File Moved" otherwise.
 */
std::string MoveTitle(const std::string& srcPath, const std::string& destPath);

/** @brief Current local time as "%Y-%m-%d %H:%M:%S". */
std::string LocalTimestamp();

/** @brief Why a monitoring run ended. */
enum class StopReason {
    UserRequest,   ///< SIGINT/SIGTERM or an explicit stop.
    WatcherExited  ///< The watcher ended on its own, e.g. the watched folder was removed.
};

/**
 * @class NotificationService
 * @brief Formats events per kind and publishes them through a NotificationChannel.
 *
 * Delivery is fire-and-forget: the outcome is logged and never reported to the caller.
 * No exception leaves sendNotification.
 */
class NotificationService {
public:
    NotificationService(const domain::MonitorConfig& config,
                        std::shared_ptr<domain::NotificationChannel> channel,
                        infrastructure::Logger& logger);

    /** @brief Routes an event to the matching notify* method. Moves without a destination are dropped. */
    void handleEvent(const domain::FileEvent& event);

    void notifyCreated(const std::string& path);
    void notifyModified(const std::string& path);
    void notifyDeleted(const std::string& path);
    void notifyMoved(const std::string& srcPath, const std::string& destPath);

    void notifyMonitoringStarted();
    void notifyMonitoringStopped(StopReason reason = StopReason::UserRequest);

    /**
     * @brief Builds the payload for the configured topic and publishes it.
     * @details 200 is logged at debug level, any other status or a transport failure at error level.
     */
    void sendNotification(const std::string& message, const domain::NotificationOptions& options = {});

    /**
     * @brief Human-readable size of @p path.
     * @return The formatted size, "N/A (directory)" when the path is not a regular file,
     *         or "Unknown" (logged) when the lookup fails.
     */
    std::string describeFileSize(const std::string& path);

private:
    void notifyWritten(const std::string& path, const char* verb, const char* title, int priority, const char* tags);

    const domain::MonitorConfig& m_config;
    std::shared_ptr<domain::NotificationChannel> m_channel;
    infrastructure::Logger& m_logger;
};

} // namespace foldernotify::application
