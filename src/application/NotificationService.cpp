/**
 * @file NotificationService.cpp
 * @brief Implementation of NotificationService.
 */

#include "application/NotificationService.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace foldernotify::application {

namespace {

std::string BaseName(const std::string& path) {
    return fs::path(path).filename().string();
}

domain::NotificationOptions Options(const std::string& title, int priority, const std::string& tags) {
    domain::NotificationOptions options;
    options.title = title;
    options.priority = priority;
    options.tags = tags;
    return options;
}

} // namespace

std::string FormatHumanSize(std::uintmax_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int kLastUnit = 4;

    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < kLastUnit) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << kUnits[unit];
    return oss.str();
}

std::string MoveTitle(const std::string& srcPath, const std::string& destPath) {
    fs::path src(srcPath);
    fs::path dest(destPath);
    if (src.parent_path().lexically_normal() == dest.parent_path().lexically_normal()) {
        return "File Renamed: " + src.filename().string() + " → " + dest.filename().string();
    }
    return "File Moved";
}

std::string LocalTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

NotificationService::NotificationService(const domain::MonitorConfig& config,
                                         std::shared_ptr<domain::NotificationChannel> channel,
                                         infrastructure::Logger& logger)
    : m_config(config), m_channel(std::move(channel)), m_logger(logger) {}

void NotificationService::handleEvent(const domain::FileEvent& event) {
    switch (event.kind) {
        case domain::FileEventKind::Created:
            notifyCreated(event.srcPath);
            break;
        case domain::FileEventKind::Modified:
            notifyModified(event.srcPath);
            break;
        case domain::FileEventKind::Deleted:
            notifyDeleted(event.srcPath);
            break;
        case domain::FileEventKind::Moved:
            if (!event.destPath) {
                m_logger.warning("Move event without destination dropped: " + event.srcPath);
                return;
            }
            notifyMoved(event.srcPath, *event.destPath);
            break;
    }
}

void NotificationService::notifyCreated(const std::string& path) {
    m_logger.info("Created: " + path);
    notifyWritten(path, "created", "File Created", 3, "file_folder,new");
}

void NotificationService::notifyModified(const std::string& path) {
    m_logger.info("Modified: " + path);
    notifyWritten(path, "modified", "File Modified", 2, "pencil");
}

void NotificationService::notifyWritten(const std::string& path, const char* verb, const char* title,
                                        int priority, const char* tags) {
    std::ostringstream message;
    message << "File " << verb << ": " << BaseName(path) << "\n"
            << "Location: " << path << "\n"
            << "Size: " << describeFileSize(path) << "\n"
            << "Time: " << LocalTimestamp();

    sendNotification(message.str(), Options(title, priority, tags));
}

void NotificationService::notifyDeleted(const std::string& path) {
    m_logger.info("Deleted: " + path);

    // No size: the file is gone
    std::ostringstream message;
    message << "File deleted: " << BaseName(path) << "\n"
            << "Location: " << path << "\n"
            << "Time: " << LocalTimestamp();

    sendNotification(message.str(), Options("File Deleted", 4, "wastebasket,warning"));
}

void NotificationService::notifyMoved(const std::string& srcPath, const std::string& destPath) {
    m_logger.info("Moved: " + srcPath + " -> " + destPath);

    std::ostringstream message;
    message << "File moved:\n"
            << "From: " << srcPath << "\n"
            << "To: " << destPath << "\n"
            << "Time: " << LocalTimestamp();

    sendNotification(message.str(), Options(MoveTitle(srcPath, destPath), 3, "arrow_right"));
}

void NotificationService::notifyMonitoringStarted() {
    sendNotification("Started monitoring folder for changes", Options("Folder Monitoring Started", 3, "rocket"));
}

void NotificationService::notifyMonitoringStopped(StopReason reason) {
    const char* message = reason == StopReason::UserRequest
        ? "Folder monitoring stopped by user"
        : "Folder monitoring stopped: the watcher exited";
    sendNotification(message, Options("Monitoring Stopped", 3, "stop_sign"));
}

void NotificationService::sendNotification(const std::string& message, const domain::NotificationOptions& options) {
    try {
        auto payload = domain::MakePayload(m_config.topic, message, options);
        auto result = m_channel->publish(payload);

        if (result.delivered()) {
            m_logger.debug("Notification sent: " + options.title);
        } else if (result.status) {
            m_logger.error("Failed to send notification: " + std::to_string(*result.status));
        } else {
            m_logger.error("Error sending notification: " + result.error);
        }
    } catch (const std::exception& e) {
        m_logger.error(std::string("Error sending notification: ") + e.what());
    }
}

std::string NotificationService::describeFileSize(const std::string& path) {
    try {
        if (fs::is_regular_file(path)) {
            return FormatHumanSize(fs::file_size(path));
        }
        return "N/A (directory)";
    } catch (const std::exception& e) {
        m_logger.error(std::string("Error getting file size: ") + e.what());
        return "Unknown";
    }
}

} // namespace foldernotify::application
