#include "application/FolderMonitor.hpp"
#include <filesystem>
#include <sstream>

namespace foldernotify::application {

namespace {

std::string JoinExtensions(const std::set<std::string>& extensions) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& ext : extensions) {
        if (!first) oss << ", ";
        oss << ext;
        first = false;
    }
    return oss.str();
}

std::string AbsolutePath(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path : absolute.string();
}

} // namespace

FolderMonitor::FolderMonitor(const domain::MonitorConfig& config,
                             std::shared_ptr<domain::FileWatcher> watcher,
                             std::shared_ptr<NotificationService> notifier,
                             infrastructure::Logger& logger)
    : m_config(config),
      m_watcher(std::move(watcher)),
      m_notifier(std::move(notifier)),
      m_logger(logger),
      m_filter(config) {}

void FolderMonitor::start() {
    if (m_started) return;
    m_started = true;

    m_notifier->notifyMonitoringStarted();
    m_logger.info("Started monitoring. Notifications will be sent to topic: " + m_config.topic);
    if (!m_config.allowedExtensions.empty()) {
        m_logger.info("Monitoring only these extensions: " + JoinExtensions(m_config.allowedExtensions));
    }

    m_watcher->start([this](const domain::FileEvent& event) { handleEvent(event); });

    m_logger.info("Monitoring folder: " + AbsolutePath(m_config.rootPath)
                  + " (recursive: " + (m_config.recursive ? "true" : "false") + ")");
}

void FolderMonitor::stop(StopReason reason) {
    if (!m_started) return;
    m_started = false;

    if (reason == StopReason::UserRequest) {
        m_logger.info("Monitoring stopped by user");
    } else {
        m_logger.warning("Monitoring stopped: watcher exited");
    }
    m_notifier->notifyMonitoringStopped(reason);
    m_watcher->stop();
}

void FolderMonitor::handleEvent(const domain::FileEvent& event) {
    if (!m_filter.shouldProcess(event)) {
        m_logger.debug("Ignored " + domain::FileEventKindToString(event.kind) + " event: " + event.srcPath);
        return;
    }

    try {
        m_notifier->handleEvent(event);
    } catch (const std::exception& e) {
        m_logger.error("Failed to process event for " + event.srcPath + ": " + e.what());
    }
}

bool FolderMonitor::isRunning() const {
    return m_started && m_watcher->isRunning();
}

} // namespace foldernotify::application
