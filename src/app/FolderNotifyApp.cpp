/**
 * @file FolderNotifyApp.cpp
 * @brief Implementation of FolderNotifyApp.
 */

#include "app/FolderNotifyApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

#include "app/CommandLine.hpp"
#include "application/FolderMonitor.hpp"
#include "application/NotificationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InotifyWatcher.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/NtfyClient.hpp"
#include "infrastructure/WatcherError.hpp"

namespace foldernotify::app {

namespace {

std::atomic<bool> g_stopRequested{false};

void SignalHandler(int) { FolderNotifyApp::RequestStop(); }

constexpr auto kIdlePollInterval = std::chrono::milliseconds(500);

} // namespace

FolderNotifyApp::FolderNotifyApp(std::ostream& logSink)
    : m_logSink(logSink) {}

void FolderNotifyApp::RequestStop() {
    g_stopRequested = true;
}

int FolderNotifyApp::Run(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "foldernotify";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Run(program, args);
}

int FolderNotifyApp::Run(const std::string& program, const std::vector<std::string>& args) {
    infrastructure::Logger logger(m_logSink);

    AppSettings settings;
    try {
        auto options = CommandLine::Parse(args);
        if (options.help) {
            std::cout << CommandLine::Usage(program);
            return 0;
        }
        settings = CommandLine::Resolve(options);
    } catch (const infrastructure::ConfigError& e) {
        logger.error(e.what());
        m_logSink << CommandLine::Usage(program);
        return 1;
    }

    logger.setLevel(settings.logLevel);
    const domain::MonitorConfig& config = settings.monitor;

    std::error_code ec;
    if (!std::filesystem::exists(config.rootPath, ec)) {
        logger.error("The specified path does not exist: " + config.rootPath);
        return 1;
    }

    std::shared_ptr<infrastructure::InotifyWatcher> watcher;
    try {
        watcher = std::make_shared<infrastructure::InotifyWatcher>(config.rootPath, config.recursive, logger);
    } catch (const infrastructure::WatcherError& e) {
        logger.error(e.what());
        return 1;
    }

    auto channel = std::make_shared<infrastructure::NtfyClient>(config.serverUrl);
    auto notifier = std::make_shared<application::NotificationService>(config, channel, logger);
    application::FolderMonitor monitor(config, watcher, notifier, logger);

    g_stopRequested = false;
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    logger.debug("Publishing to " + channel->endpoint());
    monitor.start();

    // Keep the main thread idle until interrupted
    while (!g_stopRequested && monitor.isRunning()) {
        std::this_thread::sleep_for(kIdlePollInterval);
    }

    monitor.stop(g_stopRequested ? application::StopReason::UserRequest
                                 : application::StopReason::WatcherExited);
    return 0;
}

} // namespace foldernotify::app
