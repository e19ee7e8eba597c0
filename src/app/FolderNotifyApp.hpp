/**
 * @file FolderNotifyApp.hpp
 * @brief Process entry: configuration, bootstrap, idle wait and shutdown.
 */

#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace foldernotify::app {

/**
 * @class FolderNotifyApp
 * @brief Orchestrates one monitoring run from argument parsing to the final notification.
 */
class FolderNotifyApp {
public:
    explicit FolderNotifyApp(std::ostream& logSink = std::cerr);

    /**
     * @brief Runs until SIGINT/SIGTERM or until the watched folder disappears.
     * @return 0 on normal shutdown, 1 on configuration or startup errors.
     */
    int Run(int argc, char* argv[]);

    /** @brief Asks a running instance to shut down. Async-signal-safe. */
    static void RequestStop();

private:
    int Run(const std::string& program, const std::vector<std::string>& args);

    std::ostream& m_logSink;
};

} // namespace foldernotify::app
