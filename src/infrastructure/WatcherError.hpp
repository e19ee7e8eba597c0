/**
 * @file WatcherError.hpp
 * @brief Exception raised when the inotify watcher cannot be set up.
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace foldernotify::infrastructure {

struct WatcherError : public std::runtime_error {
    explicit WatcherError(const std::string& message)
        : std::runtime_error(message + ": " + std::strerror(errno)) {}
};

} // namespace foldernotify::infrastructure
