/**
 * @file FileWatcher.hpp
 * @brief Interface for sources of filesystem change events.
 */

#pragma once
#include <functional>
#include "FileEvent.hpp"

namespace foldernotify::domain {

/**
 * @class FileWatcher
 * @brief Produces FileEvent values for a single consumer.
 *
 * Implementations deliver events one at a time; the handler is never invoked concurrently
 * with itself.
 */
class FileWatcher {
public:
    using EventHandler = std::function<void(const FileEvent&)>;

    virtual ~FileWatcher() = default;

    /** @brief Begins delivering events to @p handler, typically from a background thread. */
    virtual void start(EventHandler handler) = 0;

    /** @brief Stops delivery and releases the background worker. */
    virtual void stop() = 0;

    /** @brief False once the watcher has stopped, on request or on its own. */
    virtual bool isRunning() const = 0;
};

} // namespace foldernotify::domain
