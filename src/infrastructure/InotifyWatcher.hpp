/**
 * @file InotifyWatcher.hpp
 * @brief Linux inotify adapter turning raw kernel events into domain::FileEvent values.
 */

#pragma once

#include <sys/epoll.h>
#include <sys/inotify.h>
#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "domain/FileEvent.hpp"
#include "domain/FileWatcher.hpp"
#include "infrastructure/Logger.hpp"

namespace foldernotify::infrastructure {

/**
 * @struct RawEvent
 * @brief Copy of one inotify_event, detached from the read buffer.
 */
struct RawEvent {
    int wd;
    uint32_t mask;
    uint32_t cookie;
    std::string name;
};

/**
 * @class InotifyWatcher
 * @brief Watches a directory (optionally its whole subtree) and reports changes to a single handler.
 *
 * Events are read on one background thread and handed to the handler one at a time, in order.
 * A rename inside the watched tree is reported as one Moved event; a file moved out of the
 * tree is reported as Deleted, and one moved in as Created.
 */
class InotifyWatcher : public domain::FileWatcher {
public:

    /**
     * @brief Sets up inotify and epoll and registers the initial watches.
     * @param root Directory to watch.
     * @param recursive Also watch every subdirectory, including ones created later.
     * @throws WatcherError if inotify cannot be initialized or @p root cannot be watched.
     */
    InotifyWatcher(const std::filesystem::path& root, bool recursive, Logger& logger);
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    /** @brief Starts the event loop on a background thread. */
    void start(EventHandler handler) override;

    /** @brief Interrupts the event loop and joins the background thread. Safe to call twice. */
    void stop() override;

    /** @brief Runs the event loop on the calling thread until stop() or the root disappears. */
    void run(const EventHandler& handler);

    /** @brief False once the loop has exited, including when the root was removed. */
    bool isRunning() const override { return m_running; }

    /** @brief Number of directories registered with inotify. Read it before start() or after stop(). */
    std::size_t watchCount() const { return m_wdCache.size(); }

private:
    void initialize();
    void terminate() noexcept;
    void runOnce(const EventHandler& handler);

    /* Watch management */
    bool watchDirectory(const std::filesystem::path& path);
    int addWatch(const std::filesystem::path& path);
    void zapSubdirectories(const std::filesystem::path& oldPath);
    void rewriteCachedPaths(const std::filesystem::path& oldPrefix, const std::filesystem::path& newPrefix);

    /* Event intake */
    ssize_t readEventsIntoBuffer(int timeoutMs);
    void readEventsFromBuffer(ssize_t length);

    /* Event translation */
    void processEvent(const RawEvent& event, const EventHandler& handler);
    void processMovedFrom(const RawEvent& event, const std::filesystem::path& fullPath,
                          const EventHandler& handler);
    void dispatch(const domain::FileEvent& event, const EventHandler& handler);

    const std::filesystem::path m_root;
    const bool m_recursive;
    Logger& m_logger;

    int m_inotifyFd = -1;
    int m_epollFd = -1;
    int m_eventFd = -1; ///< Written by stop() to interrupt epoll_wait.
    int m_rootWd = -1;

    std::unordered_map<int, std::filesystem::path> m_wdCache; ///< Watch descriptor -> directory.
    std::vector<char> m_eventBuffer;
    std::queue<RawEvent> m_eventQueue;

    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

} // namespace foldernotify::infrastructure
