#include "infrastructure/InotifyWatcher.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <stack>
#include <system_error>

#include "infrastructure/WatcherError.hpp"

namespace fs = std::filesystem;

namespace foldernotify::infrastructure {

namespace {

constexpr std::size_t kEventBufferLen = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);
constexpr int kMaxEpollEvents = 2;
constexpr int kMovePairTimeoutMs = 50; ///< How long an IN_MOVED_FROM waits for its IN_MOVED_TO.

constexpr uint32_t kWatchFlags =
    IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB | IN_MOVED_FROM | IN_MOVED_TO | IN_DONT_FOLLOW;

bool IsWithin(const fs::path& path, const fs::path& prefix) {
    const std::string& p = path.native();
    const std::string& root = prefix.native();
    if (p.size() < root.size() || p.compare(0, root.size(), root) != 0) return false;
    return p.size() == root.size() || p[root.size()] == '/';
}

} // namespace

/**
 * Sets up the inotify and epoll instances and watches the root (and its subtree when recursive).
 * @throws WatcherError if any of the file descriptors cannot be created or the root cannot be watched.
 */
InotifyWatcher::InotifyWatcher(const fs::path& root, bool recursive, Logger& logger)
    : m_root(root), m_recursive(recursive), m_logger(logger), m_eventBuffer(kEventBufferLen) {
    try {
        initialize();
        if (!watchDirectory(m_root)) throw WatcherError("Failed to watch directory " + m_root.string());
    } catch (const WatcherError&) {
        terminate();
        throw;
    }
}

InotifyWatcher::~InotifyWatcher() {
    stop();
    terminate();
}

void InotifyWatcher::initialize() {
    m_inotifyFd = inotify_init1(IN_CLOEXEC);
    if (m_inotifyFd < 0) throw WatcherError("Failed to initialize inotify");

    // Written by stop() to interrupt epoll_wait
    m_eventFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_eventFd < 0) throw WatcherError("Failed to initialize event file descriptor");

    m_epollFd = epoll_create1(EPOLL_CLOEXEC);
    if (m_epollFd < 0) throw WatcherError("Failed to initialize epoll instance");

    epoll_event inotifyEvent{};
    inotifyEvent.events = EPOLLIN;
    inotifyEvent.data.fd = m_inotifyFd;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, m_inotifyFd, &inotifyEvent) == -1)
        throw WatcherError("Failed to add inotify file descriptor to epoll");

    epoll_event stopEvent{};
    stopEvent.events = EPOLLIN;
    stopEvent.data.fd = m_eventFd;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, m_eventFd, &stopEvent) == -1)
        throw WatcherError("Failed to add event file descriptor to epoll");
}

void InotifyWatcher::terminate() noexcept {
    for (int* fd : {&m_inotifyFd, &m_epollFd, &m_eventFd}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
    m_wdCache.clear();
}

void InotifyWatcher::start(EventHandler handler) {
    if (m_running || m_thread.joinable()) return;

    m_running = true;
    m_thread = std::thread([this, handler = std::move(handler)]() {
        try {
            run(handler);
        } catch (const std::exception& e) {
            m_logger.error(std::string("Watcher stopped: ") + e.what());
        }
        m_running = false;
    });
}

void InotifyWatcher::stop() {
    m_stopped = true;

    if (m_eventFd >= 0) {
        uint64_t signal = 1;
        if (write(m_eventFd, &signal, sizeof(signal)) == -1) {
            m_logger.warning(std::string("Failed to signal watcher thread: ") + std::strerror(errno));
        }
    }

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

void InotifyWatcher::run(const EventHandler& handler) {
    m_running = true;
    while (!m_stopped) {
        runOnce(handler);
    }
    m_running = false;
}

/**
 * Blocks until at least one event is queued, then translates every queued event.
 */
void InotifyWatcher::runOnce(const EventHandler& handler) {
    while (m_eventQueue.empty() && !m_stopped) {
        ssize_t length = readEventsIntoBuffer(-1);
        if (length > 0) readEventsFromBuffer(length);
    }

    while (!m_eventQueue.empty() && !m_stopped) {
        RawEvent event = m_eventQueue.front();
        m_eventQueue.pop();
        processEvent(event, handler);
    }
}

/**
 * Adds a directory to the watch list. In recursive mode all of its subdirectories are added too.
 * @return True if the directory is watched afterwards, false otherwise.
 */
bool InotifyWatcher::watchDirectory(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        m_logger.warning("Failed to watch directory: " + path.string());
        errno = ENOTDIR;
        return false;
    }

    for (const auto& [_, dir] : m_wdCache) {
        if (dir == path) return true;
    }

    std::stack<fs::path> dirs;
    dirs.push(path);

    while (!dirs.empty()) {
        fs::path dir = dirs.top();
        dirs.pop();
        if (addWatch(dir) == -1) {
            if (dir == path) return false;
            continue; // subdirectory vanished or is unreadable
        }

        if (!m_recursive) continue;

        // directory_iterator instead of recursive_directory_iterator so vanished entries are skipped
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code statEc;
            if (it->is_directory(statEc) && !it->is_symlink(statEc)) {
                dirs.push(it->path());
            }
        }
        ec.clear();
    }

    return true;
}

/**
 * Registers one directory with inotify and caches its path.
 * @return The watch descriptor, or -1 if the watch could not be added.
 */
int InotifyWatcher::addWatch(const fs::path& path) {
    const bool isRoot = m_wdCache.empty();
    uint32_t flags = kWatchFlags;
    if (isRoot) {
        flags |= IN_MOVE_SELF | IN_DELETE_SELF; // the root itself going away ends the watch
    }

    int wd = inotify_add_watch(m_inotifyFd, path.c_str(), flags);
    if (wd == -1) {
        int err = errno;
        m_logger.warning("Failed to add watch for directory: " + path.string() + " (" + std::strerror(err) + ")");
        errno = err;
        return -1;
    }

    m_wdCache[wd] = path;
    if (isRoot) m_rootWd = wd;
    return wd;
}

/**
 * Drops the watches of a directory and of everything below it.
 */
void InotifyWatcher::zapSubdirectories(const fs::path& oldPath) {
    std::vector<int> toRemove;
    for (const auto& [wd, path] : m_wdCache) {
        if (IsWithin(path, oldPath)) toRemove.push_back(wd);
    }

    for (int wd : toRemove) {
        m_wdCache.erase(wd);
        inotify_rm_watch(m_inotifyFd, wd); // fails harmlessly when the kernel already dropped it
    }
}

/**
 * The directory oldPrefix was renamed to newPrefix; fix up the cached paths of it and its subdirectories.
 */
void InotifyWatcher::rewriteCachedPaths(const fs::path& oldPrefix, const fs::path& newPrefix) {
    for (auto& [wd, path] : m_wdCache) {
        if (!IsWithin(path, oldPrefix)) continue;
        std::string suffix = path.native().substr(oldPrefix.native().size());
        path = fs::path(newPrefix.native() + suffix);
    }
}

/**
 * Waits for readiness and reads pending inotify events into the buffer.
 * @param timeoutMs epoll timeout, -1 blocks.
 * @return The number of bytes read, 0 on timeout, interruption or stop request.
 * @throws WatcherError if reading the inotify descriptor fails.
 */
ssize_t InotifyWatcher::readEventsIntoBuffer(int timeoutMs) {
    epoll_event events[kMaxEpollEvents];
    int triggered = epoll_wait(m_epollFd, events, kMaxEpollEvents, timeoutMs);
    if (triggered == -1) {
        if (errno == EINTR) return 0;
        throw WatcherError("Failed to wait for inotify events");
    }

    ssize_t length = 0;
    for (int i = 0; i < triggered; ++i) {
        if (events[i].data.fd == m_eventFd) {
            m_stopped = true;
            return 0;
        }

        if (events[i].data.fd == m_inotifyFd) {
            length = read(m_inotifyFd, m_eventBuffer.data(), m_eventBuffer.size());
            if (length == -1) {
                if (errno == EINTR || errno == EAGAIN) return 0;
                throw WatcherError("Failed to read events from inotify");
            }
        }
    }

    return length;
}

void InotifyWatcher::readEventsFromBuffer(ssize_t length) {
    ssize_t offset = 0;
    while (offset < length) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(m_eventBuffer.data() + offset);

        // IN_IGNORED follows watch removal, which this class tracks itself
        if (!(event->mask & IN_IGNORED)) {
            RawEvent raw;
            raw.wd = event->wd;
            raw.mask = event->mask;
            raw.cookie = event->cookie;
            if (event->len > 0) raw.name = event->name;
            m_eventQueue.push(std::move(raw));
        }

        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
    }
}

void InotifyWatcher::processEvent(const RawEvent& event, const EventHandler& handler) {
    if (event.mask & IN_Q_OVERFLOW) {
        m_logger.warning("Inotify event queue overflowed; some changes were not reported.");
        return;
    }

    if ((event.mask & (IN_DELETE_SELF | IN_MOVE_SELF)) && event.wd == m_rootWd) {
        m_logger.info("Nothing to watch.");
        m_stopped = true;
        return;
    }

    auto dir = m_wdCache.find(event.wd);
    if (dir == m_wdCache.end()) return; // stale descriptor of a dropped directory
    if (event.name.empty()) return;     // event about the watched directory itself

    const fs::path fullPath = dir->second / event.name;
    const bool isDirectory = event.mask & IN_ISDIR;

    domain::FileEvent fileEvent;
    fileEvent.srcPath = fullPath.string();
    fileEvent.isDirectory = isDirectory;

    if (event.mask & IN_MOVED_FROM) {
        processMovedFrom(event, fullPath, handler);
    } else if (event.mask & (IN_CREATE | IN_MOVED_TO)) {
        if (isDirectory && m_recursive) watchDirectory(fullPath);
        fileEvent.kind = domain::FileEventKind::Created;
        dispatch(fileEvent, handler);
    } else if (event.mask & IN_DELETE) {
        if (isDirectory) zapSubdirectories(fullPath);
        fileEvent.kind = domain::FileEventKind::Deleted;
        dispatch(fileEvent, handler);
    } else if (event.mask & (IN_MODIFY | IN_ATTRIB)) {
        fileEvent.kind = domain::FileEventKind::Modified;
        dispatch(fileEvent, handler);
    }
}

/**
 * Pairs an IN_MOVED_FROM with the IN_MOVED_TO carrying the same cookie. Without a partner the
 * entry left the watched tree and is reported as deleted.
 */
void InotifyWatcher::processMovedFrom(const RawEvent& event, const fs::path& fullPath, const EventHandler& handler) {
    const bool isDirectory = event.mask & IN_ISDIR;

    // The partner event may not have been read yet
    if (m_eventQueue.empty()) {
        ssize_t length = readEventsIntoBuffer(kMovePairTimeoutMs);
        if (length > 0) readEventsFromBuffer(length);
    }

    if (!m_eventQueue.empty()) {
        const RawEvent next = m_eventQueue.front();
        if ((next.mask & IN_MOVED_TO) && next.cookie == event.cookie) {
            m_eventQueue.pop();

            auto nextDir = m_wdCache.find(next.wd);
            if (nextDir != m_wdCache.end()) {
                const fs::path destPath = nextDir->second / next.name;
                if (isDirectory && m_recursive) rewriteCachedPaths(fullPath, destPath);

                domain::FileEvent moved;
                moved.kind = domain::FileEventKind::Moved;
                moved.srcPath = fullPath.string();
                moved.destPath = destPath.string();
                moved.isDirectory = isDirectory;
                dispatch(moved, handler);
                return;
            }
        }
    }

    if (isDirectory) zapSubdirectories(fullPath);

    domain::FileEvent deleted;
    deleted.kind = domain::FileEventKind::Deleted;
    deleted.srcPath = fullPath.string();
    deleted.isDirectory = isDirectory;
    dispatch(deleted, handler);
}

void InotifyWatcher::dispatch(const domain::FileEvent& event, const EventHandler& handler) {
    try {
        handler(event);
    } catch (const std::exception& e) {
        m_logger.error("Failed to handle " + domain::FileEventKindToString(event.kind) + " event for "
                       + event.srcPath + ": " + e.what());
    }
}

} // namespace foldernotify::infrastructure
