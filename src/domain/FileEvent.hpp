/**
 * @file FileEvent.hpp
 * @brief Domain value describing a single filesystem change.
 */

#pragma once
#include <optional>
#include <string>

namespace foldernotify::domain {

/**
 * @enum FileEventKind
 * @brief Nature of a filesystem change.
 */
enum class FileEventKind {
    Created,
    Modified,
    Deleted,
    Moved
};

inline std::string FileEventKindToString(FileEventKind kind) {
    switch (kind) {
        case FileEventKind::Created: return "created";
        case FileEventKind::Modified: return "modified";
        case FileEventKind::Deleted: return "deleted";
        case FileEventKind::Moved: return "moved";
    }
    return "unknown";
}

/**
 * @struct FileEvent
 * @brief One change reported by the watcher. Consumed immediately, never stored.
 */
struct FileEvent {
    FileEventKind kind = FileEventKind::Modified;
    std::string srcPath;                 ///< Path the event is about (source path for moves).
    std::optional<std::string> destPath; ///< Destination path, moves only.
    bool isDirectory = false;
};

} // namespace foldernotify::domain
