/**
 * @file Logger.hpp
 * @brief Line-oriented logger writing "timestamp - LEVEL - message" records.
 */

#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace foldernotify::infrastructure {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @class Logger
 * @brief Process-wide log sink. Created once at startup and handed to components by reference.
 *
 * Records below the configured level are dropped. Writes are serialized, the watcher
 * thread and the main thread both log.
 */
class Logger {
public:
    explicit Logger(std::ostream& sink = std::cerr, LogLevel level = LogLevel::Info);

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    void setLevel(LogLevel level);
    LogLevel level() const;

    static const char* LevelName(LogLevel level);

    /** @brief Parses "debug", "info", "warning"/"warn", "error" (case-insensitive). */
    static std::optional<LogLevel> ParseLevel(const std::string& name);

private:
    std::string timestamp() const;

    std::ostream& m_sink;
    LogLevel m_level;
    mutable std::mutex m_mutex;
};

} // namespace foldernotify::infrastructure
