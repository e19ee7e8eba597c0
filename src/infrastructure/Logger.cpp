#include "infrastructure/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace foldernotify::infrastructure {

Logger::Logger(std::ostream& sink, LogLevel level)
    : m_sink(sink), m_level(level) {}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level) return;
    m_sink << timestamp() << " - " << LevelName(level) << " - " << message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_level;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> Logger::ParseLevel(const std::string& name) {
    std::string token = name;
    std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c){ return std::tolower(c); });

    if (token == "debug") return LogLevel::Debug;
    if (token == "info") return LogLevel::Info;
    if (token == "warning" || token == "warn") return LogLevel::Warning;
    if (token == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace foldernotify::infrastructure
