/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace foldernotify::infrastructure {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c){ return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

template <typename T>
std::optional<T> ReadKey(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

} // namespace

FileSettings ConfigLoader::LoadFile(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        throw ConfigError("Config file does not exist: " + configPath);
    }

    json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Error reading " + configPath + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Config file must contain a JSON object: " + configPath);
    }

    FileSettings settings;
    try {
        settings.path = ReadKey<std::string>(j, "path");
        settings.topic = ReadKey<std::string>(j, "topic");
        settings.includeDirectories = ReadKey<bool>(j, "include_directories");
        settings.recursive = ReadKey<bool>(j, "recursive");
        settings.server = ReadKey<std::string>(j, "server");
        settings.logLevel = ReadKey<std::string>(j, "log_level");

        if (j.contains("extensions")) {
            const auto& ext = j["extensions"];
            if (ext.is_string()) {
                settings.extensions = SplitList(ext.get<std::string>());
            } else if (!ext.is_null()) {
                settings.extensions = ext.get<std::vector<std::string>>();
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value in " + configPath + ": " + e.what());
    }

    return settings;
}

std::vector<std::string> ConfigLoader::SplitList(const std::string& list) {
    std::vector<std::string> items;
    std::string::size_type start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string item = Trim(list.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

std::set<std::string> ConfigLoader::NormalizeExtensions(const std::vector<std::string>& extensions) {
    std::set<std::string> normalized;
    for (const auto& raw : extensions) {
        std::string ext = Trim(raw);
        if (ext.empty()) continue;
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
        if (ext.front() != '.') ext.insert(ext.begin(), '.');
        normalized.insert(ext);
    }
    return normalized;
}

} // namespace foldernotify::infrastructure
