#include "application/EventFilter.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace foldernotify::application {

std::string ExtensionOf(const std::string& path) {
    // path::extension treats a leading dot (".bashrc") as part of the stem
    std::string ext = std::filesystem::path(path).filename().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

bool ShouldProcess(const domain::FileEvent& event, const domain::MonitorConfig& config) {
    if (config.excludeDirectories && event.isDirectory) {
        return false;
    }

    if (!config.allowedExtensions.empty() && !event.isDirectory) {
        return config.allowedExtensions.count(ExtensionOf(event.srcPath)) > 0;
    }

    return true;
}

} // namespace foldernotify::application
