#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "application/NotificationService.hpp"
#include "domain/NotificationPayload.hpp"
#include "infrastructure/Logger.hpp"

using namespace foldernotify;
using application::FormatHumanSize;
using application::MoveTitle;
using domain::ResolvePriority;

namespace {

class NullChannel : public domain::NotificationChannel {
public:
    domain::DeliveryResult publish(const domain::NotificationPayload&) override {
        domain::DeliveryResult result;
        result.status = 200;
        return result;
    }
    std::string endpoint() const override { return "null"; }
};

} // namespace

int main() {
    std::cout << "[Test] Starting Notification Format Test..." << std::endl;

    // Human-readable sizes
    assert(FormatHumanSize(0) == "0.00 B");
    assert(FormatHumanSize(1023) == "1023.00 B");
    assert(FormatHumanSize(1024) == "1.00 KB");
    assert(FormatHumanSize(1536) == "1.50 KB");
    assert(FormatHumanSize(2464153) == "2.35 MB");
    assert(FormatHumanSize(1073741824ULL) == "1.00 GB");
    assert(FormatHumanSize(1099511627776ULL) == "1.00 TB");
    assert(FormatHumanSize(1024ULL * 1099511627776ULL) == "1024.00 TB");

    // Priorities
    assert(ResolvePriority(std::string("urgent")) == 5);
    assert(ResolvePriority(std::string("high")) == 4);
    assert(ResolvePriority(std::string("default")) == 3);
    assert(ResolvePriority(std::string("low")) == 2);
    assert(ResolvePriority(std::string("min")) == 1);
    assert(ResolvePriority(5) == 5);
    assert(ResolvePriority(1) == 1);
    assert(!ResolvePriority(std::string("critical")));
    assert(!ResolvePriority(std::string("HIGH")));
    assert(!ResolvePriority(0));
    assert(!ResolvePriority(6));

    // Move titles
    assert(MoveTitle("/x/a.txt", "/x/b.txt") == "File Renamed: a.txt → b.txt");
    assert(MoveTitle("/x/a.txt", "/y/a.txt") == "File Moved");
    assert(MoveTitle("/x/sub/a.txt", "/x/a.txt") == "File Moved");

    // Payload serialization
    domain::NotificationOptions options;
    options.title = "File Created";
    options.priority = std::string("high");
    options.tags = "file_folder,new";
    auto payload = domain::MakePayload("alerts", "hello", options);
    auto body = payload.toJson();
    assert(body["topic"] == "alerts");
    assert(body["message"] == "hello");
    assert(body["title"] == "File Created");
    assert(body["priority"] == 4);
    assert(body["tags"].is_array());
    assert(body["tags"].size() == 1);
    assert(body["tags"][0] == "file_folder,new");
    assert(!body.contains("click"));
    assert(!body.contains("attach"));
    assert(!body.contains("actions"));

    domain::NotificationOptions unknownPriority;
    unknownPriority.priority = std::string("whenever");
    auto bare = domain::MakePayload("alerts", "m", unknownPriority).toJson();
    assert(!bare.contains("priority"));
    assert(!bare.contains("title"));
    assert(!bare.contains("tags"));

    domain::NotificationOptions extras;
    extras.click = "https://example.com/report";
    extras.attach = "https://example.com/report.pdf";
    extras.actions.push_back({"view", "Open", "https://example.com", true});
    auto withExtras = domain::MakePayload("alerts", "m", extras).toJson();
    assert(withExtras["click"] == "https://example.com/report");
    assert(withExtras["attach"] == "https://example.com/report.pdf");
    assert(withExtras["actions"].size() == 1);
    assert(withExtras["actions"][0]["label"] == "Open");
    assert(withExtras["actions"][0]["clear"] == true);

    // Size lookups against the real filesystem
    std::ostringstream logs;
    infrastructure::Logger logger(logs, infrastructure::LogLevel::Debug);
    domain::MonitorConfig config;
    config.topic = "alerts";
    application::NotificationService service(config, std::make_shared<NullChannel>(), logger);

    std::filesystem::path root = std::filesystem::temp_directory_path() / "foldernotify_format_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    {
        std::ofstream f(root / "data.bin", std::ios::binary);
        f << std::string(1536, 'x');
    }
    assert(service.describeFileSize((root / "data.bin").string()) == "1.50 KB");
    assert(service.describeFileSize(root.string()) == "N/A (directory)");
    assert(service.describeFileSize((root / "missing.bin").string()) == "N/A (directory)");
    assert(logs.str().find("Error getting file size") == std::string::npos);

    // A name longer than NAME_MAX makes the lookup itself fail
    std::string tooLong = (root / std::string(300, 'a')).string();
    assert(service.describeFileSize(tooLong) == "Unknown");
    assert(logs.str().find("ERROR - Error getting file size:") != std::string::npos);
    std::filesystem::remove_all(root);

    std::cout << "[Test] Notification Format Test passed." << std::endl;
    return 0;
}
