#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "app/CommandLine.hpp"
#include "app/FolderNotifyApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace foldernotify;
using app::CommandLine;
using infrastructure::ConfigError;
using infrastructure::ConfigLoader;

namespace {

template <typename Fn>
bool ThrowsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CommandLine Test..." << std::endl;

    // Extension normalization
    auto exts = ConfigLoader::NormalizeExtensions(ConfigLoader::SplitList(" txt, .PDF ,Docx,, "));
    assert(exts.size() == 3);
    assert(exts.count(".txt") && exts.count(".pdf") && exts.count(".docx"));

    // Minimal invocation
    auto options = CommandLine::Parse({"--path", "/srv/in", "--topic", "alerts"});
    auto settings = CommandLine::Resolve(options);
    assert(settings.monitor.rootPath == "/srv/in");
    assert(settings.monitor.topic == "alerts");
    assert(settings.monitor.allowedExtensions.empty());
    assert(settings.monitor.excludeDirectories);
    assert(!settings.monitor.recursive);
    assert(settings.monitor.serverUrl == "https://ntfy.sh");
    assert(settings.logLevel == infrastructure::LogLevel::Info);

    // All flags, mixed forms
    options = CommandLine::Parse({"--path=/data", "--topic", "t", "--extensions=.txt,md", "--include-directories",
                                  "--recursive", "--server", "http://localhost:8080", "--log-level", "debug"});
    settings = CommandLine::Resolve(options);
    assert(settings.monitor.rootPath == "/data");
    assert(settings.monitor.allowedExtensions == std::set<std::string>({".txt", ".md"}));
    assert(!settings.monitor.excludeDirectories);
    assert(settings.monitor.recursive);
    assert(settings.monitor.serverUrl == "http://localhost:8080");
    assert(settings.logLevel == infrastructure::LogLevel::Debug);

    assert(CommandLine::Parse({"-h"}).help);

    // Errors
    assert(ThrowsConfigError([] { CommandLine::Parse({"--bogus"}); }));
    assert(ThrowsConfigError([] { CommandLine::Parse({"--path"}); }));
    assert(ThrowsConfigError([] { CommandLine::Parse({"--recursive=yes"}); }));
    assert(ThrowsConfigError([] { CommandLine::Resolve(CommandLine::Parse({"--topic", "t"})); }));
    assert(ThrowsConfigError([] { CommandLine::Resolve(CommandLine::Parse({"--path", "/p"})); }));
    assert(ThrowsConfigError([] {
        CommandLine::Resolve(CommandLine::Parse({"--path", "/p", "--topic", "t", "--log-level", "loud"}));
    }));

    // Config file supplies defaults, flags override
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "foldernotify_cli_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto configPath = (dir / "settings.json").string();
    {
        std::ofstream f(configPath);
        f << R"({"path": "/from/file", "topic": "file-topic", "extensions": ["JPG", ".png"],
                 "recursive": true, "server": "https://relay.example", "log_level": "warning"})";
    }
    settings = CommandLine::Resolve(CommandLine::Parse({"--config", configPath, "--topic", "cli-topic"}));
    assert(settings.monitor.rootPath == "/from/file");
    assert(settings.monitor.topic == "cli-topic");
    assert(settings.monitor.allowedExtensions == std::set<std::string>({".jpg", ".png"}));
    assert(settings.monitor.recursive);
    assert(settings.monitor.excludeDirectories);
    assert(settings.monitor.serverUrl == "https://relay.example");
    assert(settings.logLevel == infrastructure::LogLevel::Warning);

    {
        std::ofstream f(configPath);
        f << R"({"path": "/p", "topic": "t", "extensions": "txt, log"})";
    }
    settings = CommandLine::Resolve(CommandLine::Parse({"--config", configPath}));
    assert(settings.monitor.allowedExtensions == std::set<std::string>({".txt", ".log"}));

    {
        std::ofstream f(configPath);
        f << "{ not json";
    }
    assert(ThrowsConfigError([&] { ConfigLoader::LoadFile(configPath); }));
    {
        std::ofstream f(configPath);
        f << R"({"recursive": "sometimes"})";
    }
    assert(ThrowsConfigError([&] { ConfigLoader::LoadFile(configPath); }));
    assert(ThrowsConfigError([&] { ConfigLoader::LoadFile((dir / "missing.json").string()); }));

    // A missing folder is fatal before anything is watched
    std::ostringstream logs;
    app::FolderNotifyApp application(logs);
    std::string missing = (dir / "does-not-exist").string();
    std::vector<std::string> argvStorage = {"foldernotify", "--path", missing, "--topic", "t"};
    std::vector<char*> argv;
    for (auto& arg : argvStorage) argv.push_back(arg.data());
    assert(application.Run(static_cast<int>(argv.size()), argv.data()) == 1);
    assert(logs.str().find("ERROR - The specified path does not exist: " + missing) != std::string::npos);

    std::filesystem::remove_all(dir);

    std::cout << "[Test] CommandLine Test passed." << std::endl;
    return 0;
}
