#include "app/CommandLine.hpp"
#include <sstream>
#include "infrastructure/ConfigLoader.hpp"

namespace foldernotify::app {

using infrastructure::ConfigError;
using infrastructure::ConfigLoader;

namespace {

bool IsSwitch(const std::string& name) {
    return name == "--include-directories" || name == "--recursive" || name == "--help" || name == "-h";
}

std::optional<std::string>* ValueSlot(CommandLineOptions& options, const std::string& name) {
    if (name == "--path") return &options.path;
    if (name == "--topic") return &options.topic;
    if (name == "--extensions") return &options.extensions;
    if (name == "--server") return &options.server;
    if (name == "--config") return &options.configFile;
    if (name == "--log-level") return &options.logLevel;
    return nullptr;
}

} // namespace

CommandLineOptions CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string name = args[i];
        std::optional<std::string> inlineValue;

        auto eq = name.find('=');
        if (name.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (IsSwitch(name)) {
            if (inlineValue) throw ConfigError("Flag " + name + " does not take a value");
            if (name == "--include-directories") options.includeDirectories = true;
            else if (name == "--recursive") options.recursive = true;
            else options.help = true;
            continue;
        }

        auto* slot = ValueSlot(options, name);
        if (!slot) {
            throw ConfigError("Unrecognized argument: " + args[i]);
        }

        if (inlineValue) {
            *slot = *inlineValue;
        } else {
            if (i + 1 >= args.size()) throw ConfigError("Flag " + name + " expects a value");
            *slot = args[++i];
        }
    }

    return options;
}

AppSettings CommandLine::Resolve(const CommandLineOptions& options) {
    infrastructure::FileSettings file;
    if (options.configFile) {
        file = ConfigLoader::LoadFile(*options.configFile);
    }

    AppSettings settings;
    auto& monitor = settings.monitor;

    auto path = options.path ? options.path : file.path;
    auto topic = options.topic ? options.topic : file.topic;
    if (!path || path->empty()) throw ConfigError("the following argument is required: --path");
    if (!topic || topic->empty()) throw ConfigError("the following argument is required: --topic");

    monitor.rootPath = *path;
    monitor.topic = *topic;

    if (options.extensions) {
        monitor.allowedExtensions = ConfigLoader::NormalizeExtensions(ConfigLoader::SplitList(*options.extensions));
    } else if (file.extensions) {
        monitor.allowedExtensions = ConfigLoader::NormalizeExtensions(*file.extensions);
    }

    monitor.excludeDirectories = !(options.includeDirectories || file.includeDirectories.value_or(false));
    monitor.recursive = options.recursive || file.recursive.value_or(false);

    if (options.server) monitor.serverUrl = *options.server;
    else if (file.server) monitor.serverUrl = *file.server;

    auto levelName = options.logLevel ? options.logLevel : file.logLevel;
    if (levelName) {
        auto level = infrastructure::Logger::ParseLevel(*levelName);
        if (!level) throw ConfigError("Unknown log level: " + *levelName);
        settings.logLevel = *level;
    }

    return settings;
}

std::string CommandLine::Usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --path PATH --topic TOPIC [options]\n"
        << "\n"
        << "Monitor a folder and send ntfy notifications on file changes.\n"
        << "\n"
        << "  --path PATH              Folder to monitor\n"
        << "  --topic TOPIC            ntfy topic for notifications\n"
        << "  --extensions LIST        Comma-separated extensions to monitor (e.g. .txt,.pdf,.docx)\n"
        << "  --include-directories    Include directory events in notifications\n"
        << "  --recursive              Watch subdirectories recursively\n"
        << "  --server URL             Relay base URL (default " << domain::kDefaultRelayUrl << ")\n"
        << "  --config FILE            JSON file with default settings\n"
        << "  --log-level LEVEL        debug, info, warning or error (default info)\n"
        << "  -h, --help               Show this help\n";
    return oss.str();
}

} // namespace foldernotify::app
