#include <cassert>
#include <iostream>
#include <regex>
#include <sstream>

#include "infrastructure/Logger.hpp"

using namespace foldernotify::infrastructure;

int main() {
    std::cout << "[Test] Starting Logger Test..." << std::endl;

    std::ostringstream out;
    Logger logger(out);

    logger.debug("hidden");
    logger.info("Created: /w/a.txt");
    logger.error("Failed to send notification: 500");

    std::string text = out.str();
    assert(text.find("hidden") == std::string::npos);

    std::regex line(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - (INFO|ERROR) - .+)");
    std::istringstream lines(text);
    std::string current;
    int count = 0;
    while (std::getline(lines, current)) {
        assert(std::regex_match(current, line));
        ++count;
    }
    assert(count == 2);

    logger.setLevel(LogLevel::Debug);
    logger.debug("now visible");
    assert(out.str().find(" - DEBUG - now visible") != std::string::npos);

    logger.setLevel(LogLevel::Error);
    logger.warning("dropped warning");
    assert(out.str().find("dropped warning") == std::string::npos);

    assert(Logger::ParseLevel("DEBUG") == LogLevel::Debug);
    assert(Logger::ParseLevel("warn") == LogLevel::Warning);
    assert(Logger::ParseLevel("Error") == LogLevel::Error);
    assert(!Logger::ParseLevel("verbose"));

    std::cout << "[Test] Logger Test passed." << std::endl;
    return 0;
}
