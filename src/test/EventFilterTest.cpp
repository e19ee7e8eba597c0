#include <cassert>
#include <iostream>

#include "application/EventFilter.hpp"

using namespace foldernotify;
using application::ExtensionOf;
using application::ShouldProcess;

namespace {

domain::FileEvent MakeEvent(const std::string& path, bool isDirectory) {
    domain::FileEvent event;
    event.kind = domain::FileEventKind::Created;
    event.srcPath = path;
    event.isDirectory = isDirectory;
    return event;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EventFilter Test..." << std::endl;

    // Extension extraction
    assert(ExtensionOf("a/b.txt") == ".txt");
    assert(ExtensionOf("a/B.TXT") == ".txt");
    assert(ExtensionOf("a/archive.tar.gz") == ".gz");
    assert(ExtensionOf("a/Makefile") == "");
    assert(ExtensionOf("a.d/Makefile") == "");
    assert(ExtensionOf("a/.bashrc") == "");
    assert(ExtensionOf("") == "");

    // Directory exclusion wins regardless of extension settings
    domain::MonitorConfig excludeDirs;
    excludeDirs.excludeDirectories = true;
    assert(!ShouldProcess(MakeEvent("/w/sub", true), excludeDirs));
    assert(!ShouldProcess(MakeEvent("/w/sub.txt", true), excludeDirs));
    assert(ShouldProcess(MakeEvent("/w/file.bin", false), excludeDirs));

    domain::MonitorConfig includeDirs;
    includeDirs.excludeDirectories = false;
    assert(ShouldProcess(MakeEvent("/w/sub", true), includeDirs));

    // Allow-list
    domain::MonitorConfig txtOnly;
    txtOnly.allowedExtensions = {".txt"};
    txtOnly.excludeDirectories = true;
    assert(ShouldProcess(MakeEvent("a/b.txt", false), txtOnly));
    assert(ShouldProcess(MakeEvent("a/b.TxT", false), txtOnly));
    assert(!ShouldProcess(MakeEvent("a/b.md", false), txtOnly));
    assert(!ShouldProcess(MakeEvent("a/noext", false), txtOnly));
    assert(!ShouldProcess(MakeEvent("a/b", true), txtOnly));

    // Directories are not subject to the allow-list
    txtOnly.excludeDirectories = false;
    assert(ShouldProcess(MakeEvent("a/b", true), txtOnly));
    assert(ShouldProcess(MakeEvent("a/b.md", true), txtOnly));
    assert(!ShouldProcess(MakeEvent("a/b.md", false), txtOnly));

    // Bound filter follows the configuration it was given
    application::EventFilter filter(txtOnly);
    assert(filter.shouldProcess(MakeEvent("x/y.txt", false)));
    assert(!filter.shouldProcess(MakeEvent("x/y.pdf", false)));

    // Moves are filtered on their source path
    domain::FileEvent moved = MakeEvent("/w/a.txt", false);
    moved.kind = domain::FileEventKind::Moved;
    moved.destPath = "/w/a.md";
    assert(filter.shouldProcess(moved));

    std::cout << "[Test] EventFilter Test passed." << std::endl;
    return 0;
}
