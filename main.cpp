#include "app/FolderNotifyApp.hpp"

int main(int argc, char* argv[]) {
    foldernotify::app::FolderNotifyApp app;
    return app.Run(argc, argv);
}
