#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/ScribeLineApp.hpp"

using namespace scribeline;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    auto commandLine = app::ScribeLineApp::ParseArgs(args, error);
    if (!commandLine) {
        if (!error.empty()) {
            std::cerr << "scribeline: " << error << "\n\n" << app::ScribeLineApp::Usage();
            return 2;
        }
        std::cout << app::ScribeLineApp::Usage();
        return 0;
    }
    if (commandLine->files.empty() && !commandLine->cancelPersisted) {
        std::cout << "[ScribeLine] No files given; only checking for an interrupted job." << std::endl;
    }

    try {
        app::ScribeLineApp application(std::move(*commandLine));
        return application.Run();
    } catch (const std::exception& e) {
        std::cerr << "[ScribeLine] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
