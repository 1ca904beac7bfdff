#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "app/RedlinerApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = redliner::app::RedlinerApp::ParseArgs(args);
    if (!options) {
        std::cerr << redliner::app::RedlinerApp::Usage();
        return 64;
    }
    if (options->showHelp) {
        std::cout << redliner::app::RedlinerApp::Usage();
        return 0;
    }
    redliner::app::RedlinerApp app(std::move(*options));
    return app.Run();
}
