#include <iostream>
#include <string>
#include <vector>

#include "app/LoopBinderApp.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    auto options = loopbinder::app::LoopBinderApp::ParseArguments(args, error);
    if (!options) {
        std::cerr << "loopbinder: " << error << "\n\n";
        loopbinder::app::LoopBinderApp::PrintUsage(std::cerr);
        return loopbinder::app::LoopBinderApp::kExitUsage;
    }

    loopbinder::app::LoopBinderApp app(std::move(*options));
    return app.Run();
}
