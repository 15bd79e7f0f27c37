// main.cpp - EVCam recorder entry point
// Rolling one-minute segments from every camera until told to stop

#include "core/Application.hpp"

#include <csignal>
#include <iostream>

namespace {

extern "C" void handleSignal(int) {
    evc::Application::requestStop();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        evc::Application app(argc, argv);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        auto optsResult = app.parseArgs();
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        auto opts = std::move(*optsResult);

        auto initResult = app.init(opts);
        if (!initResult) {
            std::cerr << "Initialization failed: "
                      << initResult.error().message << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
