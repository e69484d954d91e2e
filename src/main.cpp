#include "Application.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        ncf::Application::requestStop();  // Only set flag, cleanup happens in run()
    } else if (signal == SIGHUP) {
        ncf::Application::requestLogReopen();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ncf::Application app(argc, argv);
        app.loadConfig(app.configPath());

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGHUP, signal_handler);

        app.initialize();
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
