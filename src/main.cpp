#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        apcups::app::Application app(std::vector<std::string>(argv + 1, argv + argc));
        return app.run(std::cout, std::cerr);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return apcups::app::Application::EXIT_ERROR;
    }
}
