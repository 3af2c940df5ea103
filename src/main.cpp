#include "app/Application.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        mping::infra::ConfigManager configManager;
        configManager.parse(argc, argv);

        if (configManager.config().showHelp) {
            std::cout << mping::infra::ConfigManager::usage(argc > 0 ? argv[0] : "mping");
            return 0;
        }

        mping::app::Application app(configManager.config());
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "mping: " << e.what() << '\n';
        return 1;
    }
}
