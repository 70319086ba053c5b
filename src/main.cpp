#include "QuoteDeskApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        quotedesk::QuoteDeskApp app;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        return app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "[main] Fatal error" << std::endl;
        return 1;
    }
}
