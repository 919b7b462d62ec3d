#include "HoldingsApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        holdings::HoldingsApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Holdings Overlap v1.0.0" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        return app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
