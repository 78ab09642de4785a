#include "main/pvectl_cli.hpp"
#include "common/logger.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        PveCli cli;
        int rc = cli.run(argc, argv);
        Logger::shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
