#include "main/upload_main.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

void printUsage() {
    std::cout << "Usage: vmpublish [command] [options]\n"
              << "Commands:\n"
              << "  upload    - Upload converted disks and create the VM on the engine\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -V, --version Show version information\n";
}

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    if (argc > 1 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-V")) {
        std::cout << "vmpublish version 1.0.0\n";
        return 0;
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    std::string command = argv[1];

    const char* logPath = std::getenv("VMPUBLISH_LOG");
    if (!Logger::initialize(logPath && *logPath ? logPath : "/tmp/vmpublish.log", LogLevel::INFO)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    try {
        if (command == "upload") {
            return uploadMain(argc - 1, argv + 1);
        }
        std::cerr << "Error: Unknown command: " << command << std::endl;
        Logger::error("Unknown command: " + command);
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        Logger::error("Error in main: " + std::string(e.what()));
        return 1;
    }
}
