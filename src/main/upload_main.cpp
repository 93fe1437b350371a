#include "main/upload_main.hpp"
#include "upload/upload_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printUploadUsage() {
    std::cout << "Usage: vmpublish upload [options]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -oc URL              Engine REST API URL\n"
              << "  -op FILE             File containing the engine password\n"
              << "  -os STORAGE          Target storage domain\n"
              << "  -of raw|qcow2        Output disk format (default: raw)\n"
              << "  -on NAME             Name of the new virtual machine\n"
              << "  -oo KEY[=VALUE]      Output option, see --query-options\n"
              << "  --query-options      List the output options\n"
              << "  --disks FILE         Disk manifest (JSON)\n"
              << "  --work-dir DIR       Working directory (default: temporary)\n"
              << "  --keep-work-dir      Do not remove the temporary working directory\n"
              << "  --helper-dir DIR     Directory containing the helper scripts\n"
              << "  --python PROGRAM     Interpreter used to run the helpers\n"
              << "  --nbdkit PROGRAM     Export helper program\n"
              << "  --verbose            Enable debug messages\n";
}

int uploadMain(int argc, char** argv) {
    try {
        UploadCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        Logger::error("Error in upload main: " + std::string(e.what()));
        return 1;
    }
}
