#pragma once

#include <string>

// Locations of the external programs the upload drives.
struct ToolConfig {
    std::string interpreter{"python3"};
    std::string exportHelper{"nbdkit"};
    std::string copyTool{"qemu-img"};
    std::string helperDir{"/usr/libexec/vmpublish"};
    int daemonThreads{8};       // matches qemu-img's parallel coroutines
    int socketWaitSeconds{30};

    // Overrides fields from VMPUBLISH_PYTHON, VMPUBLISH_NBDKIT,
    // VMPUBLISH_QEMU_IMG and VMPUBLISH_HELPER_DIR.
    void loadFromEnvironment();

    std::string helperPath(const std::string& script) const;
};
