#include "upload/tool_config.hpp"
#include <cstdlib>

namespace {

void overrideFromEnv(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && *value) {
        field = value;
    }
}

}

void ToolConfig::loadFromEnvironment() {
    overrideFromEnv("VMPUBLISH_PYTHON", interpreter);
    overrideFromEnv("VMPUBLISH_NBDKIT", exportHelper);
    overrideFromEnv("VMPUBLISH_QEMU_IMG", copyTool);
    overrideFromEnv("VMPUBLISH_HELPER_DIR", helperDir);
}

std::string ToolConfig::helperPath(const std::string& script) const {
    if (helperDir.empty()) {
        return script;
    }
    if (helperDir.back() == '/') {
        return helperDir + script;
    }
    return helperDir + "/" + script;
}
