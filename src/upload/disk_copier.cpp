#include "upload/disk_copier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"

QemuImgCopier::QemuImgCopier(ToolConfig tools)
    : tools_(std::move(tools)) {
}

void QemuImgCopier::copy(const std::string& sourcePath, const std::string& sourceFormat,
                         const std::string& outputFormat, const std::string& socketPath) {
    std::vector<std::string> argv = {
        tools_.copyTool, "convert", "-n",
        "-f", sourceFormat,
        "-O", outputFormat,
        sourcePath,
        "nbd+unix:///?socket=" + utils::urlEncode(socketPath)
    };

    Logger::info("Copying " + sourcePath);
    int status = Subprocess::run(argv);
    if (status != 0) {
        throw ProcessError(tools_.copyTool + " failed to copy " + sourcePath + " (status " +
                           std::to_string(status) + ")");
    }
}
