#pragma once

#include "upload/tool_config.hpp"
#include "upload/upload_options.hpp"
#include <string>

struct UploadArguments {
    UploadOptions options;
    ToolConfig tools;
    std::string manifestPath;
    std::string workDir;
    bool keepWorkDir{false};
    bool verbose{false};
    bool help{false};
    bool queryOptions{false};
};

class UploadCLI {
public:
    UploadCLI() = default;

    // Returns the process exit status.
    int run(int argc, char* argv[]);

    // Throws ConfigurationError on unknown or incomplete arguments.
    static UploadArguments parseArguments(int argc, char* argv[]);

private:
    int execute(const UploadArguments& args);
    std::string prepareWorkDir(const UploadArguments& args) const;
    void removeWorkDir(const std::string& dir) const;
};
