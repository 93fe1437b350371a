#pragma once

#include "upload/tool_config.hpp"
#include <string>

// Copies one source disk into the export daemon listening on socketPath.
class DiskCopier {
public:
    virtual ~DiskCopier() = default;
    virtual void copy(const std::string& sourcePath, const std::string& sourceFormat,
                      const std::string& outputFormat, const std::string& socketPath) = 0;
};

class QemuImgCopier : public DiskCopier {
public:
    explicit QemuImgCopier(ToolConfig tools);

    void copy(const std::string& sourcePath, const std::string& sourceFormat,
              const std::string& outputFormat, const std::string& socketPath) override;

private:
    ToolConfig tools_;
};
