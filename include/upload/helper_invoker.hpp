#pragma once

#include "upload/helper_params.hpp"
#include "upload/tool_config.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

enum class Helper {
    Precheck,
    VmCheck,
    Transfer,
    Finalize,
    Cancel,
    CreateVm,
    CreateOvf
};

std::string helperName(Helper helper);
std::string helperScript(Helper helper);

struct HelperResult {
    int exitStatus{0};
    std::optional<HelperDocument> output;  // set only when captured and exit was 0

    bool succeeded() const { return exitStatus == 0; }
};

class HelperInvoker {
public:
    virtual ~HelperInvoker() = default;

    // Runs a helper with the given parameter set. With captureOutput the
    // helper's stdout must be a JSON object; anything else is a RemoteRejection.
    // A non-zero exit is returned, not thrown: the caller decides.
    virtual HelperResult invoke(Helper helper,
                                const HelperParams& params,
                                const std::vector<std::string>& args = {},
                                bool captureOutput = false) = 0;
};

// Runs "<interpreter> <helper-dir>/<script> <params.json> [args...]" with the
// parameter and result files kept in the work directory.
class ScriptHelperInvoker : public HelperInvoker {
public:
    ScriptHelperInvoker(ToolConfig tools, std::string workDir);

    HelperResult invoke(Helper helper,
                        const HelperParams& params,
                        const std::vector<std::string>& args = {},
                        bool captureOutput = false) override;

private:
    void writeParams(const std::string& path, const HelperParams& params) const;
    HelperDocument readResult(const std::string& path, Helper helper) const;

    ToolConfig tools_;
    std::string workDir_;
    std::atomic<int> sequence_{0};
};
