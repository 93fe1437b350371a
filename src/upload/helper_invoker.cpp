#include "upload/helper_invoker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

std::string helperName(Helper helper) {
    switch (helper) {
        case Helper::Precheck:  return "precheck";
        case Helper::VmCheck:   return "vmcheck";
        case Helper::Transfer:  return "transfer";
        case Helper::Finalize:  return "finalize";
        case Helper::Cancel:    return "cancel";
        case Helper::CreateVm:  return "createvm";
        case Helper::CreateOvf: return "createovf";
        default:                return "unknown";
    }
}

std::string helperScript(Helper helper) {
    return helperName(helper) + ".py";
}

ScriptHelperInvoker::ScriptHelperInvoker(ToolConfig tools, std::string workDir)
    : tools_(std::move(tools))
    , workDir_(std::move(workDir)) {
}

HelperResult ScriptHelperInvoker::invoke(Helper helper,
                                         const HelperParams& params,
                                         const std::vector<std::string>& args,
                                         bool captureOutput) {
    int seq = sequence_++;
    std::string stem = workDir_ + "/" + helperName(helper) + "-" + std::to_string(seq);
    std::string paramsPath = stem + ".params.json";
    std::string resultPath = captureOutput ? stem + ".json" : "";

    writeParams(paramsPath, params);

    std::vector<std::string> argv = {
        tools_.interpreter,
        tools_.helperPath(helperScript(helper)),
        paramsPath
    };
    argv.insert(argv.end(), args.begin(), args.end());

    HelperResult result;
    result.exitStatus = Subprocess::run(argv, resultPath);
    if (!result.succeeded()) {
        Logger::debug(helperName(helper) + " exited with status " + std::to_string(result.exitStatus));
        return result;
    }

    if (captureOutput) {
        result.output = readResult(resultPath, helper);
        if (Logger::isEnabled(LogLevel::DEBUG)) {
            Logger::debug(helperName(helper) + " output parsed as: " + result.output->dump(2));
        }
    }
    return result;
}

void ScriptHelperInvoker::writeParams(const std::string& path, const HelperParams& params) const {
    // The parameter set carries credentials: never world readable.
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd == -1) {
        throw ProcessError("open: " + path + ": " + strerror(errno));
    }
    close(fd);

    std::ofstream out(path, std::ios::trunc);
    out << params.dump();
    if (!out) {
        throw ProcessError("Failed to write helper parameters to " + path);
    }
}

HelperDocument ScriptHelperInvoker::readResult(const std::string& path, Helper helper) const {
    std::ifstream in(path);
    if (!in) {
        throw RemoteRejection(helperName(helper) + ": cannot read result file " + path);
    }

    try {
        HelperDocument doc = HelperDocument::parse(in);
        if (!doc.is_object()) {
            throw RemoteRejection(helperName(helper) + ": result is not a JSON object");
        }
        return doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw RemoteRejection(helperName(helper) + ": cannot parse result: " + std::string(e.what()));
    }
}
