#include "test_fakes.hpp"
#include "common/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

HelperResult FakeHelperInvoker::invoke(Helper helper,
                                       const HelperParams& params,
                                       const std::vector<std::string>& args,
                                       bool captureOutput) {
    HelperCall call{helper, params.document(), args, captureOutput};
    int nth = static_cast<int>(callsTo(helper).size());
    calls.push_back(call);
    if (onInvoke) {
        onInvoke(call);
    }

    HelperResult result;
    auto fail = failAt.find(helper);
    if (fail != failAt.end() && fail->second == nth) {
        result.exitStatus = 1;
        return result;
    }

    if (helper == Helper::Precheck) {
        result.output = precheckOutput;
    } else if (helper == Helper::Transfer) {
        result.output = HelperDocument{
            {"destination_url", "https://imageio.example.com/images/" + std::to_string(nth)},
            {"transfer_id", "transfer-" + std::to_string(nth)},
            {"is_ovirt_host", isEngineHost}
        };
        for (const auto& key : omitFromTransfer) {
            result.output->erase(key);
        }
    } else if (helper == Helper::CreateOvf) {
        result.output = HelperDocument{{"ovf", "<ovf/>"}};
    }
    return result;
}

std::vector<HelperCall> FakeHelperInvoker::callsTo(Helper helper) const {
    std::vector<HelperCall> matching;
    for (const auto& call : calls) {
        if (call.helper == helper) {
            matching.push_back(call);
        }
    }
    return matching;
}

pid_t FakeLauncher::spawn(const ExportDaemonConfig& config) {
    pid_t pid = nextPid++;
    started.push_back(config);
    alive.insert(pid);
    return pid;
}

void FakeLauncher::waitUntilReady(pid_t pid, const ExportDaemonConfig& config) {
    if (neverReady.count(pid)) {
        alive.erase(pid);
        throw ProcessError("export daemon exited before creating " + config.socketPath);
    }
}

bool FakeLauncher::terminate(pid_t pid) {
    terminated.push_back(pid);
    if (alive.count(pid) == 0) {
        return false;
    }
    if (!ignoreTerminate) {
        alive.erase(pid);
    }
    return true;
}

bool FakeLauncher::waitForExit(pid_t pid) {
    return alive.count(pid) == 0;
}

std::string FakeDescriptorBuilder::build(const DescriptorRequest& request) {
    requests.push_back(request);
    return "<ovf name='" + request.outputName + "'/>";
}

std::string makeTempDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "vmpublish-test.XXXXXX").string();
    if (!mkdtemp(pattern.data())) {
        throw std::runtime_error("mkdtemp failed");
    }
    return pattern;
}

void writeExecutable(const std::string& path, const std::string& content) {
    {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                 std::filesystem::perms::group_read | std::filesystem::perms::group_exec);
}

void removeTree(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}
