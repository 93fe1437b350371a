#include "upload/export_daemon.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>

NbdkitLauncher::NbdkitLauncher(ToolConfig tools, bool selinuxLabel)
    : tools_(std::move(tools))
    , selinuxLabel_(selinuxLabel) {
}

std::vector<std::string> NbdkitLauncher::commandLine(const ExportDaemonConfig& config) const {
    std::vector<std::string> argv = {
        tools_.exportHelper,
        "--foreground",
        "--exit-with-parent",
        "--unix", config.socketPath,
        "--threads", std::to_string(tools_.daemonThreads)
    };
    if (selinuxLabel_) {
        argv.push_back("--selinux-label");
        argv.push_back(kSocketLabel);
    }

    argv.push_back("python");
    argv.push_back(tools_.helperPath("plugin.py"));
    argv.push_back("size=" + std::to_string(config.diskSize));
    argv.push_back("url=" + config.destinationUrl);
    if (config.caFile) {
        argv.push_back("cafile=" + *config.caFile);
    }
    if (config.insecure) {
        argv.push_back("insecure=true");
    }
    if (config.isEngineHost) {
        argv.push_back("is_ovirt_host=true");
    }
    return argv;
}

pid_t NbdkitLauncher::spawn(const ExportDaemonConfig& config) {
    return Subprocess::spawn(commandLine(config));
}

void NbdkitLauncher::waitUntilReady(pid_t pid, const ExportDaemonConfig& config) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(tools_.socketWaitSeconds);
    for (;;) {
        std::error_code ec;
        if (std::filesystem::exists(config.socketPath, ec)) {
            Logger::debug("export daemon " + std::to_string(pid) + " listening on " + config.socketPath);
            return;
        }
        if (!Subprocess::isRunning(pid)) {
            throw ProcessError(tools_.exportHelper + " exited before creating " + config.socketPath +
                               ", see earlier errors");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            if (!Subprocess::terminate(pid, SIGTERM) || !Subprocess::waitForExit(pid)) {
                Logger::warning("could not stop " + tools_.exportHelper + " pid " + std::to_string(pid));
            }
            throw ProcessError(tools_.exportHelper + " did not create " + config.socketPath +
                               " within " + std::to_string(tools_.socketWaitSeconds) + " seconds");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

bool NbdkitLauncher::terminate(pid_t pid) {
    return Subprocess::terminate(pid, SIGTERM);
}

bool NbdkitLauncher::waitForExit(pid_t pid) {
    return Subprocess::waitForExit(pid);
}
