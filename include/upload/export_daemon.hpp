#pragma once

#include "upload/tool_config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

// Everything one export daemon needs to expose a single disk.
struct ExportDaemonConfig {
    std::string socketPath;
    uint64_t diskSize{0};
    std::string destinationUrl;
    std::optional<std::string> caFile;
    bool insecure{false};
    bool isEngineHost{false};
};

class ExportDaemonLauncher {
public:
    virtual ~ExportDaemonLauncher() = default;

    // Forks the daemon and returns at once. Throws ProcessError.
    virtual pid_t spawn(const ExportDaemonConfig& config) = 0;

    // Blocks until the daemon serves on config.socketPath. Throws
    // ProcessError if it exits first or does not bind in time; the daemon
    // has been reaped by then and its pid must not be signalled again.
    virtual void waitUntilReady(pid_t pid, const ExportDaemonConfig& config) = 0;

    // Sends the graceful termination signal. False if delivery failed.
    virtual bool terminate(pid_t pid) = 0;

    // Blocks until the daemon has exited. False if it is still running.
    virtual bool waitForExit(pid_t pid) = 0;
};

// Export daemon backed by nbdkit and the engine upload plugin.
class NbdkitLauncher : public ExportDaemonLauncher {
public:
    static constexpr const char* kSocketLabel = "system_u:object_r:svirt_socket_t:s0";

    NbdkitLauncher(ToolConfig tools, bool selinuxLabel);

    pid_t spawn(const ExportDaemonConfig& config) override;
    void waitUntilReady(pid_t pid, const ExportDaemonConfig& config) override;
    bool terminate(pid_t pid) override;
    bool waitForExit(pid_t pid) override;

    std::vector<std::string> commandLine(const ExportDaemonConfig& config) const;

private:
    ToolConfig tools_;
    bool selinuxLabel_;
};
