#pragma once

#include "upload/export_daemon.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

// Process-wide cleanup for an upload run. Kills export daemons that are
// still registered and, unless the success marker exists, rolls back the
// remote transfers. Safe to call from the signal watcher thread while the
// control thread is still registering resources, and safe to run twice.
class ExitGuard {
public:
    // Returns a diagnostic line; must not throw.
    using CancelFunction = std::function<std::string(const std::vector<std::string>& transferIds,
                                                     const std::vector<std::string>& diskUuids)>;

    static constexpr const char* kSuccessMarker = "done";

    ExitGuard(std::string workDir, std::shared_ptr<ExportDaemonLauncher> launcher);
    ~ExitGuard();

    ExitGuard(const ExitGuard&) = delete;
    ExitGuard& operator=(const ExitGuard&) = delete;

    void arm(std::vector<std::string> diskUuids, CancelFunction cancel);
    bool isArmed() const;

    void registerSocket(const std::string& path);
    void registerDaemon(pid_t pid);
    void registerTransfer(const std::string& transferId);

    // Runs spawn() and records the pid it returns under the guard's lock,
    // so run() never misses a daemon that has already been forked.
    pid_t adoptDaemon(const std::function<pid_t()>& spawn);

    // Drops daemons that Finalize has already stopped.
    void forgetDaemons(const std::vector<pid_t>& pids);

    std::vector<pid_t> daemons() const;
    std::vector<std::string> transferIds() const;

    bool successMarkerExists() const;
    std::string successMarkerPath() const;

    void run();

private:
    std::string workDir_;
    std::shared_ptr<ExportDaemonLauncher> launcher_;

    mutable std::mutex mutex_;
    bool armed_{false};
    CancelFunction cancel_;
    std::vector<pid_t> daemons_;
    std::vector<std::string> transferIds_;
    std::vector<std::string> diskUuids_;
    std::vector<std::string> sockets_;
};
