#include "upload/exit_guard.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

ExitGuard::ExitGuard(std::string workDir, std::shared_ptr<ExportDaemonLauncher> launcher)
    : workDir_(std::move(workDir))
    , launcher_(std::move(launcher)) {
}

ExitGuard::~ExitGuard() {
    try {
        run();
    } catch (const std::exception& e) {
        Logger::error("Exit cleanup failed: " + std::string(e.what()));
    }
}

void ExitGuard::arm(std::vector<std::string> diskUuids, CancelFunction cancel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_) {
        throw std::logic_error("exit guard armed twice");
    }
    armed_ = true;
    diskUuids_ = std::move(diskUuids);
    cancel_ = std::move(cancel);
}

bool ExitGuard::isArmed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void ExitGuard::registerSocket(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    sockets_.push_back(path);
}

void ExitGuard::registerDaemon(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    daemons_.push_back(pid);
}

pid_t ExitGuard::adoptDaemon(const std::function<pid_t()>& spawn) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_t pid = spawn();
    daemons_.push_back(pid);
    return pid;
}

void ExitGuard::registerTransfer(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    transferIds_.push_back(transferId);
}

void ExitGuard::forgetDaemons(const std::vector<pid_t>& pids) {
    std::lock_guard<std::mutex> lock(mutex_);
    daemons_.erase(std::remove_if(daemons_.begin(), daemons_.end(),
                                  [&pids](pid_t pid) {
                                      return std::find(pids.begin(), pids.end(), pid) != pids.end();
                                  }),
                   daemons_.end());
}

std::vector<pid_t> ExitGuard::daemons() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daemons_;
}

std::vector<std::string> ExitGuard::transferIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferIds_;
}

std::string ExitGuard::successMarkerPath() const {
    return workDir_ + "/" + kSuccessMarker;
}

bool ExitGuard::successMarkerExists() const {
    std::error_code ec;
    return std::filesystem::exists(successMarkerPath(), ec);
}

void ExitGuard::run() {
    // Held for the whole run so a concurrent registration is either fully
    // seen or happens after the lists were emptied.
    std::lock_guard<std::mutex> lock(mutex_);

    for (pid_t pid : daemons_) {
        if (!launcher_ || !launcher_->terminate(pid)) {
            Logger::debug("kill " + std::to_string(pid) + ": " + strerror(errno));
        }
    }
    daemons_.clear();

    for (const auto& socket : sockets_) {
        if (unlink(socket.c_str()) == -1 && errno != ENOENT) {
            Logger::debug("unlink " + socket + ": " + strerror(errno));
        }
    }
    sockets_.clear();

    if (!successMarkerExists() && !diskUuids_.empty() && cancel_) {
        Logger::info("Conversion did not complete, cancelling " +
                     std::to_string(transferIds_.size()) + " transfer(s)");
        std::string diagnostic = cancel_(transferIds_, diskUuids_);
        if (!diagnostic.empty()) {
            Logger::warning(diagnostic);
        }
    }
    transferIds_.clear();
    diskUuids_.clear();
}
