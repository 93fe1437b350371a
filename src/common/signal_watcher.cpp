#include "common/signal_watcher.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <pthread.h>

SignalWatcher::SignalWatcher(Handler handler, bool exitAfterHandler)
    : handler_(std::move(handler))
    , exitAfterHandler_(exitAfterHandler) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, SIGHUP);
    // Used only to wake the watcher for shutdown.
    sigaddset(&signals_, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals_, &previousMask_);

    thread_ = std::thread(&SignalWatcher::watch, this);
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    if (thread_.joinable()) {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
}

void SignalWatcher::watch() {
    for (;;) {
        int sig = 0;
        if (sigwait(&signals_, &sig) != 0) {
            continue;
        }
        if (stopping_) {
            return;
        }
        if (sig == SIGUSR1) {
            continue;
        }

        Logger::warning("Received signal " + std::to_string(sig) + ", cleaning up");
        try {
            if (handler_) {
                handler_(sig);
            }
        } catch (const std::exception& e) {
            Logger::error("Cleanup after signal failed: " + std::string(e.what()));
        }

        if (exitAfterHandler_) {
            std::_Exit(128 + sig);
        }
    }
}
