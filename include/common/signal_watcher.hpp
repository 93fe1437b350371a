#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <thread>

// Receives SIGINT, SIGTERM and SIGHUP on a dedicated thread so that the
// handler runs in ordinary thread context (locks and logging are allowed).
// Must be constructed before any other thread is started, since the signal
// mask is inherited by new threads.
class SignalWatcher {
public:
    using Handler = std::function<void(int signal)>;

    explicit SignalWatcher(Handler handler, bool exitAfterHandler = true);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watch();

    Handler handler_;
    bool exitAfterHandler_;
    sigset_t signals_;
    sigset_t previousMask_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};
