#include "signal_watcher.hpp"
#include <signal.h>
#include <cerrno>
#include <ctime>

namespace driveup {

namespace {

sigset_t watched_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

void SignalWatcher::block_signals() {
    auto set = watched_signals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

SignalWatcher::SignalWatcher(std::function<void(int)> on_signal)
    : on_signal_(std::move(on_signal)) {
    thread_ = std::jthread([this](std::stop_token stop) {
        auto set = watched_signals();
        // Short timeout so the destructor's stop request is noticed promptly
        timespec timeout{0, 200 * 1000 * 1000};
        while (!stop.stop_requested()) {
            int sig = sigtimedwait(&set, nullptr, &timeout);
            if (sig == -1) {
                continue;  // EAGAIN on timeout, EINTR on an unrelated signal
            }
            received_ = sig;
            if (on_signal_) on_signal_(sig);
        }
    });
}

SignalWatcher::~SignalWatcher() {
    thread_.request_stop();
}

} // namespace driveup
