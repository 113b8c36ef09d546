#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace driveup {

// Turns SIGINT/SIGTERM into a callback on an ordinary thread.
// block_signals() must run before any other thread is started so every
// thread inherits the blocked mask; only the watcher ever receives them.
class SignalWatcher {
public:
    static void block_signals();

    explicit SignalWatcher(std::function<void(int)> on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Signal number received so far, 0 if none
    int received() const { return received_.load(); }

private:
    std::function<void(int)> on_signal_;
    std::atomic<int> received_{0};
    std::jthread thread_;
};

} // namespace driveup
