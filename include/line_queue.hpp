#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string>

namespace driveup {

// Bounded single-producer/single-consumer queue of output lines.
// The producer closes it at EOF; the consumer drains what is left.
class LineQueue {
public:
    enum class PopStatus {
        Line,
        Timeout,
        Closed
    };

    explicit LineQueue(size_t capacity = 256);

    LineQueue(const LineQueue&) = delete;
    LineQueue& operator=(const LineQueue&) = delete;

    // Blocks while full. Returns false if the queue was closed or stop was requested.
    bool push(std::string line, std::stop_token stop = {});

    PopStatus pop(std::string& out, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<std::string> lines_;
    size_t capacity_;
    bool closed_ = false;
};

} // namespace driveup
