#include "line_queue.hpp"

namespace driveup {

LineQueue::LineQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool LineQueue::push(std::string line, std::stop_token stop) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_room = not_full_.wait(lock, stop, [this] {
            return closed_ || lines_.size() < capacity_;
        });
        if (!has_room || closed_) return false;
        lines_.push_back(std::move(line));
    }
    not_empty_.notify_one();
    return true;
}

LineQueue::PopStatus LineQueue::pop(std::string& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = not_empty_.wait_for(lock, timeout, [this] {
        return closed_ || !lines_.empty();
    });
    if (!ready) return PopStatus::Timeout;
    if (lines_.empty()) return PopStatus::Closed;

    out = std::move(lines_.front());
    lines_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return PopStatus::Line;
}

void LineQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool LineQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t LineQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

} // namespace driveup
