#pragma once

#include "stats_aggregator.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace driveup {

enum class PresenterMode {
    LiveView,  // Redrawn ANSI dashboard, for terminals
    LogLines   // One progress line per tick, for pipes and CI logs
};

struct PresenterOptions {
    PresenterMode mode = PresenterMode::LiveView;
    std::chrono::milliseconds refresh_interval{250};
    size_t worker_limit = 4;     // Shown as active/limit
    size_t max_rows = 20;        // Per-item rows in the live view
    std::string title;           // "<input> → <target>"
};

std::string render_bar(int percent, size_t width);
std::string format_size_gb(uint64_t bytes);
std::string format_speed_mbps(double bytes_per_second);
std::string ellipsize(const std::string& text, size_t width);

std::string render_frame(const StatsSnapshot& snapshot, const PresenterOptions& options);
std::string render_log_line(const StatsSnapshot& snapshot, const PresenterOptions& options);

// Polls the aggregator on a timer and renders snapshots. stop() wakes the
// timer immediately and draws one last frame so the final state is visible.
class Presenter {
public:
    Presenter(const StatsAggregator& stats, PresenterOptions options);
    ~Presenter();

    Presenter(const Presenter&) = delete;
    Presenter& operator=(const Presenter&) = delete;

    void start();
    void stop();
    void render_once() const;

private:
    const StatsAggregator& stats_;
    PresenterOptions options_;
    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};

} // namespace driveup
