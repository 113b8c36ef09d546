#pragma once

#include "work_enumerator.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace driveup {

enum class ItemStatus {
    Pending,
    Uploading,
    Completed,
    Failed
};

std::string_view to_string(ItemStatus status);

// How a transfer ended. Failed is a non-zero exit, Error a launch or read failure.
enum class TerminalState {
    Completed,
    Failed,
    Error
};

struct ItemStats {
    uint64_t size_bytes = 0;
    uint64_t transferred_bytes = 0;
    std::string speed_label;
    std::string eta_label;
    bool started = false;
    bool completed = false;
    bool failed = false;

    ItemStatus status() const;
    int percent() const;
};

struct ItemRecord {
    std::string relative_path;
    ItemStats stats;
};

struct GlobalStats {
    uint64_t total_size_bytes = 0;
    uint64_t overall_transferred_bytes = 0;
    std::chrono::steady_clock::time_point start_time;
    std::set<std::string> active_set;
};

// Pure derived metrics, shared by snapshots and tests
int overall_percent(uint64_t transferred, uint64_t total);
double throughput_bps(uint64_t transferred, double elapsed_seconds);
std::optional<double> eta_seconds(uint64_t transferred, uint64_t total, double elapsed_seconds);
std::string format_hms(double seconds);

inline constexpr std::string_view kEtaPlaceholder = "-:--:--";

// Consistent copy of all statistics taken under the aggregator's lock
struct StatsSnapshot {
    GlobalStats global;
    std::vector<ItemRecord> items;   // Enumeration order
    double elapsed_seconds = 0.0;
    size_t completed_count = 0;
    size_t failed_count = 0;
    size_t pending_count = 0;

    int percent() const { return overall_percent(global.overall_transferred_bytes, global.total_size_bytes); }
    double throughput() const { return throughput_bps(global.overall_transferred_bytes, elapsed_seconds); }
    std::string eta_label() const;
    std::string elapsed_label() const { return format_hms(elapsed_seconds); }
    size_t active_count() const { return global.active_set.size(); }
};

// Sole owner of the run's progress state. Every mutation and every read
// goes through one mutex, so a snapshot never shows a half-applied update.
class StatsAggregator {
public:
    StatsAggregator() = default;

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    // Zeroed record per item so pending items are visible before scheduling; restarts the clock
    void initialize(const std::vector<WorkItem>& items, uint64_t total_size);

    // Adds delta to the item and to the overall total. Ignored for unknown or terminal items.
    bool apply_progress(std::string_view relative_path, uint64_t delta_bytes,
                        std::string speed_label, std::string eta_label);

    bool mark_started(std::string_view relative_path);

    // First call wins; the item leaves the active set exactly once
    bool mark_terminal(std::string_view relative_path, TerminalState state);

    StatsSnapshot snapshot() const;

    std::optional<ItemStats> item(std::string_view relative_path) const;
    uint64_t overall_transferred() const;
    size_t active_count() const;

private:
    ItemRecord* find(std::string_view relative_path);

    mutable std::mutex mutex_;
    std::vector<ItemRecord> items_;
    std::unordered_map<std::string, size_t> index_;
    GlobalStats global_;
};

} // namespace driveup
