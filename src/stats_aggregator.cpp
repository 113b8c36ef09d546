#include "stats_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace driveup {

std::string_view to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::Pending: return "Pending";
        case ItemStatus::Uploading: return "Uploading";
        case ItemStatus::Completed: return "Completed";
        case ItemStatus::Failed: return "Failed";
    }
    return "Unknown";
}

ItemStatus ItemStats::status() const {
    if (completed) return ItemStatus::Completed;
    if (failed) return ItemStatus::Failed;
    if (started) return ItemStatus::Uploading;
    return ItemStatus::Pending;
}

int ItemStats::percent() const {
    if (completed) return 100;
    return overall_percent(transferred_bytes, size_bytes);
}

int overall_percent(uint64_t transferred, uint64_t total) {
    if (total == 0) return 0;
    // 128-bit intermediate: transferred * 100 overflows for multi-exabyte totals otherwise
    auto pct = static_cast<unsigned __int128>(transferred) * 100 / total;
    return static_cast<int>(std::min<unsigned __int128>(pct, 100));
}

double throughput_bps(uint64_t transferred, double elapsed_seconds) {
    if (elapsed_seconds <= 0.0) return 0.0;
    return static_cast<double>(transferred) / elapsed_seconds;
}

std::optional<double> eta_seconds(uint64_t transferred, uint64_t total, double elapsed_seconds) {
    double speed = throughput_bps(transferred, elapsed_seconds);
    if (speed <= 0.0 || transferred >= total) return std::nullopt;
    return static_cast<double>(total - transferred) / speed;
}

std::string format_hms(double seconds) {
    if (!(seconds >= 0.0) || !std::isfinite(seconds)) return std::string(kEtaPlaceholder);
    auto total = static_cast<uint64_t>(seconds);
    return std::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

std::string StatsSnapshot::eta_label() const {
    auto eta = eta_seconds(global.overall_transferred_bytes, global.total_size_bytes, elapsed_seconds);
    if (!eta) return std::string(kEtaPlaceholder);
    return format_hms(*eta);
}

void StatsAggregator::initialize(const std::vector<WorkItem>& items, uint64_t total_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    index_.clear();
    items_.reserve(items.size());
    for (const auto& item : items) {
        ItemRecord record;
        record.relative_path = item.relative_path;
        record.stats.size_bytes = item.size_bytes;
        index_.emplace(item.relative_path, items_.size());
        items_.push_back(std::move(record));
    }
    global_ = GlobalStats{};
    global_.total_size_bytes = total_size;
    global_.start_time = std::chrono::steady_clock::now();
}

ItemRecord* StatsAggregator::find(std::string_view relative_path) {
    auto it = index_.find(std::string(relative_path));
    if (it == index_.end()) return nullptr;
    return &items_[it->second];
}

bool StatsAggregator::apply_progress(
    std::string_view relative_path,
    uint64_t delta_bytes,
    std::string speed_label,
    std::string eta_label
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* record = find(relative_path);
    if (!record || record->stats.completed || record->stats.failed) return false;

    record->stats.transferred_bytes += delta_bytes;
    record->stats.speed_label = std::move(speed_label);
    record->stats.eta_label = std::move(eta_label);
    global_.overall_transferred_bytes += delta_bytes;
    return true;
}

bool StatsAggregator::mark_started(std::string_view relative_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* record = find(relative_path);
    if (!record || record->stats.started) return false;

    record->stats.started = true;
    global_.active_set.insert(record->relative_path);
    return true;
}

bool StatsAggregator::mark_terminal(std::string_view relative_path, TerminalState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* record = find(relative_path);
    if (!record || record->stats.completed || record->stats.failed) return false;

    auto& stats = record->stats;
    switch (state) {
        case TerminalState::Completed:
            // The runner's reconciliation already brought the total to size; this pins the record.
            stats.transferred_bytes = stats.size_bytes;
            stats.speed_label = "Done";
            stats.eta_label.clear();
            stats.completed = true;
            break;
        case TerminalState::Failed:
            stats.speed_label = "Failed";
            stats.failed = true;
            break;
        case TerminalState::Error:
            stats.speed_label = "Error";
            stats.failed = true;
            break;
    }
    global_.active_set.erase(record->relative_path);
    return true;
}

StatsSnapshot StatsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatsSnapshot snap;
    snap.global = global_;
    snap.items = items_;
    auto elapsed = std::chrono::steady_clock::now() - global_.start_time;
    snap.elapsed_seconds = std::chrono::duration<double>(elapsed).count();

    for (const auto& record : items_) {
        switch (record.stats.status()) {
            case ItemStatus::Completed: ++snap.completed_count; break;
            case ItemStatus::Failed: ++snap.failed_count; break;
            case ItemStatus::Pending: ++snap.pending_count; break;
            case ItemStatus::Uploading: break;
        }
    }
    return snap;
}

std::optional<ItemStats> StatsAggregator::item(std::string_view relative_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(std::string(relative_path));
    if (it == index_.end()) return std::nullopt;
    return items_[it->second].stats;
}

uint64_t StatsAggregator::overall_transferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_.overall_transferred_bytes;
}

size_t StatsAggregator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_.active_set.size();
}

} // namespace driveup
