#include "presenter.hpp"
#include "compact_log.hpp"
#include <algorithm>
#include <format>

namespace driveup {

namespace {

constexpr size_t kPathWidth = 45;
constexpr size_t kItemBarWidth = 20;
constexpr size_t kOverallBarWidth = 40;

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kDim = "\033[2m";
constexpr std::string_view kYellow = "\033[33m";
constexpr std::string_view kGreen = "\033[32m";
constexpr std::string_view kRed = "\033[31m";
constexpr std::string_view kBoldCyan = "\033[1;36m";

std::string_view color_for(ItemStatus status) {
    switch (status) {
        case ItemStatus::Uploading: return kYellow;
        case ItemStatus::Completed: return kGreen;
        case ItemStatus::Failed: return kRed;
        case ItemStatus::Pending: return kDim;
    }
    return kReset;
}

// Active first, then finished, then waiting
int display_rank(ItemStatus status) {
    switch (status) {
        case ItemStatus::Uploading: return 0;
        case ItemStatus::Completed: return 1;
        case ItemStatus::Failed: return 2;
        case ItemStatus::Pending: return 3;
    }
    return 4;
}

std::string pad(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

} // namespace

std::string render_bar(int percent, size_t width) {
    percent = std::clamp(percent, 0, 100);
    size_t filled = width * static_cast<size_t>(percent) / 100;
    std::string bar;
    bar.reserve(filled * 3 + (width - filled));
    for (size_t i = 0; i < filled; ++i) bar += "━";
    bar.append(width - filled, ' ');
    return bar;
}

std::string format_size_gb(uint64_t bytes) {
    return std::format("{:.2f} GB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
}

std::string format_speed_mbps(double bytes_per_second) {
    return std::format("{:.2f} MB/s", bytes_per_second / (1024.0 * 1024.0));
}

std::string ellipsize(const std::string& text, size_t width) {
    if (text.size() <= width) return text;
    if (width <= 3) return text.substr(0, width);
    size_t cut = width - 3;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

std::string render_frame(const StatsSnapshot& snapshot, const PresenterOptions& options) {
    const auto& g = snapshot.global;
    std::string out;

    out += std::format("{}driveup{} {}\n\n", kBoldCyan, kReset, options.title);
    out += std::format("Overall Progress [{}] {:>3}% • {} / {} • ETA {}\n\n",
        render_bar(snapshot.percent(), kOverallBarWidth),
        snapshot.percent(),
        format_size_gb(g.overall_transferred_bytes),
        format_size_gb(g.total_size_bytes),
        snapshot.eta_label());

    out += std::format("{}Upload Summary{}\n", kBoldCyan, kReset);
    auto metric = [&](std::string_view name, const std::string& value) {
        out += std::format("  {:<10} {}\n", name, value);
    };
    metric("Files", std::to_string(snapshot.items.size()));
    metric("Size", format_size_gb(g.total_size_bytes));
    metric("Uploaded", format_size_gb(g.overall_transferred_bytes));
    metric("Progress", std::format("{}%", snapshot.percent()));
    metric("Speed", format_speed_mbps(snapshot.throughput()));
    metric("Elapsed", snapshot.elapsed_label());
    metric("ETA", snapshot.eta_label());
    metric("Active", std::format("{}/{}", snapshot.active_count(), options.worker_limit));

    out += std::format("\n{}File Status{}\n", kBoldCyan, kReset);

    std::vector<const ItemRecord*> rows;
    rows.reserve(snapshot.items.size());
    for (const auto& record : snapshot.items) rows.push_back(&record);
    std::stable_sort(rows.begin(), rows.end(), [](const ItemRecord* a, const ItemRecord* b) {
        return display_rank(a->stats.status()) < display_rank(b->stats.status());
    });

    size_t shown = std::min(rows.size(), options.max_rows);
    for (size_t i = 0; i < shown; ++i) {
        const auto& stats = rows[i]->stats;
        auto status = stats.status();
        out += std::format("  {}{} {} {:>3}%  {:<12} {:<10} {}{}\n",
            color_for(status),
            pad(ellipsize(rows[i]->relative_path, kPathWidth), kPathWidth),
            render_bar(stats.percent(), kItemBarWidth),
            stats.percent(),
            status == ItemStatus::Pending ? std::string() : stats.speed_label,
            status == ItemStatus::Uploading ? stats.eta_label : std::string(),
            to_string(status),
            kReset);
    }
    if (rows.size() > shown) {
        out += std::format("  {}... {} more{}\n", kDim, rows.size() - shown, kReset);
    }

    // Nothing pending or in flight: the run is over
    if (!snapshot.items.empty() && snapshot.pending_count == 0 && snapshot.active_count() == 0) {
        out += std::format("\n{}Status{}\n  {}All uploads completed!{}\n", kBoldCyan, kReset, kGreen, kReset);
        return out;
    }

    out += std::format("\n{}Current Transfers{}\n  Active Uploads:", kBoldCyan, kReset);
    size_t listed = 0;
    for (const auto& record : snapshot.items) {
        if (record.stats.status() != ItemStatus::Uploading) continue;
        out += std::format("\n    - {}: {}% ({})",
            ellipsize(record.relative_path, kPathWidth), record.stats.percent(), record.stats.speed_label);
        ++listed;
    }
    out += listed == 0 ? " None\n" : "\n";
    return out;
}

std::string render_log_line(const StatsSnapshot& snapshot, const PresenterOptions& options) {
    const auto& g = snapshot.global;
    return std::format(
        "progress percent={} uploaded={} total={} speed={} elapsed={} eta={} active={}/{} done={} failed={} pending={}\n",
        snapshot.percent(),
        g.overall_transferred_bytes,
        g.total_size_bytes,
        format_speed_mbps(snapshot.throughput()),
        snapshot.elapsed_label(),
        snapshot.eta_label(),
        snapshot.active_count(),
        options.worker_limit,
        snapshot.completed_count,
        snapshot.failed_count,
        snapshot.pending_count);
}

Presenter::Presenter(const StatsAggregator& stats, PresenterOptions options)
    : stats_(stats), options_(std::move(options)) {}

Presenter::~Presenter() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void Presenter::render_once() const {
    auto snapshot = stats_.snapshot();
    if (options_.mode == PresenterMode::LiveView) {
        // Home + clear, then the whole frame in one write
        Console::print("\033[H\033[2J" + render_frame(snapshot, options_));
    } else {
        Console::print(render_log_line(snapshot, options_));
    }
}

void Presenter::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            render_once();
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, stop, options_.refresh_interval, [] { return false; });
        }
    });
}

void Presenter::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();
    render_once();
}

} // namespace driveup
