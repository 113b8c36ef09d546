#pragma once

#include "credential_rotator.hpp"
#include "stats_aggregator.hpp"
#include "upload_error.hpp"
#include "work_enumerator.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace driveup {

// One transfer attempt; TransferRunner::run in production
using TransferFn = std::function<std::expected<void, UploadErrorInfo>(
    const WorkItem&, const Credential&, std::stop_token)>;

struct RunSummary {
    size_t total = 0;
    size_t completed_count = 0;
    size_t failed_count = 0;
    std::vector<std::string> failed_paths;  // Enumeration order

    bool all_succeeded() const { return failed_count == 0 && completed_count == total; }
};

// Fixed-size worker pool. Items are dispatched in enumeration order and may
// finish in any order; per-item failures are recorded, never propagated.
class Scheduler {
public:
    Scheduler(CredentialRotator& rotator, StatsAggregator& stats, TransferFn transfer);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Blocks until every dispatched item is terminal. Interrupted if cancel()
    // was called; in-flight transfers have been torn down by then.
    std::expected<RunSummary, UploadErrorInfo> run_all(
        const std::vector<WorkItem>& items,
        size_t concurrency_limit
    );

    // Safe from any thread, including the signal watcher
    void cancel() { stop_.request_stop(); }
    bool cancelled() const { return stop_.stop_requested(); }

    // Cancel when interrupt is requested, immediately if it already was
    void cancel_on(std::stop_token interrupt);

private:
    CredentialRotator& rotator_;
    StatsAggregator& stats_;
    TransferFn transfer_;
    std::stop_source stop_;
    std::optional<std::stop_callback<std::function<void()>>> interrupt_link_;
};

} // namespace driveup
