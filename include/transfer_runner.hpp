#pragma once

#include "credential_rotator.hpp"
#include "rclone_config.hpp"
#include "stats_aggregator.hpp"
#include "upload_error.hpp"
#include "work_enumerator.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace driveup {

struct RunnerOptions {
    std::filesystem::path rclone_path;                   // Absolute path to the transfer tool
    std::string chunk_size = "8M";                      // --drive-chunk-size
    int transfers = 4;                                  // --transfers parallelism hint
    std::chrono::milliseconds poll_interval{100};       // Line wait before re-checking the process
    std::chrono::milliseconds termination_grace{2000};  // SIGTERM to SIGKILL delay on cancel
    size_t queue_capacity = 256;                        // Buffered output lines per transfer
    bool verbose = false;
};

enum class RunnerState {
    Preparing,
    Running,
    Parsing,
    Finishing,
    Completed,
    Failed
};

std::string_view to_string(RunnerState state);

// floor(size * percent / 100) without intermediate overflow
uint64_t estimate_transferred(uint64_t size_bytes, int percent);

// Drives one rclone invocation for one item and republishes its progress
// through the aggregator. One attempt per call; retries are not its concern.
class TransferRunner {
public:
    TransferRunner(RunnerOptions options, RcloneConfigStore& configs, StatsAggregator& stats);

    // {} when the tool exited 0. ItemTransferFailed for a non-zero exit or any
    // launch/read failure, Interrupted when stop was requested mid-transfer.
    std::expected<void, UploadErrorInfo> run(
        const WorkItem& item,
        const Credential& credential,
        std::stop_token stop = {}
    );

    std::vector<std::string> build_command(
        const WorkItem& item,
        const std::filesystem::path& config_file
    ) const;

    // "gdrive:<parent of relative path>" for every item, "gdrive:/" at the top
    static std::string destination_for(const WorkItem& item);

    // Directories get a trailing separator so their contents are copied, not the directory
    static std::string source_argument(const WorkItem& item);

    const RunnerOptions& options() const { return options_; }

private:
    void trace(const WorkItem& item, RunnerState state, std::string_view detail = {}) const;

    RunnerOptions options_;
    RcloneConfigStore& configs_;
    StatsAggregator& stats_;
};

} // namespace driveup
