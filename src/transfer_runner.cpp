#include "transfer_runner.hpp"
#include "compact_log.hpp"
#include "line_queue.hpp"
#include "progress_parser.hpp"
#include "subprocess.hpp"
#include <format>
#include <thread>

namespace driveup {

std::string_view to_string(RunnerState state) {
    switch (state) {
        case RunnerState::Preparing: return "preparing";
        case RunnerState::Running: return "running";
        case RunnerState::Parsing: return "parsing";
        case RunnerState::Finishing: return "finishing";
        case RunnerState::Completed: return "completed";
        case RunnerState::Failed: return "failed";
    }
    return "unknown";
}

uint64_t estimate_transferred(uint64_t size_bytes, int percent) {
    if (percent <= 0) return 0;
    if (percent >= 100) return size_bytes;
    return static_cast<uint64_t>(static_cast<unsigned __int128>(size_bytes) * percent / 100);
}

TransferRunner::TransferRunner(RunnerOptions options, RcloneConfigStore& configs, StatsAggregator& stats)
    : options_(std::move(options)), configs_(configs), stats_(stats) {}

std::string TransferRunner::destination_for(const WorkItem& item) {
    auto remote_dir = std::filesystem::path(item.relative_path).parent_path();
    if (remote_dir.empty()) return std::format("{}:/", kRemoteName);
    return std::format("{}:{}", kRemoteName, remote_dir.generic_string());
}

std::string TransferRunner::source_argument(const WorkItem& item) {
    auto source = item.source_path.string();
    if (item.kind == ItemKind::Directory && !source.ends_with('/')) {
        source += '/';
    }
    return source;
}

std::vector<std::string> TransferRunner::build_command(
    const WorkItem& item,
    const std::filesystem::path& config_file
) const {
    std::vector<std::string> command = {
        options_.rclone_path.string(),
        "--config", config_file.string(),
        "copy",
        "--drive-chunk-size", options_.chunk_size,
        "--transfers", std::to_string(options_.transfers),
        "--stats", "1s",
        "--progress"
    };
    // rclone skips symlinks by default; a linked file item must upload its target
    if (item.kind == ItemKind::File) command.push_back("--copy-links");
    command.push_back(source_argument(item));
    command.push_back(destination_for(item));
    return command;
}

void TransferRunner::trace(const WorkItem& item, RunnerState state, std::string_view detail) const {
    if (!options_.verbose) return;
    if (detail.empty()) {
        Console::print(std::format("[runner] {}: {}\n", item.relative_path, to_string(state)));
    } else {
        Console::print(std::format("[runner] {}: {} ({})\n", item.relative_path, to_string(state), detail));
    }
}

std::expected<void, UploadErrorInfo> TransferRunner::run(
    const WorkItem& item,
    const Credential& credential,
    std::stop_token stop
) {
    auto fail = [&](std::string message, int exit_code = -1) {
        trace(item, RunnerState::Failed, message);
        return std::unexpected(UploadErrorInfo{UploadError::ItemTransferFailed, std::move(message), exit_code});
    };

    try {
        trace(item, RunnerState::Preparing, credential.name());
        auto config = configs_.config_for(credential);
        if (!config) return fail(config.error().message);

        auto command = build_command(item, *config);
        auto process = Subprocess::spawn(command, {"RCLONE_PROGRESS=true"});
        if (!process) return fail(process.error().message);
        trace(item, RunnerState::Running, std::format("pid {}", process->pid()));

        // Declared after the process so the reader is joined before the pipe closes
        LineQueue lines(options_.queue_capacity);
        std::jthread reader([&lines, fd = process->output_fd()](std::stop_token reader_stop) {
            pump_lines(fd, lines, reader_stop);
        });

        trace(item, RunnerState::Parsing);
        ProgressState progress;
        uint64_t last_estimate = 0;
        std::string last_output;
        std::string line;

        while (true) {
            if (stop.stop_requested()) {
                reader.request_stop();
                process->terminate(options_.termination_grace);
                trace(item, RunnerState::Failed, "cancelled");
                return std::unexpected(UploadErrorInfo{
                    UploadError::Interrupted,
                    std::format("Transfer of {} cancelled", item.relative_path)
                });
            }

            auto status = lines.pop(line, options_.poll_interval);
            if (status == LineQueue::PopStatus::Closed) break;
            if (status == LineQueue::PopStatus::Timeout) {
                if (process->try_wait()) break;
                continue;
            }

            last_output = line;
            if (!progress.merge(parse_progress_line(line))) continue;

            // Percent text can step backwards (rclone also prints a per-file-count
            // percentage), so the estimate only ever advances.
            uint64_t estimate = estimate_transferred(item.size_bytes, progress.percent);
            uint64_t delta = 0;
            if (estimate > last_estimate) {
                delta = estimate - last_estimate;
                last_estimate = estimate;
            }
            stats_.apply_progress(item.relative_path, delta, progress.speed, progress.eta);
        }

        trace(item, RunnerState::Finishing);
        auto exit_code = process->wait();
        reader.request_stop();
        if (!exit_code) return fail(exit_code.error().message);

        if (*exit_code != 0) {
            auto message = last_output.empty()
                ? std::format("rclone exited with status {}", *exit_code)
                : std::format("rclone exited with status {}: {}", *exit_code, last_output);
            return fail(std::move(message), *exit_code);
        }

        // Flooring percentages loses bytes; top the item up to its declared size.
        stats_.apply_progress(item.relative_path, item.size_bytes - last_estimate, progress.speed, "");
        trace(item, RunnerState::Completed);
        return {};
    } catch (const std::exception& e) {
        return fail(std::format("Transfer of {} aborted: {}", item.relative_path, e.what()));
    }
}

} // namespace driveup
