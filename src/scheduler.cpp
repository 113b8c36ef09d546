#include "scheduler.hpp"
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace driveup {

namespace {

enum class Outcome {
    NotRun,
    Completed,
    Failed
};

TerminalState terminal_state_for(const UploadErrorInfo& error) {
    // A tool that ran and exited non-zero, or was stopped, is a failed transfer;
    // a launch or read failure is an error on our side.
    if (error.error == UploadError::Interrupted) return TerminalState::Failed;
    if (error.error == UploadError::ItemTransferFailed && error.exit_code > 0) {
        return TerminalState::Failed;
    }
    return TerminalState::Error;
}

} // namespace

Scheduler::Scheduler(CredentialRotator& rotator, StatsAggregator& stats, TransferFn transfer)
    : rotator_(rotator), stats_(stats), transfer_(std::move(transfer)) {}

void Scheduler::cancel_on(std::stop_token interrupt) {
    interrupt_link_.emplace(std::move(interrupt), std::function<void()>([this] { cancel(); }));
}

std::expected<RunSummary, UploadErrorInfo> Scheduler::run_all(
    const std::vector<WorkItem>& items,
    size_t concurrency_limit
) {
    RunSummary summary;
    summary.total = items.size();
    if (items.empty()) return summary;

    std::queue<size_t> pending;
    for (size_t i = 0; i < items.size(); ++i) {
        pending.push(i);
    }
    std::mutex queue_mutex;
    std::vector<Outcome> outcomes(items.size(), Outcome::NotRun);
    auto stop = stop_.get_token();

    auto worker = [&]() {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (pending.empty() || stop.stop_requested()) {
                    return;
                }
                index = pending.front();
                pending.pop();
            }

            const auto& item = items[index];
            stats_.mark_started(item.relative_path);
            const auto& credential = rotator_.next();

            auto result = transfer_(item, credential, stop);
            if (result) {
                stats_.mark_terminal(item.relative_path, TerminalState::Completed);
                outcomes[index] = Outcome::Completed;
            } else {
                stats_.mark_terminal(item.relative_path, terminal_state_for(result.error()));
                outcomes[index] = Outcome::Failed;
            }
        }
    };

    {
        std::vector<std::jthread> workers;
        size_t num_threads = std::clamp<size_t>(concurrency_limit, 1, items.size());
        workers.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back(worker);
        }
        // Joining here is the completion signal: every dispatched item is terminal after it.
    }

    for (size_t i = 0; i < items.size(); ++i) {
        if (outcomes[i] == Outcome::Completed) {
            ++summary.completed_count;
        } else if (outcomes[i] == Outcome::Failed) {
            ++summary.failed_count;
            summary.failed_paths.push_back(items[i].relative_path);
        }
    }

    if (stop.stop_requested()) {
        return std::unexpected(UploadErrorInfo{
            UploadError::Interrupted,
            "Upload canceled by user"
        });
    }
    return summary;
}

} // namespace driveup
