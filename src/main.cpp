#include "compact_log.hpp"
#include "credential_rotator.hpp"
#include "presenter.hpp"
#include "rclone_config.hpp"
#include "scheduler.hpp"
#include "signal_watcher.hpp"
#include "stats_aggregator.hpp"
#include "transfer_runner.hpp"
#include "upload_config.hpp"
#include "work_enumerator.hpp"
#include <chrono>
#include <format>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

using namespace driveup;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInterrupted = 130;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    UploadConfig config;
    std::filesystem::path rclone;
    std::optional<CredentialRotator> rotator;
    Enumeration enumeration;
    std::expected<RunSummary, UploadErrorInfo> result = RunSummary{};
    StatsSnapshot final_snapshot;
    int exit_code = kExitOk;
    std::optional<UploadErrorInfo> error;
    std::chrono::steady_clock::time_point start_time;
    std::stop_source interrupt;               // Requested by the first SIGINT/SIGTERM
    std::optional<SignalWatcher> watcher;     // Declared after interrupt: stops first
};

// Records a pending interrupt as the run's outcome
bool take_interrupt(FSMContext& ctx) {
    if (!ctx.interrupt.stop_requested()) return false;
    ctx.result = std::unexpected(UploadErrorInfo{UploadError::Interrupted, "Upload canceled by user"});
    return true;
}

void print_banner(const FSMContext& ctx) {
    const auto& c = ctx.config;
    Console::info(std::format("\ndriveup: {} → {}", c.input_dir.string(), c.target_id));
    Console::info(std::format("  workers {} • chunk {} • transfers {} • {} service accounts • {}\n",
        c.workers, c.chunk_size, c.transfers, ctx.rotator ? ctx.rotator->size() : 0,
        is_team_drive(c.target_id) ? "shared drive" : "folder"));
}

void print_summary(const RunSummary& summary) {
    auto line = std::format("\nUpload completed: {}/{} files uploaded successfully",
        summary.completed_count, summary.total);
    if (summary.all_succeeded()) Console::success(line);
    else Console::warning(line);

    if (!summary.failed_paths.empty()) {
        Console::warning("\nFailed files:");
        for (const auto& path : summary.failed_paths) {
            Console::warning(std::format("  - {}", path));
        }
    }
}

// Workspace, runner, scheduler and presenter live exactly as long as the run;
// the temp workspace is removed on every path out of here.
std::expected<RunSummary, UploadErrorInfo> run_upload(FSMContext& ctx) {
    auto workspace = TempWorkspace::create();
    if (!workspace) return std::unexpected(workspace.error());

    RcloneConfigStore configs(workspace->path(), ctx.config.target_id);
    StatsAggregator stats;
    stats.initialize(ctx.enumeration.items, ctx.enumeration.total_size);

    RunnerOptions runner_options;
    runner_options.rclone_path = ctx.rclone;
    runner_options.chunk_size = ctx.config.chunk_size;
    runner_options.transfers = ctx.config.transfers;
    runner_options.verbose = ctx.config.verbose;
    TransferRunner runner(runner_options, configs, stats);

    Scheduler scheduler(*ctx.rotator, stats,
        [&runner](const WorkItem& item, const Credential& credential, std::stop_token stop) {
            return runner.run(item, credential, stop);
        });

    scheduler.cancel_on(ctx.interrupt.get_token());

    PresenterOptions presenter_options;
    presenter_options.worker_limit = ctx.config.workers;
    presenter_options.title = std::format("{} → {}", ctx.config.input_dir.string(), ctx.config.target_id);
    bool live = ctx.config.live_view && !ctx.config.verbose && Console::is_terminal();
    presenter_options.mode = live ? PresenterMode::LiveView : PresenterMode::LogLines;
    if (!live) presenter_options.refresh_interval = std::chrono::seconds(1);

    Presenter presenter(stats, presenter_options);
    presenter.start();
    auto result = scheduler.run_all(ctx.enumeration.items, ctx.config.workers);
    presenter.stop();

    ctx.final_snapshot = stats.snapshot();
    return result;
}

int run_state_machine(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                ctx.watcher.emplace([&ctx](int) { ctx.interrupt.request_stop(); });
                apply_environment(ctx.config);
                state = FSMState::ParseArgs;
                break;
            case FSMState::ParseArgs: {
                std::vector<std::string> args(ctx.argv + 1, ctx.argv + ctx.argc);
                if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
                    Console::print(usage(ctx.argv[0]));
                    state = FSMState::Done;
                    break;
                }
                auto parsed = parse_arguments(args, ctx.config);
                if (!parsed) {
                    ctx.error = parsed.error();
                    state = FSMState::Error;
                    break;
                }
                ctx.config = std::move(*parsed);
                state = FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand: {
                // Configuration problems abort before any work starts
                auto exe_dir = executable_dir();
                auto rclone = find_rclone(ctx.config.rclone_path, exe_dir);
                if (!rclone) {
                    ctx.error = rclone.error();
                    state = FSMState::Error;
                    break;
                }
                ctx.rclone = *rclone;
                if (take_interrupt(ctx)) {
                    state = FSMState::PostCommand;
                    break;
                }

                auto rotator = CredentialRotator::discover(resolve_accounts_dir(ctx.config.accounts_dir, exe_dir));
                if (!rotator) {
                    ctx.error = rotator.error();
                    state = FSMState::Error;
                    break;
                }
                ctx.rotator.emplace(std::move(*rotator));
                Console::success(std::format("Found {} service accounts", ctx.rotator->size()));

                print_banner(ctx);
                if (take_interrupt(ctx)) {
                    state = FSMState::PostCommand;
                    break;
                }

                auto enumeration = enumerate(ctx.config.input_dir, ctx.config.mode, ctx.interrupt.get_token());
                if (take_interrupt(ctx)) {
                    state = FSMState::PostCommand;
                    break;
                }
                if (!enumeration) {
                    ctx.error = enumeration.error();
                    state = FSMState::Error;
                    break;
                }
                ctx.enumeration = std::move(*enumeration);

                if (ctx.enumeration.items.empty()) {
                    Console::warning("No files found to upload");
                    state = FSMState::Done;
                    break;
                }
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                ctx.result = run_upload(ctx);
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand: {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - ctx.start_time).count();
                if (ctx.result) {
                    print_summary(*ctx.result);
                    ctx.exit_code = ctx.result->all_succeeded() ? kExitOk : kExitFailure;
                } else if (ctx.result.error().error == UploadError::Interrupted) {
                    const auto& snap = ctx.final_snapshot;
                    if (snap.items.empty()) {
                        // Interrupted before anything was scheduled
                        Console::warning(std::format("\n{}", ctx.result.error().message));
                    } else {
                        Console::warning(std::format("\n{} ({}/{} completed, {} failed, {} not started)",
                            ctx.result.error().message, snap.completed_count, snap.items.size(),
                            snap.failed_count, snap.pending_count));
                    }
                    ctx.exit_code = kExitInterrupted;
                } else {
                    ctx.error = ctx.result.error();
                    state = FSMState::Error;
                    break;
                }
                if (ctx.config.verbose) {
                    Console::print(std::format("Elapsed: {} ms\n", ms));
                }
                state = FSMState::Done;
                break;
            }
            case FSMState::Error:
                ctx.exit_code = kExitFailure;
                if (ctx.error) {
                    Console::fail(std::format("Error: {}", ctx.error->message));
                    if (ctx.error->error == UploadError::UsageError) {
                        Console::error(usage(ctx.argv[0]));
                    }
                }
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}

} // namespace

int main(int argc, char** argv) {
    // Before any thread exists, so only the watcher thread sees SIGINT/SIGTERM
    SignalWatcher::block_signals();
    return run_guarded([argc, argv] { return run_state_machine(argc, argv); });
}
