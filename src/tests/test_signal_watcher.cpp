#include "signal_watcher.hpp"
#include "scheduler.hpp"
#include "work_enumerator.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <fstream>
#include <stop_token>
#include <signal.h>
#include <unistd.h>

using namespace driveup;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / (name + "-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void test_signal_watcher() {
    std::cout << "Testing signal watcher...\n\n";

    // Test 1: A process-directed SIGTERM reaches the callback on the watcher thread
    {
        std::atomic<int> seen{0};
        SignalWatcher watcher([&seen](int sig) { seen = sig; });
        ::kill(::getpid(), SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (seen.load() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        assert(seen.load() == SIGTERM);
        assert(watcher.received() == SIGTERM);
        std::cout << "✓ Test 1 passed: SIGTERM delivered to callback\n";
    }

    // Test 2: SIGINT too, and the watcher shuts down promptly
    {
        std::atomic<int> count{0};
        auto start = std::chrono::steady_clock::now();
        {
            SignalWatcher watcher([&count](int sig) {
                if (sig == SIGINT) count++;
            });
            ::kill(::getpid(), SIGINT);
            auto deadline = std::chrono::steady_clock::now() + 2s;
            while (count.load() == 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(10ms);
            }
        }
        assert(count.load() == 1);
        assert(std::chrono::steady_clock::now() - start < 3s);
        std::cout << "✓ Test 2 passed: SIGINT delivered, watcher stops\n";
    }
}

void test_interrupt_before_scheduling() {
    // Test 3: A SIGINT that lands before any work is scheduled still cancels the run
    auto root = make_temp_dir("driveup-signal-early");
    std::ofstream(root / "a.bin") << "abc";

    std::stop_source interrupt;
    SignalWatcher watcher([&interrupt](int) { interrupt.request_stop(); });
    ::kill(::getpid(), SIGINT);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!interrupt.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    assert(interrupt.stop_requested());

    auto enumeration = enumerate(root, EnumerationMode::Flat, interrupt.get_token());
    assert(!enumeration.has_value());
    assert(enumeration.error().error == UploadError::Interrupted);
    assert(enumeration.error().message == "Upload canceled by user");

    auto rotator = std::move(*CredentialRotator::create({Credential{"/keys/sa.json"}}));
    StatsAggregator stats;
    std::vector<WorkItem> items = {WorkItem{ItemKind::File, root / "a.bin", "a.bin", 3}};
    stats.initialize(items, 3);
    bool called = false;
    Scheduler scheduler(rotator, stats, [&called](const WorkItem&, const Credential&, std::stop_token)
        -> std::expected<void, UploadErrorInfo> {
        called = true;
        return {};
    });
    scheduler.cancel_on(interrupt.get_token());
    assert(scheduler.cancelled());

    auto summary = scheduler.run_all(items, 2);
    assert(!summary.has_value());
    assert(summary.error().error == UploadError::Interrupted);
    assert(!called);
    assert(stats.snapshot().pending_count == 1);
    fs::remove_all(root);
    std::cout << "✓ Test 3 passed: Early interrupt reaches enumeration and scheduler\n";
}

int main() {
    // Must precede every thread, as in the real program
    SignalWatcher::block_signals();
    try {
        test_signal_watcher();
        test_interrupt_before_scheduling();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
