#include "stats_aggregator.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace driveup;

static std::vector<WorkItem> make_items(const std::vector<std::pair<std::string, uint64_t>>& specs) {
    std::vector<WorkItem> items;
    for (const auto& [path, size] : specs) {
        items.push_back(WorkItem{ItemKind::File, "/src/" + path, path, size});
    }
    return items;
}

void test_derived_metrics() {
    std::cout << "Testing statistics aggregation...\n\n";

    // Test 1: Percentages
    {
        assert(overall_percent(50, 100) == 50);
        assert(overall_percent(0, 0) == 0);
        assert(overall_percent(10, 0) == 0);
        assert(overall_percent(200, 100) == 100);
        assert(overall_percent(99, 100) == 99);
        auto max = std::numeric_limits<uint64_t>::max();
        assert(overall_percent(max / 2, max) == 49);
        std::cout << "✓ Test 1 passed: overall_percent\n";
    }

    // Test 2: Throughput and ETA
    {
        assert(throughput_bps(100, 0.0) == 0.0);
        assert(throughput_bps(100, 4.0) == 25.0);
        assert(!eta_seconds(0, 100, 10.0));
        assert(!eta_seconds(100, 100, 10.0));
        auto eta = eta_seconds(50, 100, 10.0);
        assert(eta && std::abs(*eta - 10.0) < 1e-9);
        std::cout << "✓ Test 2 passed: Throughput and ETA\n";
    }

    // Test 3: Clock formatting
    {
        assert(format_hms(0) == "00:00:00");
        assert(format_hms(3661.9) == "01:01:01");
        assert(format_hms(-1) == kEtaPlaceholder);
        assert(format_hms(std::nan("")) == kEtaPlaceholder);
        assert(format_hms(std::numeric_limits<double>::infinity()) == kEtaPlaceholder);
        std::cout << "✓ Test 3 passed: HH:MM:SS formatting\n";
    }
}

void test_lifecycle() {
    // Test 4: Pending -> Uploading -> Completed, active set tracks it
    {
        StatsAggregator stats;
        stats.initialize(make_items({{"a.bin", 100}, {"b.bin", 50}}), 150);

        auto snap = stats.snapshot();
        assert(snap.items.size() == 2);
        assert(snap.pending_count == 2);
        assert(snap.global.total_size_bytes == 150);

        assert(stats.mark_started("a.bin"));
        assert(!stats.mark_started("a.bin"));
        assert(stats.active_count() == 1);
        assert(stats.item("a.bin")->status() == ItemStatus::Uploading);

        assert(stats.apply_progress("a.bin", 40, "4 MiB/s", "3s"));
        assert(stats.item("a.bin")->transferred_bytes == 40);
        assert(stats.item("a.bin")->percent() == 40);
        assert(stats.overall_transferred() == 40);

        assert(stats.apply_progress("a.bin", 60, "4 MiB/s", ""));
        assert(stats.mark_terminal("a.bin", TerminalState::Completed));
        auto a = stats.item("a.bin");
        assert(a->status() == ItemStatus::Completed);
        assert(a->transferred_bytes == 100);
        assert(a->speed_label == "Done");
        assert(stats.active_count() == 0);
        assert(stats.overall_transferred() == 100);
        std::cout << "✓ Test 4 passed: Item lifecycle\n";
    }

    // Test 5: Terminal transitions happen once; later updates are ignored
    {
        StatsAggregator stats;
        stats.initialize(make_items({{"x", 10}}), 10);
        stats.mark_started("x");
        stats.apply_progress("x", 3, "", "");
        assert(stats.mark_terminal("x", TerminalState::Failed));
        assert(!stats.mark_terminal("x", TerminalState::Completed));
        assert(!stats.mark_terminal("x", TerminalState::Error));
        assert(!stats.apply_progress("x", 5, "", ""));

        auto x = stats.item("x");
        assert(x->status() == ItemStatus::Failed);
        assert(x->speed_label == "Failed");
        assert(x->transferred_bytes == 3);
        assert(stats.overall_transferred() == 3);
        assert(stats.active_count() == 0);

        auto snap = stats.snapshot();
        assert(snap.failed_count == 1);
        assert(snap.completed_count == 0);
        std::cout << "✓ Test 5 passed: Idempotent terminal state\n";
    }

    // Test 6: Error label and unknown paths
    {
        StatsAggregator stats;
        stats.initialize(make_items({{"y", 10}}), 10);
        assert(stats.mark_terminal("y", TerminalState::Error));
        assert(stats.item("y")->speed_label == "Error");
        assert(!stats.apply_progress("nope", 1, "", ""));
        assert(!stats.mark_started("nope"));
        assert(!stats.item("nope"));
        std::cout << "✓ Test 6 passed: Error state and unknown items\n";
    }

    // Test 7: Snapshot ETA placeholder with nothing transferred
    {
        StatsAggregator stats;
        stats.initialize(make_items({{"z", 10}}), 10);
        auto snap = stats.snapshot();
        assert(snap.percent() == 0);
        assert(snap.eta_label() == kEtaPlaceholder);
        std::cout << "✓ Test 7 passed: Unknown ETA\n";
    }
}

void test_concurrent_updates() {
    // Test 8: Concurrent writers; every snapshot is monotonic and internally consistent
    constexpr int kWriters = 4;
    constexpr int kUpdates = 2000;

    std::vector<std::pair<std::string, uint64_t>> specs;
    for (int i = 0; i < kWriters; ++i) specs.emplace_back("item" + std::to_string(i), kUpdates * 3);
    StatsAggregator stats;
    stats.initialize(make_items(specs), kWriters * kUpdates * 3);

    std::atomic<bool> done{false};
    std::atomic<int> snapshots{0};
    std::jthread reader([&] {
        uint64_t last = 0;
        do {
            auto snap = stats.snapshot();
            uint64_t sum = 0;
            for (const auto& record : snap.items) sum += record.stats.transferred_bytes;
            assert(sum == snap.global.overall_transferred_bytes);
            assert(snap.global.overall_transferred_bytes >= last);
            last = snap.global.overall_transferred_bytes;
            snapshots++;
        } while (!done.load());
    });

    {
        std::vector<std::jthread> writers;
        for (int w = 0; w < kWriters; ++w) {
            writers.emplace_back([&stats, w] {
                auto path = "item" + std::to_string(w);
                stats.mark_started(path);
                for (int i = 0; i < kUpdates; ++i) stats.apply_progress(path, 3, "1 MiB/s", "1s");
                stats.mark_terminal(path, TerminalState::Completed);
            });
        }
    }
    done = true;
    reader.join();

    auto snap = stats.snapshot();
    assert(snap.global.overall_transferred_bytes == static_cast<uint64_t>(kWriters) * kUpdates * 3);
    assert(snap.completed_count == kWriters);
    assert(snap.active_count() == 0);
    assert(snap.percent() == 100);
    assert(snapshots.load() > 0);
    std::cout << "✓ Test 8 passed: Concurrent updates stay consistent (" << snapshots.load() << " snapshots)\n";
}

int main() {
    try {
        test_derived_metrics();
        test_lifecycle();
        test_concurrent_updates();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
