#include "subprocess.hpp"
#include <iostream>
#include <cassert>
#include <cerrno>
#include <signal.h>
#include <thread>

using namespace driveup;
using namespace std::chrono_literals;

static std::vector<std::string> collect(Subprocess& process) {
    LineQueue lines(16);
    std::jthread reader([&](std::stop_token stop) { pump_lines(process.output_fd(), lines, stop); });
    std::vector<std::string> out;
    std::string line;
    while (lines.pop(line, 5000ms) == LineQueue::PopStatus::Line) out.push_back(line);
    return out;
}

void test_spawn_and_wait() {
    std::cout << "Testing subprocess plumbing...\n\n";

    // Test 1: stdout and stderr arrive on one stream, CR splits lines, exit code is reported
    {
        auto p = Subprocess::spawn({"/bin/sh", "-c", "echo out; echo err 1>&2; printf 'a\\rb\\n'; exit 3"});
        assert(p.has_value());
        auto lines = collect(*p);
        auto code = p->wait();
        assert(code.has_value() && *code == 3);
        assert(lines.size() == 4);
        assert(lines[0] == "out");
        assert(lines[1] == "err");
        assert(lines[2] == "a");
        assert(lines[3] == "b");
        std::cout << "✓ Test 1 passed: Merged output and exit status\n";
    }

    // Test 2: Extra environment reaches the child
    {
        auto p = Subprocess::spawn({"/bin/sh", "-c", "echo \"$RCLONE_PROGRESS\""}, {"RCLONE_PROGRESS=true"});
        assert(p.has_value());
        auto lines = collect(*p);
        assert(p->wait().value() == 0);
        assert(lines.size() == 1 && lines[0] == "true");
        std::cout << "✓ Test 2 passed: Environment override\n";
    }

    // Test 3: Missing executable is reported by spawn, not as a silent exit
    {
        auto p = Subprocess::spawn({"/nonexistent/driveup-tool", "--version"});
        assert(!p.has_value());
        assert(p.error().code == ENOENT);
        std::cout << "✓ Test 3 passed: Exec failure surfaces\n";
    }

    // Test 4: ANSI sequences are stripped from output lines
    {
        assert(strip_ansi("\033[2K\033[1GTransferred: 50%") == "Transferred: 50%");
        assert(strip_ansi("plain") == "plain");
        std::cout << "✓ Test 4 passed: ANSI stripping\n";
    }
}

void test_termination() {
    // Test 5: terminate() stops a long-running child via SIGTERM
    {
        auto p = Subprocess::spawn({"/bin/sh", "-c", "exec sleep 30"});
        assert(p.has_value());
        assert(!p->try_wait());
        auto start = std::chrono::steady_clock::now();
        p->terminate(2000ms);
        assert(std::chrono::steady_clock::now() - start < 5s);
        auto code = p->try_wait();
        assert(code.has_value() && *code == 128 + SIGTERM);
        std::cout << "✓ Test 5 passed: SIGTERM teardown\n";
    }

    // Test 6: A child ignoring SIGTERM is killed after the grace period
    {
        auto p = Subprocess::spawn({"/bin/sh", "-c", "trap '' TERM; while :; do sleep 1; done"});
        assert(p.has_value());
        std::this_thread::sleep_for(100ms);
        p->terminate(200ms);
        auto code = p->try_wait();
        assert(code.has_value() && *code == 128 + SIGKILL);
        std::cout << "✓ Test 6 passed: SIGKILL escalation\n";
    }

    // Test 7: Destroying a running Subprocess reaps it
    {
        pid_t pid;
        {
            auto p = Subprocess::spawn({"/bin/sh", "-c", "exec sleep 30"});
            assert(p.has_value());
            pid = p->pid();
        }
        assert(::kill(pid, 0) == -1);
        std::cout << "✓ Test 7 passed: Destructor leaves no child behind\n";
    }
}

int main() {
    try {
        test_spawn_and_wait();
        test_termination();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
