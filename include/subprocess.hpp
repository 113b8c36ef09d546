#pragma once

#include "line_queue.hpp"
#include <sys/types.h>
#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace driveup {

struct ProcessError {
    std::string message;
    int code;  // errno, or -1
};

// A child process whose stdout and stderr are merged into one pipe.
// The destructor kills and reaps a child that is still running, so a
// Subprocess going out of scope never leaves an orphan or a zombie.
class Subprocess {
public:
    // argv[0] must be a path to an executable. extra_env entries ("KEY=value")
    // override or extend the parent's environment.
    static std::expected<Subprocess, ProcessError> spawn(
        const std::vector<std::string>& argv,
        const std::vector<std::string>& extra_env = {}
    );

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    pid_t pid() const { return pid_; }
    int output_fd() const { return output_fd_; }

    // Non-blocking; the exit status once the child has been reaped
    std::optional<int> try_wait();

    // Blocks until the child exits. Exit code, or 128 + signal number.
    std::expected<int, ProcessError> wait();

    // SIGTERM, then SIGKILL once grace has elapsed; always reaps
    void terminate(std::chrono::milliseconds grace);

    void close_output();

private:
    Subprocess(pid_t pid, int output_fd);

    void release();

    pid_t pid_ = -1;
    int output_fd_ = -1;
    std::optional<int> exit_code_;
};

// Read fd until EOF or stop, splitting on '\n' and '\r' and stripping ANSI
// escape sequences. Every non-empty line is pushed in order; the queue is
// closed on return.
void pump_lines(int fd, LineQueue& queue, std::stop_token stop);

// Strip CSI escape sequences ("\033[...X") from a line of terminal output
std::string strip_ansi(std::string_view line);

} // namespace driveup
