#include "subprocess.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

extern char** environ;

namespace driveup {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::vector<std::string> merged_environment(const std::vector<std::string>& extra_env) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& extra : extra_env) {
            if (std::string_view(extra).substr(0, extra.find('=')) == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.emplace_back(entry);
    }
    env.insert(env.end(), extra_env.begin(), extra_env.end());
    return env;
}

std::vector<char*> c_array(std::vector<std::string>& storage) {
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size() + 1);
    for (auto& value : storage) {
        ptrs.push_back(value.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

} // namespace

Subprocess::Subprocess(pid_t pid, int output_fd)
    : pid_(pid), output_fd_(output_fd) {}

Subprocess::~Subprocess() {
    release();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(other.pid_),
      output_fd_(other.output_fd_),
      exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.output_fd_ = -1;
}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        output_fd_ = other.output_fd_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.output_fd_ = -1;
    }
    return *this;
}

void Subprocess::release() {
    if (pid_ > 0 && !exit_code_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
    }
    pid_ = -1;
    close_output();
}

std::expected<Subprocess, ProcessError> Subprocess::spawn(
    const std::vector<std::string>& argv,
    const std::vector<std::string>& extra_env
) {
    if (argv.empty()) {
        return std::unexpected(ProcessError{"Empty command line", -1});
    }

    // Everything the child needs is built before fork: only async-signal-safe calls after it.
    std::vector<std::string> argv_storage = argv;
    std::vector<std::string> env_storage = merged_environment(extra_env);
    auto argv_ptrs = c_array(argv_storage);
    auto env_ptrs = c_array(env_storage);

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    if (::pipe2(out_pipe.data(), O_CLOEXEC) == -1) {
        return std::unexpected(ProcessError{std::format("pipe failed: {}", strerror(errno)), errno});
    }
    if (::pipe2(err_pipe.data(), O_CLOEXEC) == -1) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(ProcessError{std::format("pipe failed: {}", strerror(saved)), saved});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(ProcessError{std::format("fork failed: {}", strerror(saved)), saved});
    }

    if (pid == 0) {
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            if (dev_null > STDERR_FILENO) ::close(dev_null);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);

        ::execve(argv_ptrs[0], argv_ptrs.data(), env_ptrs.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    // The exec-error pipe is close-on-exec: EOF means execve succeeded.
    int exec_errno = 0;
    ssize_t n;
    while ((n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno))) == -1 && errno == EINTR) {}
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        ::close(out_pipe[0]);
        return std::unexpected(ProcessError{
            std::format("Failed to execute {}: {}", argv.front(), strerror(exec_errno)),
            exec_errno
        });
    }

    return Subprocess(pid, out_pipe[0]);
}

std::optional<int> Subprocess::try_wait() {
    if (exit_code_ || pid_ <= 0) return exit_code_;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_code_ = decode_status(status);
    }
    return exit_code_;
}

std::expected<int, ProcessError> Subprocess::wait() {
    if (exit_code_) return *exit_code_;
    if (pid_ <= 0) return std::unexpected(ProcessError{"No child process", -1});

    int status = 0;
    pid_t r;
    while ((r = ::waitpid(pid_, &status, 0)) == -1 && errno == EINTR) {}
    if (r == -1) {
        return std::unexpected(ProcessError{std::format("waitpid failed: {}", strerror(errno)), errno});
    }
    exit_code_ = decode_status(status);
    return *exit_code_;
}

void Subprocess::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || try_wait()) return;

    ::kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_wait()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::kill(pid_, SIGKILL);
    if (auto reaped = wait(); !reaped) {
        // Already gone (reaped elsewhere); nothing left to kill
        pid_ = -1;
    }
}

void Subprocess::close_output() {
    if (output_fd_ != -1) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
}

std::string strip_ansi(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\033' && i + 1 < line.size() && line[i + 1] == '[') {
            i += 2;
            // Parameter and intermediate bytes, then one final byte in 0x40-0x7e
            while (i < line.size() && (line[i] < 0x40 || line[i] > 0x7e)) ++i;
            continue;
        }
        out += line[i];
    }
    return out;
}

void pump_lines(int fd, LineQueue& queue, std::stop_token stop) {
    std::array<char, 4096> buffer;
    std::string pending;

    auto flush = [&](std::string& text) {
        auto line = strip_ansi(text);
        text.clear();
        if (line.empty()) return true;
        return queue.push(std::move(line), stop);
    };

    bool open = true;
    while (open && !stop.stop_requested()) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready == 0) continue;
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        for (ssize_t i = 0; i < n && open; ++i) {
            char c = buffer[static_cast<size_t>(i)];
            if (c == '\n' || c == '\r') {
                open = flush(pending);
            } else {
                pending += c;
            }
        }
    }

    if (open && !pending.empty()) flush(pending);
    queue.close();
}

} // namespace driveup
