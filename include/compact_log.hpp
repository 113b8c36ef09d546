#pragma once

#include <unistd.h>
#include <cerrno>
#include <string>
#include <string_view>
#include <charconv>
#include <system_error>
#include <mutex>

namespace driveup {

// Lightweight fd-level writer shared by the presenter and the CLI.
// One mutex serializes every write so frames and log lines never interleave.
class Console {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    template<typename T>
    static void print_num(T val) {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
        if (ec == std::errc()) {
            print(std::string_view(buf, static_cast<size_t>(ptr - buf)));
        }
    }

    static void nl() { print("\n"); }

    // Coloured single-line helpers; colour only when the stream is a terminal
    static void info(std::string_view s) { print(colored(STDOUT_FILENO, "\033[36m", s)); }
    static void success(std::string_view s) { print(colored(STDOUT_FILENO, "\033[32m", s)); }
    static void warning(std::string_view s) { print(colored(STDOUT_FILENO, "\033[33m", s)); }
    static void fail(std::string_view s) { error(colored(STDERR_FILENO, "\033[31m", s)); }

    static bool is_terminal(int fd = STDOUT_FILENO) { return ::isatty(fd) == 1; }

private:
    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }

    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                return;
            }
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::string colored(int fd, std::string_view code, std::string_view s) {
        std::string out;
        if (is_terminal(fd)) {
            out.reserve(s.size() + 10);
            out += code;
            out += s;
            out += "\033[0m\n";
        } else {
            out.reserve(s.size() + 1);
            out += s;
            out += '\n';
        }
        return out;
    }
};

} // namespace driveup
