#include "upload_config.hpp"
#include "compact_log.hpp"
#include <unistd.h>
#include <charconv>
#include <cstdlib>
#include <format>
#include <regex>

namespace driveup {

namespace {

UploadErrorInfo usage_error(std::string message) {
    return UploadErrorInfo{UploadError::UsageError, std::move(message)};
}

std::optional<long> parse_positive(std::string_view text) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 1) return std::nullopt;
    return value;
}

bool is_executable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

bool valid_chunk_size(std::string_view value) {
    static const std::regex re(R"(\d+[KMG]?)");
    return std::regex_match(value.begin(), value.end(), re);
}

void apply_environment(UploadConfig& config) {
    if (const char* dir = std::getenv("DRIVEUP_ACCOUNTS_DIR"); dir && *dir) {
        config.accounts_dir = dir;
    }
    if (const char* tool = std::getenv("DRIVEUP_RCLONE"); tool && *tool) {
        config.rclone_path = tool;
    }
}

std::expected<UploadConfig, UploadErrorInfo> parse_arguments(
    const std::vector<std::string>& args,
    UploadConfig base
) {
    UploadConfig config = std::move(base);
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        if (a == "--workers" || a == "--transfers") {
            auto v = value();
            if (!v) return std::unexpected(usage_error(std::format("{} requires a value", a)));
            auto n = parse_positive(*v);
            if (!n) return std::unexpected(usage_error(std::format("{} must be a positive integer, got '{}'", a, *v)));
            if (a == "--workers") config.workers = static_cast<size_t>(*n);
            else config.transfers = static_cast<int>(*n);
        } else if (a == "--chunk-size") {
            auto v = value();
            if (!v) return std::unexpected(usage_error("--chunk-size requires a value"));
            if (!valid_chunk_size(*v)) {
                return std::unexpected(usage_error(std::format("Invalid chunk size '{}' (expected e.g. 8M)", *v)));
            }
            config.chunk_size = *v;
        } else if (a == "--accounts-dir") {
            auto v = value();
            if (!v) return std::unexpected(usage_error("--accounts-dir requires a value"));
            config.accounts_dir = *v;
        } else if (a == "--rclone") {
            auto v = value();
            if (!v) return std::unexpected(usage_error("--rclone requires a value"));
            config.rclone_path = *v;
        } else if (a == "--structured") {
            config.mode = EnumerationMode::Structured;
        } else if (a == "--no-live") {
            config.live_view = false;
        } else if (a == "--verbose") {
            config.verbose = true;
        } else if (a.starts_with("--")) {
            return std::unexpected(usage_error(std::format("Unknown option: {}", a)));
        } else {
            positional.push_back(a);
        }
    }

    if (positional.size() != 2) {
        return std::unexpected(usage_error("Expected <input-dir> and <output-target-id>"));
    }
    config.input_dir = positional[0];
    config.target_id = positional[1];
    if (config.target_id.empty()) {
        return std::unexpected(usage_error("Output target id must not be empty"));
    }
    return config;
}

std::string usage(std::string_view program_name) {
    return std::format(
        "Parallel Google Drive uploader (rclone, rotating service accounts)\n\n"
        "Usage: {} <input-dir> <output-target-id> [options]\n\n"
        "Options:\n"
        "  --workers N          Parallel uploads (default 4)\n"
        "  --chunk-size SIZE    Upload chunk size, e.g. 8M (default 8M)\n"
        "  --transfers N        rclone --transfers per upload (default 4)\n"
        "  --accounts-dir DIR   Service account JSON directory\n"
        "  --rclone PATH        rclone executable\n"
        "  --structured         Also upload each directory as one item\n"
        "  --no-live            Log progress lines instead of a live view\n"
        "  --verbose            Trace every transfer\n\n"
        "Environment: DRIVEUP_ACCOUNTS_DIR, DRIVEUP_RCLONE\n",
        program_name);
}

std::filesystem::path executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path(ec);
    return exe.parent_path();
}

std::optional<std::filesystem::path> search_path(std::string_view name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string_view dirs(path_env);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / name;
            if (is_executable(candidate)) return candidate;
        }
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

std::expected<std::filesystem::path, UploadErrorInfo> find_rclone(
    const std::filesystem::path& explicit_path,
    const std::filesystem::path& exe_dir
) {
    if (!explicit_path.empty()) {
        // A bare name is looked up on PATH, anything with a separator is taken as given
        if (!explicit_path.has_parent_path()) {
            if (auto found = search_path(explicit_path.string())) return *found;
        } else if (is_executable(explicit_path)) {
            return std::filesystem::absolute(explicit_path);
        }
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("rclone executable {} not found or not executable", explicit_path.string())
        });
    }

    if (auto found = search_path("rclone")) return *found;

    auto local = exe_dir / "rclone";
    if (is_executable(local)) return local;

    return std::unexpected(UploadErrorInfo{
        UploadError::ConfigurationError,
        "rclone executable not found. Please install rclone from https://rclone.org/downloads/"
    });
}

std::filesystem::path resolve_accounts_dir(
    const std::filesystem::path& explicit_dir,
    const std::filesystem::path& exe_dir
) {
    if (!explicit_dir.empty()) return explicit_dir;

    std::error_code ec;
    auto beside_exe = exe_dir / "accounts";
    if (std::filesystem::is_directory(beside_exe, ec)) return beside_exe;
    return std::filesystem::current_path(ec) / "accounts";
}

int run_guarded(const std::function<int()>& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        Console::fail(std::format("\nCritical error: {}", e.what()));
        return 1;
    }
}

} // namespace driveup
