#pragma once

#include "upload_error.hpp"
#include "work_enumerator.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driveup {

struct UploadConfig {
    std::filesystem::path input_dir;
    std::string target_id;                    // Drive folder id, or shared drive id ("0A...")
    size_t workers = 4;                       // Concurrent rclone processes
    std::string chunk_size = "8M";            // --drive-chunk-size
    int transfers = 4;                        // --transfers per rclone process
    std::filesystem::path accounts_dir;       // Empty: <exe dir>/accounts, then ./accounts
    std::filesystem::path rclone_path;        // Empty: PATH, then <exe dir>/rclone
    EnumerationMode mode = EnumerationMode::Flat;
    bool live_view = true;                    // Only honoured when stdout is a terminal
    bool verbose = false;
};

// "<digits>" optionally followed by K, M or G
bool valid_chunk_size(std::string_view value);

// DRIVEUP_ACCOUNTS_DIR and DRIVEUP_RCLONE; command-line flags take precedence
void apply_environment(UploadConfig& config);

// args excludes the program name
std::expected<UploadConfig, UploadErrorInfo> parse_arguments(
    const std::vector<std::string>& args,
    UploadConfig base = {}
);

std::string usage(std::string_view program_name);

// Directory holding the running executable, via /proc/self/exe
std::filesystem::path executable_dir();

// First executable named name on PATH
std::optional<std::filesystem::path> search_path(std::string_view name);

// Explicit path, then PATH, then next to the executable
std::expected<std::filesystem::path, UploadErrorInfo> find_rclone(
    const std::filesystem::path& explicit_path,
    const std::filesystem::path& exe_dir
);

std::filesystem::path resolve_accounts_dir(
    const std::filesystem::path& explicit_dir,
    const std::filesystem::path& exe_dir
);

// Exit status of body; an escaping exception is reported as
// "Critical error: <what>" on stderr and becomes exit status 1.
int run_guarded(const std::function<int()>& body);

} // namespace driveup
