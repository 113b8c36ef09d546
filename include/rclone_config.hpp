#pragma once

#include "credential_rotator.hpp"
#include "upload_error.hpp"
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace driveup {

// Remote name every generated config declares
inline constexpr std::string_view kRemoteName = "gdrive";

// Shared drive ids carry this prefix; anything else is a folder id
inline constexpr std::string_view kTeamDrivePrefix = "0A";

// Ephemeral per-run directory, removed with everything in it on destruction
class TempWorkspace {
public:
    static std::expected<TempWorkspace, UploadErrorInfo> create(std::string_view prefix = "driveup");

    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    TempWorkspace(TempWorkspace&&) noexcept;
    TempWorkspace& operator=(TempWorkspace&&) noexcept;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit TempWorkspace(std::filesystem::path path);
    void remove();

    std::filesystem::path path_;
};

bool is_team_drive(std::string_view target_id);

// Contents of the rclone config binding a credential to the destination
std::string render_rclone_config(const Credential& credential, std::string_view target_id);

// Hex SHA-256 of arbitrary text
std::string sha256_hex(std::string_view text);

// One config file per credential per run, written on first use and reused after
class RcloneConfigStore {
public:
    RcloneConfigStore(std::filesystem::path directory, std::string target_id);

    std::expected<std::filesystem::path, UploadErrorInfo> config_for(const Credential& credential);

    const std::string& target_id() const { return target_id_; }

private:
    std::filesystem::path directory_;
    std::string target_id_;
    std::mutex mutex_;
    std::map<std::filesystem::path, std::filesystem::path> written_;
};

} // namespace driveup
