#include "rclone_config.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

namespace driveup {

TempWorkspace::TempWorkspace(std::filesystem::path path)
    : path_(std::move(path)) {}

TempWorkspace::~TempWorkspace() {
    remove();
}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempWorkspace::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

std::expected<TempWorkspace, UploadErrorInfo> TempWorkspace::create(std::string_view prefix) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("No temporary directory available: {}", ec.message())
        });
    }

    std::string pattern = (base / std::format("{}-XXXXXX", prefix)).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("Failed to create working directory under {}: {}", base.string(), strerror(errno))
        });
    }
    return TempWorkspace(std::filesystem::path(buffer.data()));
}

bool is_team_drive(std::string_view target_id) {
    return target_id.starts_with(kTeamDrivePrefix);
}

std::string render_rclone_config(const Credential& credential, std::string_view target_id) {
    return std::format(
        "[{}]\n"
        "type = drive\n"
        "scope = drive\n"
        "service_account_file = {}\n"
        "{} = {}\n",
        kRemoteName,
        credential.key_file.string(),
        is_team_drive(target_id) ? "team_drive" : "root_folder_id",
        target_id);
}

std::string sha256_hex(std::string_view text) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return {};
    }

    std::string out;
    out.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        out += std::format("{:02x}", hash[i]);
    }
    return out;
}

RcloneConfigStore::RcloneConfigStore(std::filesystem::path directory, std::string target_id)
    : directory_(std::move(directory)), target_id_(std::move(target_id)) {}

std::expected<std::filesystem::path, UploadErrorInfo> RcloneConfigStore::config_for(
    const Credential& credential
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = written_.find(credential.key_file); it != written_.end()) {
        return it->second;
    }

    // The digest keeps two key files with the same stem from sharing a config.
    auto digest = sha256_hex(credential.key_file.string());
    auto file = directory_ / std::format("rclone_{}_{}.conf",
        credential.key_file.stem().string(), digest.substr(0, 8));

    std::ofstream out(file, std::ios::trunc);
    if (!out) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ItemTransferFailed,
            std::format("Failed to create rclone config {}", file.string())
        });
    }
    out << render_rclone_config(credential, target_id_);
    out.close();
    if (!out) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ItemTransferFailed,
            std::format("Failed to write rclone config {}", file.string())
        });
    }

    written_.emplace(credential.key_file, file);
    return file;
}

} // namespace driveup
