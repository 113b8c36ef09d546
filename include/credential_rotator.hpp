#pragma once

#include "upload_error.hpp"
#include <atomic>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace driveup {

// One service-account identity: the path to its JSON key material
struct Credential {
    std::filesystem::path key_file;

    std::string name() const { return key_file.filename().string(); }
};

// Round-robin supplier of credentials shared by all upload workers
class CredentialRotator {
public:
    // Fails with ConfigurationError when the list is empty
    static std::expected<CredentialRotator, UploadErrorInfo> create(std::vector<Credential> credentials);

    // Every *.json file directly inside dir, sorted by path
    static std::expected<CredentialRotator, UploadErrorInfo> discover(const std::filesystem::path& dir);

    CredentialRotator(const CredentialRotator&) = delete;
    CredentialRotator& operator=(const CredentialRotator&) = delete;

    CredentialRotator(CredentialRotator&&) noexcept;
    CredentialRotator& operator=(CredentialRotator&&) noexcept;

    // Lock-free; concurrent callers always get distinct call indices
    const Credential& next();

    size_t size() const { return credentials_.size(); }
    const std::vector<Credential>& credentials() const { return credentials_; }

private:
    explicit CredentialRotator(std::vector<Credential> credentials);

    std::vector<Credential> credentials_;
    std::atomic<size_t> cursor_{0};
};

} // namespace driveup
