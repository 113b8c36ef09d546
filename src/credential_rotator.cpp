#include "credential_rotator.hpp"
#include <algorithm>
#include <format>

namespace driveup {

CredentialRotator::CredentialRotator(std::vector<Credential> credentials)
    : credentials_(std::move(credentials)) {}

CredentialRotator::CredentialRotator(CredentialRotator&& other) noexcept
    : credentials_(std::move(other.credentials_)),
      cursor_(other.cursor_.load()) {}

CredentialRotator& CredentialRotator::operator=(CredentialRotator&& other) noexcept {
    if (this != &other) {
        credentials_ = std::move(other.credentials_);
        cursor_ = other.cursor_.load();
    }
    return *this;
}

std::expected<CredentialRotator, UploadErrorInfo> CredentialRotator::create(
    std::vector<Credential> credentials
) {
    if (credentials.empty()) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            "No service account credentials available"
        });
    }
    return CredentialRotator(std::move(credentials));
}

std::expected<CredentialRotator, UploadErrorInfo> CredentialRotator::discover(
    const std::filesystem::path& dir
) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("Accounts directory {} does not exist", dir.string())
        });
    }

    std::vector<Credential> found;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            found.push_back(Credential{std::filesystem::absolute(it->path())});
        }
    }
    if (ec) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("Failed to read accounts directory {}: {}", dir.string(), ec.message())
        });
    }

    if (found.empty()) {
        return std::unexpected(UploadErrorInfo{
            UploadError::ConfigurationError,
            std::format("No service account JSON files found in {}", dir.string())
        });
    }

    std::sort(found.begin(), found.end(), [](const Credential& a, const Credential& b) {
        return a.key_file < b.key_file;
    });
    return create(std::move(found));
}

const Credential& CredentialRotator::next() {
    // fetch_add hands every caller a unique ticket; the modulo maps it onto the ring.
    size_t ticket = cursor_.fetch_add(1, std::memory_order_relaxed);
    return credentials_[ticket % credentials_.size()];
}

} // namespace driveup
