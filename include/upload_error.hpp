#pragma once

#include <string>
#include <string_view>

namespace driveup {

enum class UploadError {
    ConfigurationError,   // No transfer tool or no credentials
    EnumerationError,     // Source root missing or unreadable
    ItemTransferFailed,   // Non-zero exit or launch/read failure for one item
    Interrupted,          // User cancellation
    UsageError            // Bad command line
};

struct UploadErrorInfo {
    UploadError error;
    std::string message;
    int exit_code = -1;  // Transfer tool exit status when it ran to completion
};

constexpr std::string_view to_string(UploadError error) {
    switch (error) {
        case UploadError::ConfigurationError: return "configuration error";
        case UploadError::EnumerationError: return "enumeration error";
        case UploadError::ItemTransferFailed: return "transfer failed";
        case UploadError::Interrupted: return "interrupted";
        case UploadError::UsageError: return "usage error";
    }
    return "unknown error";
}

} // namespace driveup
