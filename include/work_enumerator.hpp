#pragma once

#include "upload_error.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace driveup {

enum class ItemKind {
    File,
    Directory
};

// One schedulable unit of transfer; immutable once enumerated
struct WorkItem {
    ItemKind kind = ItemKind::File;
    std::filesystem::path source_path;  // Absolute path on disk
    std::string relative_path;          // Generic-form path below the root, unique per run
    uint64_t size_bytes = 0;
};

enum class EnumerationMode {
    Flat,       // Regular files only
    Structured  // Files plus one item per directory
};

struct Enumeration {
    std::vector<WorkItem> items;
    uint64_t total_size = 0;
};

// Walk root once and produce the ordered item list.
// Nothing is returned on failure; a partially walked tree is an error.
// A stop request abandons the walk with Interrupted.
std::expected<Enumeration, UploadErrorInfo> enumerate(
    const std::filesystem::path& root,
    EnumerationMode mode = EnumerationMode::Flat,
    std::stop_token stop = {}
);

// Recursive sum of regular-file sizes below dir
std::expected<uint64_t, UploadErrorInfo> directory_size(
    const std::filesystem::path& dir,
    std::stop_token stop = {}
);

} // namespace driveup
