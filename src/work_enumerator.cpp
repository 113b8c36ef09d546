#include "work_enumerator.hpp"
#include <algorithm>
#include <format>

namespace driveup {

namespace {

UploadErrorInfo walk_error(const std::filesystem::path& path, const std::error_code& ec) {
    return UploadErrorInfo{
        UploadError::EnumerationError,
        std::format("Failed to read {}: {}", path.string(), ec.message())
    };
}

UploadErrorInfo walk_interrupted() {
    return UploadErrorInfo{UploadError::Interrupted, "Upload canceled by user"};
}

} // namespace

std::expected<uint64_t, UploadErrorInfo> directory_size(
    const std::filesystem::path& dir,
    std::stop_token stop
) {
    std::error_code ec;
    uint64_t total = 0;
    std::filesystem::recursive_directory_iterator it(dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (stop.stop_requested()) return std::unexpected(walk_interrupted());
        auto link_status = it->symlink_status(ec);
        if (ec) break;
        if (std::filesystem::is_directory(link_status)) continue;

        auto target = link_status;
        if (std::filesystem::is_symlink(link_status)) {
            target = std::filesystem::status(it->path(), ec);
            if (ec) {
                ec.clear();  // Dangling link
                continue;
            }
        }
        if (!std::filesystem::is_regular_file(target)) continue;

        auto size = it->file_size(ec);
        if (ec) break;
        total += size;
    }
    if (ec) return std::unexpected(walk_error(dir, ec));
    return total;
}

std::expected<Enumeration, UploadErrorInfo> enumerate(
    const std::filesystem::path& root,
    EnumerationMode mode,
    std::stop_token stop
) {
    std::error_code ec;
    auto abs_root = std::filesystem::absolute(root, ec).lexically_normal();
    if (ec) return std::unexpected(walk_error(root, ec));
    if (!abs_root.has_filename() && abs_root.has_relative_path()) abs_root = abs_root.parent_path();

    if (!std::filesystem::exists(abs_root, ec)) {
        return std::unexpected(UploadErrorInfo{
            UploadError::EnumerationError,
            std::format("Input directory {} does not exist", root.string())
        });
    }
    if (!std::filesystem::is_directory(abs_root, ec)) {
        return std::unexpected(UploadErrorInfo{
            UploadError::EnumerationError,
            std::format("Input path {} is not a directory", root.string())
        });
    }

    Enumeration result;
    std::vector<std::filesystem::path> directories;

    std::filesystem::recursive_directory_iterator it(abs_root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (stop.stop_requested()) return std::unexpected(walk_interrupted());
        const auto& entry = *it;
        auto link_status = entry.symlink_status(ec);
        if (ec) break;

        if (std::filesystem::is_symlink(link_status)) {
            // Links to files are uploaded as files; directory links are not followed
            auto target = std::filesystem::status(entry.path(), ec);
            if (ec) {
                ec.clear();  // Dangling link
                continue;
            }
            if (!std::filesystem::is_regular_file(target)) continue;
        } else if (std::filesystem::is_directory(link_status)) {
            if (mode == EnumerationMode::Structured) directories.push_back(entry.path());
            continue;
        } else if (!std::filesystem::is_regular_file(link_status)) {
            continue;
        }

        WorkItem item;
        item.kind = ItemKind::File;
        item.source_path = entry.path();
        item.relative_path = entry.path().lexically_relative(abs_root).generic_string();
        item.size_bytes = entry.file_size(ec);
        if (ec) break;
        result.items.push_back(std::move(item));
    }
    if (ec) return std::unexpected(walk_error(abs_root, ec));

    // Each directory is sized by its own walk
    for (const auto& dir : directories) {
        auto size = directory_size(dir, stop);
        if (!size) return std::unexpected(size.error());

        WorkItem item;
        item.kind = ItemKind::Directory;
        item.source_path = dir;
        item.relative_path = dir.lexically_relative(abs_root).generic_string();
        item.size_bytes = *size;
        result.items.push_back(std::move(item));
    }

    if (stop.stop_requested()) return std::unexpected(walk_interrupted());

    std::sort(result.items.begin(), result.items.end(), [](const WorkItem& a, const WorkItem& b) {
        return a.relative_path < b.relative_path;
    });

    for (const auto& item : result.items) {
        result.total_size += item.size_bytes;
    }
    return result;
}

} // namespace driveup
