#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace driveup {

// Signals found on a single line of rclone --progress output.
// Any of them may be missing; progress text arrives incrementally across lines.
struct ProgressSignals {
    std::optional<int> percent;
    std::optional<std::string> speed;   // e.g. "1.234 MiB/s", "512 Bytes/s"
    std::optional<std::string> eta;     // e.g. "7s", "1h2m3s", "0:00:07"

    bool empty() const { return !percent && !speed && !eta; }
};

ProgressSignals parse_progress_line(std::string_view line);

// Last-known values carried between lines by a single transfer
struct ProgressState {
    int percent = 0;
    std::string speed;
    std::string eta;

    // Overwrite each field the line carried; returns false when nothing was found
    bool merge(const ProgressSignals& signals);
};

} // namespace driveup
