/**
 * @file session_types.cpp
 * @brief Snapshot helper implementations
 */

#include <kcenon/upload_orchestrator/core/session_types.h>

#include <algorithm>
#include <array>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace kcenon::upload_orchestrator {

auto transfer_session::completion_percentage() const -> double {
    if (total == 0) return 0.0;
    return static_cast<double>(completed + failed) / static_cast<double>(total) * 100.0;
}

auto transfer_session::byte_percentage() const -> double {
    if (total_bytes == 0) return 0.0;
    return static_cast<double>(uploaded_bytes) / static_cast<double>(total_bytes) * 100.0;
}

auto transfer_session::failed_tasks() const -> std::vector<file_task> {
    std::vector<file_task> out;
    std::copy_if(files.begin(), files.end(), std::back_inserter(out),
                 [](const file_task& t) { return t.status == task_status::failed; });
    return out;
}

auto transfer_session::find(std::string_view task_id) const -> const file_task* {
    auto it = std::find_if(files.begin(), files.end(),
                           [&](const file_task& t) { return t.id == task_id; });
    return it != files.end() ? &*it : nullptr;
}

auto transfer_session::count(task_status s) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        files.begin(), files.end(), [s](const file_task& t) { return t.status == s; }));
}

auto transfer_session::summary() const -> std::string {
    std::ostringstream oss;
    switch (status) {
        case session_status::uploading:
            oss << "Uploading " << (completed + failed) << "/" << total << "...";
            break;
        case session_status::paused:
            oss << "Paused - " << completed << " completed, " << remaining() << " remaining";
            break;
        case session_status::cancelling:
            oss << "Cancelling...";
            break;
        case session_status::complete:
            if (failed > 0 && cancelled > 0) {
                oss << "Done: " << completed << " uploaded, " << failed << " failed, "
                    << cancelled << " cancelled";
            } else if (failed > 0) {
                oss << "Done: " << completed << " uploaded, " << failed << " failed";
            } else if (cancelled > 0) {
                oss << "Cancelled - " << completed << " uploaded before cancellation";
            } else {
                oss << "All " << completed << " files uploaded successfully";
            }
            break;
        case session_status::idle:
        default:
            break;
    }
    return oss.str();
}

auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    if (bytes == 0) return "0 B";

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

}  // namespace kcenon::upload_orchestrator
