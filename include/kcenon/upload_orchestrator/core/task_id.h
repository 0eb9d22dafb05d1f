/**
 * @file task_id.h
 * @brief Unique identifiers for upload tasks
 *
 * Every file in an upload session gets a task id when the session starts.
 * Ids are random (RFC 4122 version 4) so they remain unique across sessions
 * and across orchestrator instances.
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_TASK_ID_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_TASK_ID_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::upload_orchestrator {

/**
 * @brief Unique identifier for an upload task (16-byte UUID)
 */
struct task_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr task_id() noexcept = default;

    explicit constexpr task_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random task ID
     */
    [[nodiscard]] static auto generate() -> task_id;

    /**
     * @brief Convert to canonical 8-4-4-4-12 string form
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from UUID string (dashes optional)
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<task_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const task_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const task_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::upload_orchestrator

template <>
struct std::hash<kcenon::upload_orchestrator::task_id> {
    auto operator()(const kcenon::upload_orchestrator::task_id& id) const noexcept
        -> std::size_t {
        std::size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 31 + b;
        }
        return h;
    }
};

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_TASK_ID_H
