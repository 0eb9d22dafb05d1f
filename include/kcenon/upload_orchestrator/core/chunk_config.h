/**
 * @file chunk_config.h
 * @brief Configuration and data types for chunked uploads
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_CONFIG_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_CONFIG_H

#include <kcenon/upload_orchestrator/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Configuration for chunk operations
 */
struct chunk_config {
    /// Default chunk size (5MB)
    static constexpr std::size_t default_chunk_size = 5 * 1024 * 1024;

    /// Minimum allowed chunk size (64KB)
    static constexpr std::size_t min_chunk_size = 64 * 1024;

    /// Maximum allowed chunk size (512MB)
    static constexpr std::size_t max_chunk_size = 512 * 1024 * 1024;

    /// Default number of chunk requests in flight per file
    static constexpr std::size_t default_max_concurrent_chunks = 3;

    /// Chunk size used when the server does not dictate one
    std::size_t chunk_size = default_chunk_size;

    /// Upper bound on simultaneous chunk requests for one file
    std::size_t max_concurrent_chunks = default_max_concurrent_chunks;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_concurrent_chunks == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max concurrent chunks must be at least 1"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        return calculate_chunk_count(file_size, chunk_size);
    }

    [[nodiscard]] static auto calculate_chunk_count(uint64_t file_size, uint64_t size)
        -> uint64_t {
        if (file_size == 0 || size == 0) return 0;
        return (file_size + size - 1) / size;
    }
};

/**
 * @brief Server-issued plan for one chunked upload
 */
struct chunk_plan {
    std::string upload_id;
    std::size_t chunk_size = 0;  ///< 0 means "use the configured size"
    uint64_t total_chunks = 0;
};

/**
 * @brief Byte range covered by one chunk
 */
struct chunk_range {
    uint64_t index = 0;
    uint64_t offset = 0;
    std::size_t length = 0;

    [[nodiscard]] auto end() const -> uint64_t { return offset + length; }
};

/**
 * @brief One chunk ready to be sent
 */
struct chunk {
    std::string upload_id;
    uint64_t index = 0;
    uint64_t total_chunks = 0;
    uint64_t offset = 0;
    uint32_t checksum = 0;
    std::vector<std::byte> data;

    [[nodiscard]] auto is_last() const -> bool { return index + 1 == total_chunks; }
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_CONFIG_H
