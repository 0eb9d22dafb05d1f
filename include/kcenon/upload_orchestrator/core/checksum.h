/**
 * @file checksum.h
 * @brief CRC32 utilities for chunk integrity
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_CHECKSUM_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace kcenon::upload_orchestrator {

/**
 * @brief Checksum utilities
 *
 * Each chunk sent to the server carries the CRC32 (IEEE 802.3) of its
 * payload so the receiving side can reject corrupted parts.
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a running CRC32 over another block of data
     * @param crc Value returned by a previous call (or 0 to start)
     * @param data Next block
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_CHECKSUM_H
