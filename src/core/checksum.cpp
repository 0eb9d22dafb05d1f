/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/upload_orchestrator/core/checksum.h>

#include <array>

namespace kcenon::upload_orchestrator {

namespace {

// CRC32 polynomial (IEEE 802.3, reflected)
constexpr uint32_t crc32_polynomial = 0xEDB88320;

constexpr auto make_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ crc32_polynomial : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto crc32_table = make_crc32_table();

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    crc = ~crc;
    for (std::byte b : data) {
        crc = crc32_table[static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b))] ^ (crc >> 8);
    }
    return ~crc;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

}  // namespace kcenon::upload_orchestrator
