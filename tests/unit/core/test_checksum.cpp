/**
 * @file test_checksum.cpp
 * @brief Unit tests for chunk checksums
 */

#include <gtest/gtest.h>

#include <kcenon/upload_orchestrator/core/checksum.h>

#include <cstring>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator::test {

class ChecksumTest : public ::testing::Test {
protected:
    static auto to_bytes(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValues) {
    // "123456789" -> 0xCBF43926
    EXPECT_EQ(checksum::crc32(to_bytes("123456789")), 0xCBF43926u);

    // "The quick brown fox jumps over the lazy dog" -> 0x414FA339
    EXPECT_EQ(checksum::crc32(to_bytes("The quick brown fox jumps over the lazy dog")),
              0x414FA339u);
}

TEST_F(ChecksumTest, CRC32_SingleByte) {
    std::vector<std::byte> data = {std::byte{0x00}};
    auto crc1 = checksum::crc32(data);

    data[0] = std::byte{0xFF};
    auto crc2 = checksum::crc32(data);

    EXPECT_NE(crc1, crc2);
}

TEST_F(ChecksumTest, CRC32_IncrementalMatchesOneShot) {
    auto data = to_bytes("chunked uploads are verified chunk by chunk");
    std::span<const std::byte> all(data);

    auto crc = checksum::crc32_update(0, all.first(10));
    crc = checksum::crc32_update(crc, all.subspan(10));

    EXPECT_EQ(crc, checksum::crc32(all));
}

TEST_F(ChecksumTest, CRC32_LargeData) {
    std::vector<std::byte> data(1024 * 1024);
    std::mt19937 gen(7);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    auto crc = checksum::crc32(data);
    EXPECT_EQ(crc, checksum::crc32(data));
}

TEST_F(ChecksumTest, VerifyCRC32_Valid) {
    auto data = to_bytes("123456789");
    EXPECT_TRUE(checksum::verify_crc32(data, 0xCBF43926u));
}

TEST_F(ChecksumTest, VerifyCRC32_Invalid) {
    auto data = to_bytes("123456789");
    EXPECT_FALSE(checksum::verify_crc32(data, 0xDEADBEEFu));
}

TEST_F(ChecksumTest, CRC32_CorruptedDataDetection) {
    auto data = to_bytes("Original chunk payload");
    auto original = checksum::crc32(data);

    data[5] = static_cast<std::byte>(static_cast<uint8_t>(data[5]) ^ 0x01);

    EXPECT_FALSE(checksum::verify_crc32(data, original));
}

}  // namespace kcenon::upload_orchestrator::test
