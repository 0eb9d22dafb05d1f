/**
 * @file test_chunk_splitter.cpp
 * @brief Unit tests for chunk_splitter
 */

#include <gtest/gtest.h>

#include <kcenon/upload_orchestrator/core/checksum.h>
#include <kcenon/upload_orchestrator/core/chunk_splitter.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace kcenon::upload_orchestrator::test {

class ChunkSplitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "upload_orch_test_splitter";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static auto make_data(std::size_t size) -> std::vector<std::byte> {
        std::vector<std::byte> data(size);
        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto plan_for(uint64_t size, std::size_t chunk_size) -> chunk_plan {
        chunk_plan plan;
        plan.upload_id = "upload-1";
        plan.chunk_size = chunk_size;
        plan.total_chunks = std::max<uint64_t>(1, (size + chunk_size - 1) / chunk_size);
        return plan;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChunkSplitterTest, ChunkCountCalculation) {
    EXPECT_EQ(chunk_config::calculate_chunk_count(0, 1024), 0u);
    EXPECT_EQ(chunk_config::calculate_chunk_count(1, 1024), 1u);
    EXPECT_EQ(chunk_config::calculate_chunk_count(1024, 1024), 1u);
    EXPECT_EQ(chunk_config::calculate_chunk_count(1025, 1024), 2u);

    // 120 MiB in 5 MiB chunks
    chunk_config config;
    EXPECT_EQ(config.calculate_chunk_count(120ULL * 1024 * 1024), 24u);
}

TEST_F(ChunkSplitterTest, ChunkConfigValidation) {
    chunk_config config;
    EXPECT_TRUE(config.validate());

    config.chunk_size = 1024;
    EXPECT_FALSE(config.validate());

    config.chunk_size = chunk_config::max_chunk_size + 1;
    EXPECT_FALSE(config.validate());

    config.chunk_size = chunk_config::default_chunk_size;
    config.max_concurrent_chunks = 0;
    auto r = config.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkSplitterTest, RangesCoverFileExactly) {
    constexpr std::size_t chunk_size = 1000;
    auto file = file_ref::from_memory("report.pdf", make_data(4500));

    auto splitter = chunk_splitter::create(file, plan_for(file.size, chunk_size), 0);
    ASSERT_TRUE(splitter);
    ASSERT_EQ(splitter.value().total_chunks(), 5u);

    uint64_t expected_offset = 0;
    for (uint64_t i = 0; i < splitter.value().total_chunks(); ++i) {
        auto r = splitter.value().range(i);
        ASSERT_TRUE(r);
        EXPECT_EQ(r.value().index, i);
        EXPECT_EQ(r.value().offset, i * chunk_size);
        EXPECT_EQ(r.value().offset, expected_offset);
        expected_offset = r.value().end();
    }
    EXPECT_EQ(expected_offset, file.size);

    // Last chunk is the remainder
    EXPECT_EQ(splitter.value().range(4).value().length, 500u);
}

TEST_F(ChunkSplitterTest, RangeOutOfBounds) {
    auto file = file_ref::from_memory("a.bin", make_data(100));
    auto splitter = chunk_splitter::create(file, plan_for(100, 64), 0);
    ASSERT_TRUE(splitter);

    auto r = splitter.value().range(2);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_chunk_plan);
}

TEST_F(ChunkSplitterTest, ChunkDataAndChecksum) {
    auto data = make_data(2500);
    auto file = file_ref::from_memory("data.bin", data);

    auto splitter = chunk_splitter::create(file, plan_for(data.size(), 1024), 0);
    ASSERT_TRUE(splitter);

    std::vector<std::byte> reassembled;
    for (uint64_t i = 0; i < splitter.value().total_chunks(); ++i) {
        auto c = splitter.value().read_chunk(i);
        ASSERT_TRUE(c);
        EXPECT_EQ(c.value().upload_id, "upload-1");
        EXPECT_EQ(c.value().index, i);
        EXPECT_EQ(c.value().total_chunks, 3u);
        EXPECT_EQ(c.value().is_last(), i == 2);
        EXPECT_TRUE(checksum::verify_crc32(c.value().data, c.value().checksum));
        reassembled.insert(reassembled.end(), c.value().data.begin(), c.value().data.end());
    }

    EXPECT_TRUE(reassembled == data);
}

TEST_F(ChunkSplitterTest, ReadsFromLocalFile) {
    auto data = make_data(3000);
    auto path = create_test_file("local.bin", data);

    auto file = file_ref::from_path(path);
    ASSERT_TRUE(file);

    auto splitter = chunk_splitter::create(file.value(), plan_for(3000, 1024), 0);
    ASSERT_TRUE(splitter);

    auto last = splitter.value().read_chunk(2);
    ASSERT_TRUE(last);
    ASSERT_EQ(last.value().data.size(), 3000u - 2048u);
    EXPECT_EQ(std::memcmp(last.value().data.data(), data.data() + 2048, last.value().data.size()),
              0);
}

TEST_F(ChunkSplitterTest, FallbackChunkSizeWhenPlanHasNone) {
    auto file = file_ref::from_memory("x.bin", make_data(10 * 1024));

    chunk_plan plan;
    plan.upload_id = "u";
    plan.chunk_size = 0;
    plan.total_chunks = 3;

    auto splitter = chunk_splitter::create(file, plan, 4096);
    ASSERT_TRUE(splitter);
    EXPECT_EQ(splitter.value().chunk_size(), 4096u);
    EXPECT_EQ(splitter.value().range(2).value().length, 2048u);
}

TEST_F(ChunkSplitterTest, RejectsInconsistentPlan) {
    auto file = file_ref::from_memory("x.bin", make_data(5000));

    auto plan = plan_for(5000, 1000);
    plan.total_chunks = 4;
    auto r = chunk_splitter::create(file, plan, 0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_chunk_plan);

    plan = plan_for(5000, 1000);
    plan.upload_id.clear();
    EXPECT_FALSE(chunk_splitter::create(file, plan, 0));

    plan = plan_for(5000, 1000);
    plan.chunk_size = 0;
    EXPECT_FALSE(chunk_splitter::create(file, plan, 0));
}

TEST_F(ChunkSplitterTest, RejectsFileWithoutSource) {
    file_ref file;
    file.name = "ghost.bin";
    file.size = 100;

    auto r = chunk_splitter::create(file, plan_for(100, 64), 0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::validation_failed);
}

TEST_F(ChunkSplitterTest, EmptyFileIsOneEmptyChunk) {
    auto file = file_ref::from_memory("empty.txt", {});

    chunk_plan plan;
    plan.upload_id = "u";
    plan.chunk_size = 1024;
    plan.total_chunks = 1;

    auto splitter = chunk_splitter::create(file, plan, 0);
    ASSERT_TRUE(splitter);

    auto c = splitter.value().read_chunk(0);
    ASSERT_TRUE(c);
    EXPECT_TRUE(c.value().data.empty());
    EXPECT_TRUE(c.value().is_last());
}

}  // namespace kcenon::upload_orchestrator::test
