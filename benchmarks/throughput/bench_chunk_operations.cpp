/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting and checksum operations
 */

#include <benchmark/benchmark.h>

#include <kcenon/upload_orchestrator/core/checksum.h>
#include <kcenon/upload_orchestrator/core/chunk_splitter.h>
#include <kcenon/upload_orchestrator/core/file_source.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>

namespace kcenon::upload_orchestrator::benchmark {

namespace {

auto plan_for(uint64_t file_size, std::size_t chunk_size) -> chunk_plan {
    chunk_plan plan;
    plan.upload_id = "bench-upload";
    plan.chunk_size = chunk_size;
    plan.total_chunks = chunk_config::calculate_chunk_count(file_size, chunk_size);
    return plan;
}

void read_all_chunks(::benchmark::State& state, const file_ref& file, std::size_t chunk_size) {
    auto splitter = chunk_splitter::create(file, plan_for(file.size, chunk_size), chunk_size);
    if (!splitter) {
        state.SkipWithError("Failed to create splitter");
        return;
    }

    for (auto _ : state) {
        for (uint64_t i = 0; i < splitter.value().total_chunks(); ++i) {
            auto part = splitter.value().read_chunk(i);
            if (!part) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(part.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file.size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(splitter.value().total_chunks()) *
                           static_cast<int64_t>(state.iterations()));
}

}  // namespace

/**
 * @brief Reading every chunk of an in-memory file
 */
static void BM_ChunkSplitter_Memory(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto file = file_ref::from_memory(
        "memory.bin", test_data_generator::generate_random_data(file_size, 42));
    read_all_chunks(state, file, chunk_size);
}

/**
 * @brief Reading every chunk of a file on disk
 */
static void BM_ChunkSplitter_LocalFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("split_test.bin", file_size, 42);

    auto file = file_ref::from_path(path);
    if (!file) {
        state.SkipWithError("Failed to open test file");
        return;
    }
    read_all_chunks(state, file.value(), chunk_size);
}

/**
 * @brief Benchmark for CRC32 calculation
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(data_size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkSplitter_Memory)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkSplitter_LocalFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_CRC32)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(5 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::upload_orchestrator::benchmark
