/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_UPLOAD_ORCHESTRATOR_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/upload_orchestrator/client/upload_backend.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Build @p count in-memory files of @p size bytes each
     */
    static auto generate_files(std::size_t count, std::size_t size, uint32_t seed = 0)
        -> std::vector<file_ref>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Backend that accepts every request immediately
 *
 * Measures orchestration overhead without any network cost. Bulk jobs
 * report completion on their first poll.
 */
class instant_backend : public upload_backend {
public:
    auto upload_single(const file_ref& file,
                       const std::string& category,
                       const cancellation_token& token) -> result<file_record> override;

    auto init_chunked(const chunked_upload_request& request,
                      const cancellation_token& token) -> result<chunk_plan> override;

    auto upload_chunk(const chunk& part, const cancellation_token& token)
        -> result<void> override;

    auto complete_chunked(const std::string& upload_id, const cancellation_token& token)
        -> result<file_record> override;

    auto start_bulk_job(const std::vector<file_ref>& files, const std::string& category)
        -> result<std::string> override;

    auto poll_bulk_job(const std::string& job_id) -> result<job_status> override;

    auto cancel_bulk_job(const std::string& job_id) -> result<void> override;

    [[nodiscard]] auto bytes_received() const -> uint64_t { return bytes_received_.load(); }

private:
    std::atomic<uint64_t> next_id_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::mutex jobs_mutex_;
    std::map<std::string, std::size_t> jobs_;
};

/**
 * @brief Format throughput as human-readable string
 * @param bytes_per_second Throughput in bytes per second
 * @return Formatted string (e.g., "500 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
constexpr std::size_t large_file = 100 * MB;    // 100 MB

// Chunk sizes for testing
constexpr std::size_t min_chunk = 64 * KB;      // 64 KB
constexpr std::size_t default_chunk = 5 * MB;   // 5 MB
constexpr std::size_t max_chunk = 16 * MB;      // 16 MB
}  // namespace sizes

}  // namespace kcenon::upload_orchestrator::benchmark

#endif  // KCENON_UPLOAD_ORCHESTRATOR_BENCHMARKS_BENCHMARK_HELPERS_H
