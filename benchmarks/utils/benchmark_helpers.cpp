/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::upload_orchestrator::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_files(std::size_t count, std::size_t size, uint32_t seed)
    -> std::vector<file_ref> {
    std::vector<file_ref> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        files.push_back(file_ref::from_memory(
            "bench_" + std::to_string(i) + ".bin",
            generate_random_data(size, seed == 0 ? 0 : seed + static_cast<uint32_t>(i))));
    }
    return files;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "upload_orchestrator_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// instant_backend implementation

auto instant_backend::upload_single(const file_ref& file,
                                    const std::string& category,
                                    const cancellation_token&) -> result<file_record> {
    bytes_received_ += file.size;
    return file_record{"rec-" + std::to_string(++next_id_), file.name, file.size, category,
                       file.effective_content_type()};
}

auto instant_backend::init_chunked(const chunked_upload_request& request,
                                   const cancellation_token&) -> result<chunk_plan> {
    chunk_plan plan;
    plan.upload_id = "upload-" + std::to_string(++next_id_);
    plan.chunk_size = chunk_config::default_chunk_size;
    plan.total_chunks = chunk_config::calculate_chunk_count(request.size, plan.chunk_size);
    return plan;
}

auto instant_backend::upload_chunk(const chunk& part, const cancellation_token&)
    -> result<void> {
    bytes_received_ += part.data.size();
    return {};
}

auto instant_backend::complete_chunked(const std::string& upload_id,
                                       const cancellation_token&) -> result<file_record> {
    return file_record{upload_id, "", 0, "", ""};
}

auto instant_backend::start_bulk_job(const std::vector<file_ref>& files, const std::string&)
    -> result<std::string> {
    auto id = "job-" + std::to_string(++next_id_);
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_[id] = files.size();
    return id;
}

auto instant_backend::poll_bulk_job(const std::string& job_id) -> result<job_status> {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return unexpected(error{error_code::request_rejected, "unknown job"});
    }
    job_status status;
    status.status = job_state::completed;
    status.total = it->second;
    status.success_count = it->second;
    return status;
}

auto instant_backend::cancel_bulk_job(const std::string&) -> result<void> {
    return {};
}

// Utility functions

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= sizes::GB) {
        oss << bytes_per_second / sizes::GB << " GB/s";
    } else if (bytes_per_second >= sizes::MB) {
        oss << bytes_per_second / sizes::MB << " MB/s";
    } else if (bytes_per_second >= sizes::KB) {
        oss << bytes_per_second / sizes::KB << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

}  // namespace kcenon::upload_orchestrator::benchmark
