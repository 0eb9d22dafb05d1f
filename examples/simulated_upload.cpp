/**
 * @file simulated_upload.cpp
 * @brief Upload session against an in-process simulated server
 *
 * This example demonstrates:
 * - Building an orchestrator with custom thresholds and retry settings
 * - Implementing the upload_backend interface
 * - Observing session snapshots to render progress
 * - Direct path (small submissions) and bulk path (large submissions)
 * - Decoding JSON job status payloads with parse_job_status
 * - Cancelling a running session with Ctrl+C
 */

#include <kcenon/upload_orchestrator/upload_orchestrator.h>
#include <kcenon/upload_orchestrator/core/checksum.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace kcenon::upload_orchestrator;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int /*signal*/) {
    g_interrupted.store(true);
}

/**
 * @brief Server stand-in with fixed latency and random transient failures
 */
class simulated_server : public upload_backend {
public:
    simulated_server(std::chrono::milliseconds latency, double failure_rate)
        : latency_(latency), failure_rate_(failure_rate), rng_(std::random_device{}()) {}

    auto upload_single(const file_ref& file,
                       const std::string& category,
                       const cancellation_token& token) -> result<file_record> override {
        if (auto r = simulate(token); !r) {
            return unexpected(r.error());
        }
        return file_record{"file-" + std::to_string(++next_id_), file.name, file.size,
                           category, file.effective_content_type()};
    }

    auto init_chunked(const chunked_upload_request& request,
                      const cancellation_token& token) -> result<chunk_plan> override {
        if (auto r = simulate(token); !r) {
            return unexpected(r.error());
        }
        chunk_plan plan;
        plan.upload_id = "upload-" + std::to_string(++next_id_);
        plan.chunk_size = chunk_config::default_chunk_size;
        plan.total_chunks =
            chunk_config::calculate_chunk_count(request.size, plan.chunk_size);
        return plan;
    }

    auto upload_chunk(const chunk& part, const cancellation_token& token)
        -> result<void> override {
        if (!checksum::verify_crc32(part.data, part.checksum)) {
            return unexpected(error{error_code::request_rejected, "chunk checksum mismatch"});
        }
        return simulate(token);
    }

    auto complete_chunked(const std::string& upload_id, const cancellation_token& token)
        -> result<file_record> override {
        if (auto r = simulate(token); !r) {
            return unexpected(r.error());
        }
        return file_record{upload_id, "", 0, "", ""};
    }

    auto start_bulk_job(const std::vector<file_ref>& files, const std::string& /*category*/)
        -> result<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = "job-" + std::to_string(++next_id_);
        job j;
        for (const auto& file : files) {
            j.names.push_back(file.name);
        }
        jobs_[id] = std::move(j);
        return id;
    }

    auto poll_bulk_job(const std::string& job_id) -> result<job_status> override {
        std::this_thread::sleep_for(latency_);
        std::string payload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = jobs_.find(job_id);
            if (it == jobs_.end()) {
                return unexpected(error{error_code::request_rejected, "unknown job " + job_id});
            }
            payload = advance(it->second).dump();
        }
        // Decode the way a response body from the server would be
        return parse_job_status(payload);
    }

    auto cancel_bulk_job(const std::string& job_id) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it != jobs_.end()) {
            it->second.cancelled = true;
        }
        return {};
    }

private:
    struct job {
        std::vector<std::string> names;
        std::size_t processed = 0;
        std::size_t succeeded = 0;
        std::vector<std::string> errors;
        bool cancelled = false;
    };

    struct wakeup {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    /**
     * @brief Process up to four more files of @p j. Caller holds mutex_.
     * @return Job status document as the server would send it
     */
    auto advance(job& j) -> nlohmann::json {
        const auto total = j.names.size();
        if (!j.cancelled) {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            for (int n = 0; n < 4 && j.processed < total; ++n, ++j.processed) {
                if (dist(rng_) < failure_rate_) {
                    j.errors.push_back(j.names[j.processed] + ": simulated rejection");
                } else {
                    ++j.succeeded;
                }
            }
        }

        auto state = job_state::processing;
        if (j.cancelled) {
            state = job_state::cancelled;
        } else if (j.processed == total) {
            state = j.errors.empty() ? job_state::completed : job_state::completed_with_errors;
        }

        nlohmann::json doc;
        doc["status"] = to_string(state);
        doc["success_count"] = j.succeeded;
        doc["error_count"] = j.errors.size();
        doc["total"] = total;
        doc["progress"] = total == 0 ? 1.0
                                     : static_cast<double>(j.processed) /
                                           static_cast<double>(total);
        if (j.processed < total) {
            doc["current_file"] = j.names[j.processed];
        }
        doc["errors"] = j.errors;
        return doc;
    }

    auto simulate(const cancellation_token& token) -> result<void> {
        // Shared with the callback, which may still run after unregistering
        auto wake = std::make_shared<wakeup>();
        auto id = token.register_callback([wake] {
            std::lock_guard<std::mutex> lock(wake->mutex);
            wake->cancelled = true;
            wake->cv.notify_all();
        });

        bool cancelled = false;
        {
            std::unique_lock<std::mutex> lock(wake->mutex);
            cancelled = wake->cv.wait_for(lock, latency_, [&wake] { return wake->cancelled; });
        }
        token.unregister_callback(id);
        if (cancelled) {
            return unexpected(error{error_code::operation_cancelled});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        if (dist(rng_) < failure_rate_) {
            return unexpected(error{error_code::service_unavailable, "simulated outage"});
        }
        return {};
    }

    std::chrono::milliseconds latency_;
    double failure_rate_;
    std::mt19937 rng_;
    std::mutex mutex_;
    std::atomic<uint64_t> next_id_{0};
    std::map<std::string, job> jobs_;
};

auto make_files(std::size_t count, std::size_t size) -> std::vector<file_ref> {
    std::vector<file_ref> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::vector<std::byte> data(size);
        for (std::size_t b = 0; b < size; ++b) {
            data[b] = static_cast<std::byte>((b + i) & 0xFF);
        }
        files.push_back(file_ref::from_memory(
            "document_" + std::to_string(i + 1) + ".pdf", std::move(data)));
    }
    return files;
}

auto parse_size(const std::string& size_str) -> std::size_t {
    std::size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<std::size_t>(value * 1024);
            case 'M': return static_cast<std::size_t>(value * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Simulated Upload - Upload Orchestrator" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -n, --files <count>     Number of files (default: 8)" << std::endl;
    std::cout << "  -s, --size <size>       Size of each file, e.g. 512K, 60M (default: 256K)" << std::endl;
    std::cout << "  -c, --concurrency <n>   Parallel uploads on the direct path (default: 5)" << std::endl;
    std::cout << "  -f, --fail-rate <rate>  Probability of a transient failure (default: 0.1)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Submissions of more than 20 files use the bulk path." << std::endl;
}

int main(int argc, char* argv[]) {
    std::size_t file_count = 8;
    std::size_t file_size = 256 * 1024;
    std::size_t concurrency = 5;
    double fail_rate = 0.1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](const char* name) -> bool {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return false;
            }
            return true;
        };

        try {
            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-n" || arg == "--files") {
                if (!need_value("--files")) return 1;
                file_count = static_cast<std::size_t>(std::stoul(argv[i]));
            } else if (arg == "-s" || arg == "--size") {
                if (!need_value("--size")) return 1;
                file_size = parse_size(argv[i]);
            } else if (arg == "-c" || arg == "--concurrency") {
                if (!need_value("--concurrency")) return 1;
                concurrency = static_cast<std::size_t>(std::stoul(argv[i]));
            } else if (arg == "-f" || arg == "--fail-rate") {
                if (!need_value("--fail-rate")) return 1;
                fail_rate = std::stod(argv[i]);
            } else {
                std::cerr << "Error: unknown option " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);

    auto backend = std::make_shared<simulated_server>(std::chrono::milliseconds(40), fail_rate);

    auto orchestrator_result = upload_orchestrator::builder()
        .with_backend(backend)
        .with_concurrency(concurrency)
        .with_max_retries(3)
        .with_retry_base_delay(std::chrono::milliseconds(100))
        .with_poll_interval(std::chrono::milliseconds(200))
        .with_category("examples")
        .build();

    if (!orchestrator_result.has_value()) {
        std::cerr << "Failed to create orchestrator: "
                  << orchestrator_result.error().message << std::endl;
        return 1;
    }

    auto& orchestrator = orchestrator_result.value();

    std::cout << "========================================" << std::endl;
    std::cout << "       Simulated Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Files: " << file_count << " x " << format_bytes(file_size) << std::endl;
    std::cout << "  Concurrency: " << concurrency << std::endl;
    std::cout << "  Failure rate: " << fail_rate << std::endl;
    std::cout << std::endl;

    orchestrator.subscribe([](const transfer_session& session) {
        std::cout << "\r" << std::setw(40) << std::left << session.summary()
                  << std::fixed << std::setprecision(1) << session.byte_percentage() << "% | "
                  << format_bytes(session.uploaded_bytes) << "/"
                  << format_bytes(session.total_bytes) << "     " << std::flush;
    });

    auto start_result = orchestrator.start_upload(make_files(file_count, file_size));
    if (!start_result) {
        std::cerr << "Failed to start upload: " << start_result.error().message << std::endl;
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    transfer_session final_state;
    for (;;) {
        auto waited = orchestrator.wait_for(std::chrono::milliseconds(100));
        if (waited) {
            final_state = waited.value();
            break;
        }
        if (g_interrupted.load()) {
            std::cout << std::endl << "Interrupted, cancelling..." << std::endl;
            if (auto r = orchestrator.cancel(); !r) {
                std::cerr << "Cancel failed: " << r.error().message << std::endl;
            }
            final_state = orchestrator.wait();
            break;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << std::endl << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Path: " << to_string(final_state.path) << std::endl;
    std::cout << "  Completed: " << final_state.completed << std::endl;
    std::cout << "  Failed: " << final_state.failed << std::endl;
    std::cout << "  Cancelled: " << final_state.cancelled << std::endl;
    std::cout << "  Elapsed: " << elapsed.count() << " ms" << std::endl;
    for (const auto& task : final_state.failed_tasks()) {
        std::cout << "  ! " << task.name << ": " << task.error.value_or("unknown error")
                  << std::endl;
    }
    std::cout << "========================================" << std::endl;

    (void)orchestrator.dismiss();
    return final_state.all_succeeded() ? 0 : 2;
}
