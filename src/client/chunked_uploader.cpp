/**
 * @file chunked_uploader.cpp
 * @brief Implementation of the chunked upload protocol
 */

#include "kcenon/upload_orchestrator/client/chunked_uploader.h"

#include "kcenon/upload_orchestrator/core/chunk_splitter.h"
#include "kcenon/upload_orchestrator/core/logging.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::upload_orchestrator {

namespace {

/**
 * @brief State shared by the chunk workers of one attempt
 */
struct chunk_run_state {
    std::atomic<uint64_t> next_index{0};
    std::atomic<uint64_t> bytes_acknowledged{0};
    std::atomic<bool> stop{false};
    std::mutex error_mutex;
    std::optional<error> first_error;

    void fail(error err) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
            first_error = std::move(err);
        }
        stop.store(true);
    }
};

}  // namespace

chunked_uploader::chunked_uploader(
    std::shared_ptr<upload_backend> backend,
    std::shared_ptr<adapters::upload_thread_pool_interface> chunk_pool,
    chunk_config config)
    : backend_(std::move(backend)), chunk_pool_(std::move(chunk_pool)), config_(config) {}

auto chunked_uploader::upload(const file_ref& file,
                              const std::string& category,
                              const cancellation_token& token,
                              const progress_callback& on_progress) -> result<file_record> {
    if (token.is_cancellation_requested()) {
        return unexpected(error{error_code::operation_cancelled});
    }

    chunked_upload_request request;
    request.filename = file.name;
    request.size = file.size;
    request.category = category;
    request.content_type = file.effective_content_type();

    auto plan = backend_->init_chunked(request, token);
    if (!plan) {
        return unexpected(plan.error());
    }

    auto splitter = chunk_splitter::create(file, plan.value(), config_.chunk_size);
    if (!splitter) {
        UO_LOG_ERROR(log_category::chunked,
                     "Rejected chunk plan for " + file.name + ": " + splitter.error().message);
        return unexpected(splitter.error());
    }
    const auto& parts = splitter.value();

    upload_log_context ctx;
    ctx.filename = file.name;
    ctx.file_size = file.size;
    ctx.total_chunks = parts.total_chunks();
    UO_LOG_INFO_CTX(log_category::chunked, "Chunked upload opened: " + parts.upload_id(), ctx);

    chunk_run_state state;

    auto worker = [&]() {
        while (!state.stop.load()) {
            if (token.is_cancellation_requested()) {
                state.fail(error{error_code::operation_cancelled});
                return;
            }

            auto index = state.next_index.fetch_add(1);
            if (index >= parts.total_chunks()) {
                return;
            }

            auto part = parts.read_chunk(index);
            if (!part) {
                state.fail(part.error());
                return;
            }

            auto sent = backend_->upload_chunk(part.value(), token);
            if (!sent) {
                upload_log_context chunk_ctx = ctx;
                chunk_ctx.chunk_index = index;
                chunk_ctx.error_message = sent.error().message;
                UO_LOG_WARN_CTX(log_category::chunked, "Chunk upload failed", chunk_ctx);
                state.fail(sent.error());
                return;
            }

            auto total = state.bytes_acknowledged.fetch_add(part.value().data.size()) +
                         part.value().data.size();
            if (on_progress) {
                on_progress(total);
            }
        }
    };

    auto worker_count = static_cast<std::size_t>(std::min<uint64_t>(
        config_.max_concurrent_chunks, parts.total_chunks()));

    std::vector<std::future<void>> futures;
    futures.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        futures.push_back(chunk_pool_->submit_to_stage(worker, "chunk_worker"));
    }

    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            state.fail(error{error_code::internal_error,
                             std::string("chunk worker terminated: ") + e.what()});
        }
    }

    if (token.is_cancellation_requested()) {
        UO_LOG_INFO_CTX(log_category::chunked, "Chunked upload cancelled", ctx);
        return unexpected(error{error_code::operation_cancelled});
    }

    if (state.first_error) {
        return unexpected(*state.first_error);
    }

    auto record = backend_->complete_chunked(parts.upload_id(), token);
    if (!record) {
        ctx.error_message = record.error().message;
        UO_LOG_WARN_CTX(log_category::chunked, "Completing chunked upload failed", ctx);
        return unexpected(record.error());
    }

    ctx.bytes_uploaded = state.bytes_acknowledged.load();
    UO_LOG_INFO_CTX(log_category::chunked, "Chunked upload completed", ctx);
    return record;
}

}  // namespace kcenon::upload_orchestrator
