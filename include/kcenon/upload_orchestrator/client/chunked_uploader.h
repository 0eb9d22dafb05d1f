/**
 * @file chunked_uploader.h
 * @brief init / chunk x N / complete protocol for large files
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_CHUNKED_UPLOADER_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_CHUNKED_UPLOADER_H

#include <kcenon/upload_orchestrator/adapters/thread_pool_adapter.h>
#include <kcenon/upload_orchestrator/client/upload_backend.h>
#include <kcenon/upload_orchestrator/core/cancellation.h>
#include <kcenon/upload_orchestrator/core/chunk_config.h>
#include <kcenon/upload_orchestrator/core/file_source.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kcenon::upload_orchestrator {

/**
 * @brief Uploads one file as a sequence of chunks
 *
 * A single upload() call makes one whole attempt: it opens a fresh upload,
 * sends every chunk with at most chunk_config::max_concurrent_chunks
 * requests in flight, and finalizes. The first failing chunk stops the
 * other chunk workers from starting new chunks and fails the attempt;
 * there is no per-chunk retry.
 */
class chunked_uploader {
public:
    /// Receives the cumulative number of bytes acknowledged so far
    using progress_callback = std::function<void(uint64_t)>;

    chunked_uploader(std::shared_ptr<upload_backend> backend,
                     std::shared_ptr<adapters::upload_thread_pool_interface> chunk_pool,
                     chunk_config config);

    /**
     * @brief Run one complete chunked upload attempt
     * @param file File to send
     * @param category Category recorded with the file
     * @param token Cancellation token, checked before every chunk
     * @param on_progress Optional byte progress hook, called from chunk workers
     */
    [[nodiscard]] auto upload(const file_ref& file,
                              const std::string& category,
                              const cancellation_token& token,
                              const progress_callback& on_progress = {}) -> result<file_record>;

    [[nodiscard]] auto config() const -> const chunk_config& { return config_; }

private:
    std::shared_ptr<upload_backend> backend_;
    std::shared_ptr<adapters::upload_thread_pool_interface> chunk_pool_;
    chunk_config config_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_CHUNKED_UPLOADER_H
