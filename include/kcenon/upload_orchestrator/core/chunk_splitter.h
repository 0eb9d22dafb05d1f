/**
 * @file chunk_splitter.h
 * @brief Splitting a file into server-planned chunks
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_SPLITTER_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_SPLITTER_H

#include <kcenon/upload_orchestrator/core/chunk_config.h>
#include <kcenon/upload_orchestrator/core/file_source.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <memory>

namespace kcenon::upload_orchestrator {

/**
 * @brief Maps chunk indexes onto byte ranges of one file
 *
 * Chunk i covers [i * chunk_size, min((i + 1) * chunk_size, file_size)).
 * Chunks are read on demand, so workers can pull any index in any order
 * without holding the whole file in memory.
 */
class chunk_splitter {
public:
    /**
     * @brief Create a splitter for a file and a server-issued plan
     *
     * A plan chunk size of 0 falls back to @p fallback_chunk_size. The plan's
     * chunk count must equal ceil(file size / chunk size).
     *
     * @return Splitter, or invalid_chunk_plan if the plan does not fit the file
     */
    [[nodiscard]] static auto create(const file_ref& file,
                                     const chunk_plan& plan,
                                     std::size_t fallback_chunk_size) -> result<chunk_splitter>;

    /**
     * @brief Byte range of chunk @p index
     */
    [[nodiscard]] auto range(uint64_t index) const -> result<chunk_range>;

    /**
     * @brief Read chunk @p index and compute its CRC32
     */
    [[nodiscard]] auto read_chunk(uint64_t index) const -> result<chunk>;

    [[nodiscard]] auto total_chunks() const -> uint64_t { return total_chunks_; }
    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }
    [[nodiscard]] auto file_size() const -> uint64_t { return file_size_; }
    [[nodiscard]] auto upload_id() const -> const std::string& { return upload_id_; }

private:
    chunk_splitter(std::shared_ptr<byte_source> source,
                   std::string upload_id,
                   uint64_t file_size,
                   std::size_t chunk_size,
                   uint64_t total_chunks);

    std::shared_ptr<byte_source> source_;
    std::string upload_id_;
    uint64_t file_size_;
    std::size_t chunk_size_;
    uint64_t total_chunks_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_CHUNK_SPLITTER_H
