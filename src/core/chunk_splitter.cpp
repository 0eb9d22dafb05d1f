/**
 * @file chunk_splitter.cpp
 * @brief Implementation of file splitting into chunks
 */

#include <kcenon/upload_orchestrator/core/chunk_splitter.h>

#include <kcenon/upload_orchestrator/core/checksum.h>

#include <algorithm>

namespace kcenon::upload_orchestrator {

chunk_splitter::chunk_splitter(std::shared_ptr<byte_source> source,
                               std::string upload_id,
                               uint64_t file_size,
                               std::size_t chunk_size,
                               uint64_t total_chunks)
    : source_(std::move(source)),
      upload_id_(std::move(upload_id)),
      file_size_(file_size),
      chunk_size_(chunk_size),
      total_chunks_(total_chunks) {}

auto chunk_splitter::create(const file_ref& file,
                            const chunk_plan& plan,
                            std::size_t fallback_chunk_size) -> result<chunk_splitter> {
    if (!file.source) {
        return unexpected(error{error_code::validation_failed,
                                "file has no byte source: " + file.name});
    }

    if (plan.upload_id.empty()) {
        return unexpected(error{error_code::invalid_chunk_plan, "plan has no upload id"});
    }

    std::size_t size = plan.chunk_size != 0 ? plan.chunk_size : fallback_chunk_size;
    if (size == 0) {
        return unexpected(error{error_code::invalid_chunk_plan, "chunk size is zero"});
    }

    // An empty file is still sent as one empty chunk
    uint64_t expected = std::max<uint64_t>(1, chunk_config::calculate_chunk_count(file.size, size));
    if (plan.total_chunks != expected) {
        return unexpected(error{
            error_code::invalid_chunk_plan,
            "plan declares " + std::to_string(plan.total_chunks) + " chunks, file of " +
                std::to_string(file.size) + " bytes needs " + std::to_string(expected)});
    }

    return chunk_splitter(file.source, plan.upload_id, file.size, size, plan.total_chunks);
}

auto chunk_splitter::range(uint64_t index) const -> result<chunk_range> {
    if (index >= total_chunks_) {
        return unexpected(error{error_code::invalid_chunk_plan,
                                "chunk index " + std::to_string(index) + " out of range"});
    }

    chunk_range r;
    r.index = index;
    r.offset = index * chunk_size_;
    r.length = static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size_, file_size_ - std::min(file_size_, r.offset)));
    return r;
}

auto chunk_splitter::read_chunk(uint64_t index) const -> result<chunk> {
    auto r = range(index);
    if (!r) {
        return unexpected(r.error());
    }

    auto data = source_->read(r.value().offset, r.value().length);
    if (!data) {
        return unexpected(data.error());
    }

    chunk c;
    c.upload_id = upload_id_;
    c.index = index;
    c.total_chunks = total_chunks_;
    c.offset = r.value().offset;
    c.data = std::move(data.value());
    c.checksum = checksum::crc32(std::span<const std::byte>(c.data));
    return c;
}

}  // namespace kcenon::upload_orchestrator
