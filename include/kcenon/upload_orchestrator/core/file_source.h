/**
 * @file file_source.h
 * @brief File references and random-access byte sources
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_FILE_SOURCE_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_FILE_SOURCE_H

#include <kcenon/upload_orchestrator/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::upload_orchestrator {

/// Content type sent when none is known
inline constexpr std::string_view default_content_type = "application/octet-stream";

/**
 * @brief Random-access source of file bytes
 *
 * Implementations must allow concurrent read() calls: chunk workers of the
 * same file read disjoint ranges in parallel.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read @p length bytes starting at @p offset
     *
     * Reading past the end is an error; a range ending exactly at size()
     * is valid.
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> = 0;
};

/**
 * @brief Byte source backed by an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    explicit memory_byte_source(std::vector<std::byte> data);

    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> override;

private:
    std::vector<std::byte> data_;
};

/**
 * @brief Byte source reading from a local file
 */
class local_file_source : public byte_source {
public:
    /**
     * @brief Open a file for reading
     * @return Source or error (file_not_found / file_read_error)
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<local_file_source>>;

    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    local_file_source(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_;
    std::mutex mutex_;
};

/**
 * @brief A file selected for upload
 */
struct file_ref {
    std::string name;
    uint64_t size = 0;
    std::string content_type;
    std::shared_ptr<byte_source> source;

    /**
     * @brief Content type to send, falling back to application/octet-stream
     */
    [[nodiscard]] auto effective_content_type() const -> std::string {
        return content_type.empty() ? std::string(default_content_type) : content_type;
    }

    /**
     * @brief Build a reference to a local file
     *
     * The content type is guessed from the file extension.
     */
    [[nodiscard]] static auto from_path(const std::filesystem::path& path)
        -> result<file_ref>;

    /**
     * @brief Build a reference over an in-memory buffer
     */
    [[nodiscard]] static auto from_memory(std::string name,
                                          std::vector<std::byte> data,
                                          std::string content_type = {}) -> file_ref;
};

/**
 * @brief Guess a MIME type from a file name extension
 * @return Known type, or an empty string
 */
[[nodiscard]] auto guess_content_type(std::string_view filename) -> std::string;

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_FILE_SOURCE_H
