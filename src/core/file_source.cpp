/**
 * @file file_source.cpp
 * @brief Implementation of byte sources and file references
 */

#include <kcenon/upload_orchestrator/core/file_source.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace kcenon::upload_orchestrator {

namespace {

struct extension_mapping {
    std::string_view extension;
    std::string_view content_type;
};

constexpr std::array<extension_mapping, 20> known_extensions = {{
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".txt", "text/plain"},
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".html", "text/html"},
    {".zip", "application/zip"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".mp4", "video/mp4"},
    {".msg", "application/vnd.ms-outlook"},
}};

auto check_range(uint64_t total, uint64_t offset, std::size_t length) -> result<void> {
    if (offset > total || length > total - offset) {
        return unexpected(error{error_code::file_read_error,
                                "read range [" + std::to_string(offset) + ", " +
                                    std::to_string(offset + length) + ") exceeds size " +
                                    std::to_string(total)});
    }
    return {};
}

}  // namespace

// memory_byte_source

memory_byte_source::memory_byte_source(std::vector<std::byte> data)
    : data_(std::move(data)) {}

auto memory_byte_source::size() const -> uint64_t {
    return data_.size();
}

auto memory_byte_source::read(uint64_t offset, std::size_t length)
    -> result<std::vector<std::byte>> {
    if (auto r = check_range(data_.size(), offset, length); !r) {
        return unexpected(r.error());
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
}

// local_file_source

local_file_source::local_file_source(std::filesystem::path path,
                                     std::ifstream stream,
                                     uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

auto local_file_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<local_file_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    return std::shared_ptr<local_file_source>(
        new local_file_source(path, std::move(stream), file_size));
}

auto local_file_source::size() const -> uint64_t {
    return size_;
}

auto local_file_source::read(uint64_t offset, std::size_t length)
    -> result<std::vector<std::byte>> {
    if (auto r = check_range(size_, offset, length); !r) {
        return unexpected(r.error());
    }

    std::vector<std::byte> buffer(length);
    if (length == 0) {
        return buffer;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed: " + path_.string()});
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(stream_.gcount()) != length) {
        return unexpected(
            error{error_code::file_read_error, "short read: " + path_.string()});
    }

    return buffer;
}

// file_ref

auto file_ref::from_path(const std::filesystem::path& path) -> result<file_ref> {
    auto source = local_file_source::open(path);
    if (!source) {
        return unexpected(source.error());
    }

    file_ref ref;
    ref.name = path.filename().string();
    ref.size = source.value()->size();
    ref.content_type = guess_content_type(ref.name);
    ref.source = source.value();
    return ref;
}

auto file_ref::from_memory(std::string name,
                           std::vector<std::byte> data,
                           std::string content_type) -> file_ref {
    file_ref ref;
    ref.name = std::move(name);
    ref.size = data.size();
    ref.content_type = content_type.empty() ? guess_content_type(ref.name)
                                            : std::move(content_type);
    ref.source = std::make_shared<memory_byte_source>(std::move(data));
    return ref;
}

auto guess_content_type(std::string_view filename) -> std::string {
    auto dot = filename.find_last_of('.');
    if (dot == std::string_view::npos) {
        return {};
    }

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& mapping : known_extensions) {
        if (mapping.extension == ext) {
            return std::string(mapping.content_type);
        }
    }
    return {};
}

}  // namespace kcenon::upload_orchestrator
