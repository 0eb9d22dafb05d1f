// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/upload_orchestrator/config/feature_flags.h"

#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::upload_orchestrator {

/**
 * @brief Log categories for the upload orchestrator
 */
struct log_category {
    static constexpr std::string_view orchestrator = "upload.orchestrator";
    static constexpr std::string_view worker_pool = "upload.worker_pool";
    static constexpr std::string_view chunked = "upload.chunked";
    static constexpr std::string_view retry = "upload.retry";
    static constexpr std::string_view bulk = "upload.bulk";
    static constexpr std::string_view aggregator = "upload.aggregator";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for masking user file names and paths in logs
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks sensitive information in log messages
 *
 * Uploaded file names frequently carry customer or project names, so they
 * can be partially hidden before they reach shared log sinks.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask file paths embedded in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }

        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    /**
     * @brief Mask a file path, keeping only the final component readable
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        std::string filename = path.substr(last_sep + 1);

        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }

        return masked_dir + "/" + filename;
    }

    /**
     * @brief Mask a bare file name, preserving its extension
     */
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            std::string name = filename.substr(0, dot_pos);
            std::string ext = filename.substr(dot_pos);

            if (name.size() <= config_.visible_chars) {
                return filename;
            }

            std::string visible = name.substr(0, config_.visible_chars);
            std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
            return visible + masked + ext;
        }

        std::string visible = filename.substr(0, config_.visible_chars);
        std::string masked(filename.size() - config_.visible_chars, config_.mask_char[0]);
        return visible + masked;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string task_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_uploaded;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint32_t> attempt;
    std::optional<std::string> job_id;
    std::optional<uint64_t> batch_index;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!task_id.empty()) add_field("task_id", task_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_filename(filename) : filename);
        }
        if (file_size) add_uint("size", *file_size);
        if (bytes_uploaded) add_uint("bytes_uploaded", *bytes_uploaded);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (attempt) add_uint("attempt", *attempt);
        if (job_id) add_field("job_id", *job_id);
        if (batch_index) add_uint("batch_index", *batch_index);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\b': output += "\\b";  break;
                case '\f': output += "\\f";  break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << upload_log_context::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = *source_file;
            if (masker && masker->get_config().mask_paths) {
                file = masker->mask_path(file);
            }
            oss << ",\"source\":{";
            oss << "\"file\":\"" << upload_log_context::escape_json_string(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::chunked)
 *     .with_message("Chunk uploaded")
 *     .with_task_id("3f2b...")
 *     .with_chunk_index(4)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_task_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->task_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_size = size;
        return *this;
    }

    auto with_bytes_uploaded(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_uploaded = bytes;
        return *this;
    }

    auto with_chunk_index(uint64_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        return *this;
    }

    auto with_total_chunks(uint64_t total) -> log_entry_builder& {
        ensure_context();
        entry_.context->total_chunks = total;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_job_id(std::string_view job_id) -> log_entry_builder& {
        ensure_context();
        entry_.context->job_id = std::string(job_id);
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Upload orchestrator logging interface
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when an orchestrator is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the default stderr sink (callbacks still fire)
     */
    void set_console_output(bool enable) {
        console_output_.store(enable);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string formatted;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            formatted = builder.build().to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            formatted = oss.str();
        }

#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (!console_output_.load()) return;
        if (format == log_output_format::text) {
            formatted = get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                        "] " + formatted;
        }
        output_to_stderr(formatted);
    }

    void flush() {
#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

// Logging macros for convenience
#define UO_LOG(level, category, message) \
    kcenon::upload_orchestrator::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define UO_LOG_CTX(level, category, message, context) \
    kcenon::upload_orchestrator::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define UO_LOG_TRACE(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::trace, category, message)

#define UO_LOG_DEBUG(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::debug, category, message)

#define UO_LOG_INFO(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::info, category, message)

#define UO_LOG_WARN(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::warn, category, message)

#define UO_LOG_ERROR(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::error, category, message)

#define UO_LOG_FATAL(category, message) \
    UO_LOG(kcenon::upload_orchestrator::log_level::fatal, category, message)

#define UO_LOG_TRACE_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::trace, category, message, ctx)

#define UO_LOG_DEBUG_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::debug, category, message, ctx)

#define UO_LOG_INFO_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::info, category, message, ctx)

#define UO_LOG_WARN_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::warn, category, message, ctx)

#define UO_LOG_ERROR_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::error, category, message, ctx)

#define UO_LOG_FATAL_CTX(category, message, ctx) \
    UO_LOG_CTX(kcenon::upload_orchestrator::log_level::fatal, category, message, ctx)

}  // namespace kcenon::upload_orchestrator
