/**
 * @file strategy_selector.h
 * @brief Choosing how a submission is transferred
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_STRATEGY_SELECTOR_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_STRATEGY_SELECTOR_H

#include <kcenon/upload_orchestrator/core/file_source.h>
#include <kcenon/upload_orchestrator/core/session_types.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Thresholds that drive strategy selection
 */
struct strategy_config {
    /// Submissions with at most this many files use the direct path
    static constexpr std::size_t default_direct_threshold = 20;

    /// Files of at least this size are sent in chunks (50MB)
    static constexpr uint64_t default_chunk_threshold = 50ULL * 1024 * 1024;

    std::size_t direct_threshold = default_direct_threshold;
    uint64_t chunk_threshold = default_chunk_threshold;

    [[nodiscard]] auto validate() const -> result<void> {
        if (direct_threshold == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "direct threshold must be at least 1"});
        }
        if (chunk_threshold == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk threshold must be positive"});
        }
        return {};
    }
};

/**
 * @brief Outcome of strategy selection for one submission
 */
struct transfer_plan {
    transfer_path path = transfer_path::none;

    /// Per-file method, index-aligned with the submitted files (direct path only)
    std::vector<upload_method> methods;

    [[nodiscard]] auto chunked_count() const -> std::size_t;
};

/**
 * @brief Pure partitioning of a submission into transfer strategies
 *
 * The decision is made once per submission and has no side effects.
 */
class strategy_selector {
public:
    strategy_selector() = default;
    explicit strategy_selector(strategy_config config) : config_(config) {}

    /**
     * @brief Direct path for at most direct_threshold files, bulk otherwise
     */
    [[nodiscard]] auto select_path(std::size_t file_count) const -> transfer_path;

    /**
     * @brief Chunked for files at or above chunk_threshold
     */
    [[nodiscard]] auto select_method(uint64_t file_size) const -> upload_method;

    [[nodiscard]] auto plan(const std::vector<file_ref>& files) const -> transfer_plan;

    [[nodiscard]] auto config() const -> const strategy_config& { return config_; }

private:
    strategy_config config_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_STRATEGY_SELECTOR_H
