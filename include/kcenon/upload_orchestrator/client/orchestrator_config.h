/**
 * @file orchestrator_config.h
 * @brief Configuration types for the upload orchestrator
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_ORCHESTRATOR_CONFIG_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_ORCHESTRATOR_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>

#include "kcenon/upload_orchestrator/core/chunk_config.h"
#include "kcenon/upload_orchestrator/core/retry_policy.h"
#include "kcenon/upload_orchestrator/core/strategy_selector.h"
#include "kcenon/upload_orchestrator/core/types.h"

namespace kcenon::upload_orchestrator {

/**
 * @brief Direct path worker pool configuration
 */
struct worker_pool_config {
    static constexpr std::size_t default_max_concurrent = 5;

    /// Files uploaded simultaneously on the direct path
    std::size_t max_concurrent = default_max_concurrent;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_concurrent == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "worker concurrency must be at least 1"});
        }
        return {};
    }
};

/**
 * @brief Bulk job path configuration
 */
struct bulk_config {
    static constexpr std::size_t default_batch_size = 20;

    /// Files per server-side job
    std::size_t batch_size = default_batch_size;

    /// Interval between job status polls
    std::chrono::milliseconds poll_interval{2000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (batch_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "bulk batch size must be at least 1"});
        }
        if (poll_interval.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "bulk poll interval must be positive"});
        }
        return {};
    }
};

/**
 * @brief Complete orchestrator configuration
 */
struct orchestrator_config {
    strategy_config strategy;
    worker_pool_config workers;
    chunk_config chunks;
    retry_config retry;
    bulk_config bulk;

    /// Category attached to every uploaded file
    std::string category = "uncategorized";

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto r = strategy.validate(); !r) return r;
        if (auto r = workers.validate(); !r) return r;
        if (auto r = chunks.validate(); !r) return r;
        if (auto r = retry.validate(); !r) return r;
        if (auto r = bulk.validate(); !r) return r;
        if (category.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "category must not be empty"});
        }
        return {};
    }
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_ORCHESTRATOR_CONFIG_H
