/**
 * @file upload_orchestrator.h
 * @brief Main header for the upload_orchestrator library
 * @version 0.1.0
 *
 * This is the primary include file for the upload_orchestrator library.
 * Include this header to access all upload orchestration functionality.
 *
 * @code
 * #include <kcenon/upload_orchestrator/upload_orchestrator.h>
 *
 * using namespace kcenon::upload_orchestrator;
 *
 * auto orchestrator = upload_orchestrator::builder()
 *     .with_backend(std::make_shared<my_http_backend>())
 *     .build();
 * @endcode
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_UPLOAD_ORCHESTRATOR_H
#define KCENON_UPLOAD_ORCHESTRATOR_UPLOAD_ORCHESTRATOR_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/upload_orchestrator/core/types.h"
#include "kcenon/upload_orchestrator/core/session_types.h"
#include "kcenon/upload_orchestrator/core/file_source.h"
#include "kcenon/upload_orchestrator/core/logging.h"

// Client
#include "kcenon/upload_orchestrator/client/job_status.h"
#include "kcenon/upload_orchestrator/client/upload_backend.h"
#include "kcenon/upload_orchestrator/client/orchestrator_config.h"
#include "kcenon/upload_orchestrator/client/upload_orchestrator.h"

// Adapters
#include "kcenon/upload_orchestrator/adapters/thread_pool_adapter.h"

namespace kcenon::upload_orchestrator {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_UPLOAD_ORCHESTRATOR_H
