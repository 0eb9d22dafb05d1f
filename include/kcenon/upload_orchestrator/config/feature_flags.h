// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for upload_orchestrator
 *
 * Central entry point for the system integration flags used by the
 * orchestrator. Include this header to get access to the KCENON_WITH_* macros
 * and the derived UPLOAD_ORCH_* helpers.
 *
 * Usage:
 * @code
 * #include <kcenon/upload_orchestrator/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = kcenon::thread::thread_pool(...);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define UPLOAD_ORCH_HAS_COMMON_FEATURE_FLAGS 1
#else
#define UPLOAD_ORCH_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker and chunk pools)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in upload_orchestrator
 *
 * logger_system forwarding requires common_system as well, since the logger
 * builder returns common_system result types.
 */
#ifndef UPLOAD_ORCH_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define UPLOAD_ORCH_USE_LOGGER_SYSTEM 1
    #else
        #define UPLOAD_ORCH_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef UPLOAD_ORCH_PRINT_FEATURE_SUMMARY

#pragma message("=== Upload Orchestrator Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Enabled")
#else
    #pragma message("  thread_system: Disabled (std::async pool)")
#endif

#if UPLOAD_ORCH_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled (stderr)")
#endif

#endif  // UPLOAD_ORCH_PRINT_FEATURE_SUMMARY
