// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for blob_transfer
 *
 * Central entry point for the integration flags of the blob_transfer
 * library. Include this header to get the BLOB_TRANS_HAS_* and KCENON_WITH_*
 * feature macros.
 *
 * Feature categories:
 * - BLOB_TRANS_HAS_*     : Local feature availability
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/blob_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_transfer_adapter::create_default(workers);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BLOB_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BLOB_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Blob Transfer Feature Flags
//==============================================================================

/**
 * @brief Azure REST transport support
 *
 * The Azure block blob adapter can issue real requests only when the
 * network_system HTTP client is linked. Without it the adapter still builds
 * and works against an injected blob_http_client_interface.
 */
#ifndef BLOB_TRANS_HAS_HTTP_TRANSPORT
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define BLOB_TRANS_HAS_HTTP_TRANSPORT 1
    #else
        #define BLOB_TRANS_HAS_HTTP_TRANSPORT 0
    #endif
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

// thread_system integration (worker pool for block/chunk tasks)
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

// network_system integration (HTTP client for the Azure adapter)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in blob_transfer
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef BLOB_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BLOB_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Blob Transfer Feature Summary ===")

#if BLOB_TRANS_HAS_HTTP_TRANSPORT
    #pragma message("  HTTP transport: Enabled")
#else
    #pragma message("  HTTP transport: Injected client only")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async fallback)")
#endif

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr fallback)")
#endif

#pragma message("=====================================")

#endif // BLOB_TRANS_PRINT_FEATURE_SUMMARY
