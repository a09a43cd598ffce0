// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for storage_trans_system
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - STORAGE_TRANS_HAS_*  : Local feature availability (digest, streaming transfer)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/storage_transfer/config/feature_flags.h>
 *
 * #if STORAGE_TRANS_HAS_DIGEST
 *     auto digest = hasher.hash(file);
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
#define STORAGE_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define STORAGE_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Storage Transfer Feature Flags
//==============================================================================

/**
 * @brief Content digest support (OpenSSL)
 *
 * When enabled, the content hasher computes SHA-256 digests through OpenSSL's
 * EVP interface. Without it, hashing reports hash_unavailable and uploads
 * proceed without client-side deduplication.
 * Set via CMake option STORAGE_TRANS_ENABLE_DIGEST.
 */
#ifndef STORAGE_TRANS_HAS_DIGEST
    #if defined(STORAGE_TRANS_ENABLE_DIGEST)
        #define STORAGE_TRANS_HAS_DIGEST 1
    #else
        #define STORAGE_TRANS_HAS_DIGEST 0
    #endif
#endif

/**
 * @brief Streaming transfer backend (libcurl)
 *
 * When enabled, direct transfers can stream the request body from disk with
 * transport-driven progress and mid-flight abort.
 * Set via CMake option STORAGE_TRANS_ENABLE_STREAMING.
 */
#ifndef STORAGE_TRANS_HAS_STREAMING_TRANSFER
    #if defined(STORAGE_TRANS_ENABLE_STREAMING)
        #define STORAGE_TRANS_HAS_STREAMING_TRANSFER 1
    #else
        #define STORAGE_TRANS_HAS_STREAMING_TRANSFER 0
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

// thread_system integration (worker pool for concurrent uploads and refreshes)
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

// network_system integration (HTTP client for the REST backend)
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
 * @brief Unified flag for logger_system usage in storage_transfer
 *
 * logger_system requires common_system for its result types.
 */
#ifndef STORAGE_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define STORAGE_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define STORAGE_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef STORAGE_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Storage Transfer System Feature Summary ===")

#if STORAGE_TRANS_HAS_DIGEST
    #pragma message("  Content digest (OpenSSL): Enabled")
#else
    #pragma message("  Content digest (OpenSSL): Disabled")
#endif

#if STORAGE_TRANS_HAS_STREAMING_TRANSFER
    #pragma message("  Streaming transfer (libcurl): Enabled")
#else
    #pragma message("  Streaming transfer (libcurl): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Enabled")
#else
    #pragma message("  thread_system: Disabled")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Enabled")
#else
    #pragma message("  network_system: Disabled")
#endif

#endif  // STORAGE_TRANS_PRINT_FEATURE_SUMMARY
