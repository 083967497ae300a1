// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for blob_transfer
 *
 * Central entry point for the system integration flags used by the
 * blob_transfer library. The KCENON_WITH_* macros are normally inherited
 * from common_system or set by CMake when the corresponding package is found.
 *
 * Usage:
 * @code
 * #include <kcenon/blob_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool->enqueue(std::move(job));
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BLOB_TRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BLOB_TRANSFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (result types shared by thread and logger systems)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (bounded worker pool for parallel uploads)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (asynchronous structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Derived Flags
//==============================================================================

// logger_system is only usable together with common_system
#if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
    #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 1
#else
    #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 0
#endif
