// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Integration flags for transfer_orchestrator_system
 *
 * Central entry point for the KCENON_WITH_* macros that select optional
 * kcenon ecosystem integrations. The build sets BUILD_WITH_* definitions
 * when the corresponding package is found; this header normalizes them.
 *
 * Usage:
 * @code
 * #include <kcenon/orchestrator/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = std::make_shared<kcenon::thread::thread_pool>("orchestrator");
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define ORCHESTRATOR_HAS_COMMON_FEATURE_FLAGS 1
#else
#define ORCHESTRATOR_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for post-processing steps)
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

/**
 * @brief Unified flag for logger_system forwarding
 *
 * logger_system depends on common_system result types, so forwarding is
 * only active when both are present.
 */
#ifndef ORCHESTRATOR_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define ORCHESTRATOR_USE_LOGGER_SYSTEM 1
    #else
        #define ORCHESTRATOR_USE_LOGGER_SYSTEM 0
    #endif
#endif

#ifdef ORCHESTRATOR_PRINT_FEATURE_SUMMARY

#pragma message("=== Transfer Orchestrator Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Forwarding enabled")
#else
    #pragma message("  logger_system: stderr fallback")
#endif

#endif  // ORCHESTRATOR_PRINT_FEATURE_SUMMARY
