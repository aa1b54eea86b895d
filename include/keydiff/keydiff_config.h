// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file keydiff_config.h
/// @brief Centralized compile-time configuration for keydiff and immer
///
/// This file defines the compile-time configuration for:
///   - immer: persistent containers backing Value maps and vectors
///   - keydiff: diagnostics and JSON parser limits
///
/// It MUST be included before any immer header so that every translation
/// unit sees the same immer settings. All keydiff public headers include it
/// first, so users who only include keydiff headers need nothing special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(KEYDIFF_CONFIGURED)
#error "immer headers were included before keydiff/keydiff_config.h. " \
       "Please include keydiff headers before any direct immer includes."
#endif

#define KEYDIFF_CONFIGURED 1

// ============================================================
// Immer Performance Settings
// ============================================================

/// @brief Disable thread safety of the default memory policy
///
/// Value uses an explicitly unsafe policy anyway; this also makes
/// immer::default_memory_policy cheaper for code that does not opt into
/// SyncValue.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// ============================================================
// Immer Debug Settings (all disabled)
// ============================================================

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Enable diagnostic lines on stderr
///
/// When enabled, the following are reported through detail::log_* helpers:
///   - Value::at() on a missing key, an out-of-range index or a wrong type
///   - document loader failures (before the exception is thrown)
///   - engine invariant violations (before std::logic_error is thrown)
///
/// Defaults to on in debug builds and off when NDEBUG is defined.
#ifndef KEYDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define KEYDIFF_VERBOSE_LOG 0
#  else
#    define KEYDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// JSON Parser Limits
// ============================================================

/// @brief Maximum nesting of objects and arrays accepted by from_json()
///
/// Deeper documents fail with a "Nesting too deep" parse error.
#ifndef KEYDIFF_JSON_MAX_DEPTH
#define KEYDIFF_JSON_MAX_DEPTH 512
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef KEYDIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("keydiff: immer thread safety DISABLED")
#else
#pragma message("keydiff: immer thread safety ENABLED")
#endif

#if KEYDIFF_VERBOSE_LOG
#pragma message("keydiff: verbose diagnostics ENABLED")
#endif
#endif // KEYDIFF_CONFIG_VERBOSE
