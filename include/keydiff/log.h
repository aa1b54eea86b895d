// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers (stderr, compiled out unless KEYDIFF_VERBOSE_LOG).
///
/// Every helper takes a std::source_location defaulted at the call site so
/// the line printed points at the caller, not at this header.

#pragma once

#include <keydiff/keydiff_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace keydiff {
namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Loader failures are logged with the source name before the exception leaves the loader.
inline void log_load_error(
    std::string_view func,
    std::string_view source,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] '" << source << "': " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)source;
    (void)reason;
    (void)loc;
#endif
}

/// Internal invariant violations are always printed, regardless of KEYDIFF_VERBOSE_LOG.
inline void log_invariant_violation(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
    std::cerr << "[" << func << "] internal invariant violated: " << message
              << " (at " << loc.file_name()
              << ":" << loc.line() << ")\n";
}

} // namespace detail
} // namespace keydiff
