// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging used across draftcow.

#pragma once

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

// ============================================================
// Verbose Logging Configuration
//
// When DRAFTCOW_VERBOSE_LOG is 1:
//   - rejected drafts, missing keys/indices and failed patch
//     applications are reported on stderr
//
// By default verbose logging is DISABLED in release builds
// and ENABLED in debug builds.
//
// To explicitly enable: #define DRAFTCOW_VERBOSE_LOG 1
// To explicitly disable: #define DRAFTCOW_VERBOSE_LOG 0
// ============================================================

#ifndef DRAFTCOW_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DRAFTCOW_VERBOSE_LOG 0
#  else
#    define DRAFTCOW_VERBOSE_LOG 1
#  endif
#endif

namespace draftcow {

namespace detail {

inline void log_draft_event(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DRAFTCOW_VERBOSE_LOG
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
#if DRAFTCOW_VERBOSE_LOG
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
#if DRAFTCOW_VERBOSE_LOG
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

} // namespace detail

} // namespace draftcow
