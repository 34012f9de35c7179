// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file draftcow_config.h
/// @brief Centralized configuration for draftcow and its dependencies
///
/// Compile-time settings for the third-party libraries draftcow builds on:
///   - immer: persistent containers backing every heap node
///   - lager: the store used by draftcow::Store
///   - zug: transducers pulled in by lager
///   - boost: header-only pieces lager depends on (hana)
///
/// It MUST be included before any library headers. Every draftcow public
/// header includes it first, so users of draftcow headers get consistent
/// settings without defining anything themselves.
///
/// Drafting is single-writer per scope, so immer runs without thread safety.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DRAFTCOW_CONFIGURED)
#error "immer headers were included before draftcow/draftcow_config.h. " \
       "Please include draftcow headers before any direct immer includes."
#endif

#define DRAFTCOW_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting and lock-free free lists.
///
/// A DraftScope and all of its drafts belong to one flow of control.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

/// @brief Out-of-range access inside immer asserts instead of throwing.
///
/// draftcow validates indices itself and throws std::out_of_range first.
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Lager Settings
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// draftcow::Store builds its store without dependencies; the checks only
/// cost compile time (boost::hana intersections in lager/deps.hpp).
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Settings
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); only header-only Boost is used.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// draftcow Settings
// ============================================================

/// @brief Default reconciliation depth ceiling (ProducerOptions::max_depth)
#ifndef DRAFTCOW_DEFAULT_MAX_DEPTH
#define DRAFTCOW_DEFAULT_MAX_DEPTH 1000
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DRAFTCOW_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("draftcow: Thread safety DISABLED (single writer per scope)")
#else
#pragma message("draftcow: Thread safety ENABLED")
#endif

#if ZUG_VARIANT_STD
#pragma message("draftcow: Using std::variant for zug")
#endif

#if BOOST_ALL_NO_LIB
#pragma message("draftcow: Boost auto-linking DISABLED")
#endif
#endif // DRAFTCOW_CONFIG_VERBOSE
