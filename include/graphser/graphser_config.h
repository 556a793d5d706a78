// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file graphser_config.h
/// @brief Centralized compile-time configuration for graphser and its dependencies
///
/// This file defines the compile-time configuration for:
///   - immer: persistent maps backing the type/resource registry
///   - graphser itself: nesting limit and diagnostics
///
/// It MUST be included before any immer header. All graphser public headers
/// already include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(GRAPHSER_CONFIGURED)
#error "immer headers were included before graphser/graphser_config.h. " \
       "Please include graphser headers before any direct immer includes."
#endif

#define GRAPHSER_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Registry snapshots are consulted by one pass at a time and the
/// registry requires external synchronization, so refcounts need not be atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Codec Limits
// ============================================================

/// @brief Maximum nesting of tables during a single encode or decode pass.
///
/// Encoding deeper graphs throws NestingTooDeep; decoding a stream that nests
/// deeper throws MalformedStream. Back-references do not count as nesting.
#ifndef GRAPHSER_MAX_DEPTH
#define GRAPHSER_MAX_DEPTH 2048
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Write codec and registry diagnostics to stderr.
///
/// Enabled by default in debug builds, disabled with NDEBUG.
/// To explicitly enable: #define GRAPHSER_VERBOSE_LOG 1
#ifndef GRAPHSER_VERBOSE_LOG
#  if defined(NDEBUG)
#    define GRAPHSER_VERBOSE_LOG 0
#  else
#    define GRAPHSER_VERBOSE_LOG 1
#  endif
#endif

#ifdef GRAPHSER_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("graphser: registry refcounting is single-threaded")
#endif
#if GRAPHSER_VERBOSE_LOG
#pragma message("graphser: verbose diagnostics ENABLED")
#endif
#endif // GRAPHSER_CONFIG_VERBOSE
