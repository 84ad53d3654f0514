// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_optics_config.h
/// @brief Centralized configuration for lager_optics and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by lager_optics:
///   - immer: Immutable containers traversed by the bundled strategies
///   - zug: Function composition used by lager lenses
///   - lager: Lens functor protocol (view/set/over, getset, attr)
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All lager_optics public headers already include this file, so users who only
/// use lager_optics headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LAGER_OPTICS_CONFIGURED)
#error "immer headers were included before lager_optics/lager_optics_config.h. " \
       "Please include lager_optics headers before any direct immer includes."
#endif

#define LAGER_OPTICS_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep thread-safe reference counting
///
/// Traversals are immutable values and may be shared between threads, and so
/// may the immer containers they rebuild. Define IMMER_NO_THREAD_SAFETY=1
/// before including lager_optics to trade that guarantee for speed in
/// single-threaded programs.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
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

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef LAGER_OPTICS_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("lager_optics: immer thread safety DISABLED")
#else
#pragma message("lager_optics: immer thread safety ENABLED")
#endif

#if ZUG_VARIANT_STD
#pragma message("lager_optics: zug uses std::variant")
#endif
#endif // LAGER_OPTICS_CONFIG_VERBOSE
