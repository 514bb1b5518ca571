// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef HSPLIT_CONFIG_HPP
#define HSPLIT_CONFIG_HPP

// Compile-time configuration and feature-detection for hsplit.
//
// Baseline: C++20
//
// This header intentionally contains only preprocessor logic. Every default
// below may be overridden by defining the macro before the first hsplit
// include (or on the compiler command line).

// -------- Run-time configuration defaults --------

#ifndef HSPLIT_DEFAULT_WINDOW_SIZE
// Width of the rolling-hash window in bytes.
#define HSPLIT_DEFAULT_WINDOW_SIZE 64
#endif

#ifndef HSPLIT_DEFAULT_SEED
// Personalization constant mixed into the rolling checksum (the RRS1
// offset). Deployments that want boundaries unrelated to other users of the
// same data pick a different value.
#define HSPLIT_DEFAULT_SEED 31
#endif

#ifndef HSPLIT_DEFAULT_THRESHOLD_BITS
// Trailing zero bits a digest needs to be a boundary at all (about 8 KiB
// chunks on random input).
#define HSPLIT_DEFAULT_THRESHOLD_BITS 13
#endif

#ifndef HSPLIT_DEFAULT_LEVEL_BITS
// Extra trailing zero bits per tree level (fan-out about 2^LEVEL_BITS).
#define HSPLIT_DEFAULT_LEVEL_BITS 4
#endif

#ifndef HSPLIT_DEFAULT_MAX_LEVEL
#define HSPLIT_DEFAULT_MAX_LEVEL 4
#endif

#ifndef HSPLIT_DEFAULT_MIN_CHUNK_SIZE
#define HSPLIT_DEFAULT_MIN_CHUNK_SIZE 0
#endif

#ifndef HSPLIT_DEFAULT_MAX_CHUNK_SIZE
// Safety-valve span. 0 disables forced chunk closures.
#define HSPLIT_DEFAULT_MAX_CHUNK_SIZE (2u * 1024u * 1024u)
#endif

#ifndef HSPLIT_DEFAULT_MAX_CHILDREN
// Safety-valve fan-out. 0 disables forced node closures.
#define HSPLIT_DEFAULT_MAX_CHILDREN 256
#endif

// -------- Fixed-capacity storage defaults --------

#ifndef HSPLIT_FIXED_WINDOW_CAPACITY
#define HSPLIT_FIXED_WINDOW_CAPACITY 256
#endif

#ifndef HSPLIT_FIXED_CHILD_CAPACITY
#define HSPLIT_FIXED_CHILD_CAPACITY 256
#endif

#ifndef HSPLIT_FIXED_LEVEL_CAPACITY
#define HSPLIT_FIXED_LEVEL_CAPACITY 16
#endif

// -------- Diagnostics --------

#ifndef HSPLIT_LOG_LEVEL_ENV
// Environment variable read once to pick the initial log level
// (trace, debug, info, warn, err, critical, off).
#define HSPLIT_LOG_LEVEL_ENV "HSPLIT_LOG_LEVEL"
#endif

#ifndef HSPLIT_DEFAULT_LOG_LEVEL
#define HSPLIT_DEFAULT_LOG_LEVEL "warn"
#endif

// HSPLIT_ENABLE_PROFILING: define to time push/flush calls (see profiling.hpp).

// -------- Language version detection --------

#if defined(_MSVC_LANG)
#define HSPLIT_CPP_LANG _MSVC_LANG
#else
#define HSPLIT_CPP_LANG __cplusplus
#endif

#if HSPLIT_CPP_LANG >= 202302L
#define HSPLIT_HAS_CPP23 1
#else
#define HSPLIT_HAS_CPP23 0
#endif

#if HSPLIT_CPP_LANG >= 202002L
#define HSPLIT_HAS_CPP20 1
#else
#define HSPLIT_HAS_CPP20 0
#endif

#if !HSPLIT_HAS_CPP20
#error "hsplit requires C++20"
#endif

// Attributes / hints
#define HSPLIT_NODISCARD [[nodiscard]]

#if defined(__GNUC__) || defined(__clang__)
#define HSPLIT_LIKELY(x) __builtin_expect(!!(x), 1)
#define HSPLIT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define HSPLIT_LIKELY(x) (x)
#define HSPLIT_UNLIKELY(x) (x)
#endif

#endif  // HSPLIT_CONFIG_HPP
