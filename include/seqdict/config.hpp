#pragma once

/// @file config.hpp
/// @brief Configuration macros for the seqdict library.
///
/// Controls:
///   - Branch prediction hints
///   - Document nesting limit for the reader
///   - Attempt limit for unique id generation
///   - Name of the spdlog logger the library logs through

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SEQDICT_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SEQDICT_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define SEQDICT_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define SEQDICT_LIKELY(x)   (x)
    #define SEQDICT_UNLIKELY(x) (x)
    #define SEQDICT_NOINLINE    __declspec(noinline)
#else
    #define SEQDICT_LIKELY(x)   (x)
    #define SEQDICT_UNLIKELY(x) (x)
    #define SEQDICT_NOINLINE
#endif

// =====================================================================
// Recursion depth limit for the document reader
// =====================================================================

#if !defined(SEQDICT_MAX_DEPTH)
    #define SEQDICT_MAX_DEPTH 512
#endif

// =====================================================================
// Unique id generation
// =====================================================================
// Number of random draws GuidRegistry::generate() makes before giving up.

#if !defined(SEQDICT_GUID_MAX_ATTEMPTS)
    #define SEQDICT_GUID_MAX_ATTEMPTS 100
#endif

// =====================================================================
// Logging
// =====================================================================

#if !defined(SEQDICT_LOGGER_NAME)
    #define SEQDICT_LOGGER_NAME "seqdict"
#endif
