#pragma once

#include "omix/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: omix/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define OMIX_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define OMIX_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define OMIX_LIKELY(x)   (x)
    #define OMIX_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define OMIX_NODISCARD [[nodiscard]]
    #else
        #define OMIX_NODISCARD
    #endif
#else
    #define OMIX_NODISCARD
#endif

// =============================================================================
// SECTION 3: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define OMIX_FORCE_INLINE __forceinline
    #define OMIX_RESTRICT __restrict
    #define OMIX_EXPORT __declspec(dllexport)
#else
    #define OMIX_FORCE_INLINE inline __attribute__((always_inline))
    #define OMIX_RESTRICT __restrict__
    #define OMIX_EXPORT __attribute__((visibility("default")))
#endif

// Hot path: optimize aggressively
#if defined(__clang__) || defined(__GNUC__)
    #define OMIX_HOT __attribute__((hot))
#else
    #define OMIX_HOT
#endif

// =============================================================================
// SECTION 4: Prefetching
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define OMIX_PREFETCH_READ(ptr, locality) __builtin_prefetch((ptr), 0, (locality))
#else
    #define OMIX_PREFETCH_READ(ptr, locality) ((void)0)
#endif
