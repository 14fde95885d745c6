#pragma once

// =============================================================================
/// @file config.hpp
/// @brief omix Configuration Header
///
/// Platform detection, threading backend selection and precision control
/// for the omix multi-omics integration library.
///
/// @section Threading Backends
///
/// Supported backends:
/// - `OMIX_BACKEND_SERIAL`: Single-threaded execution
/// - `OMIX_BACKEND_OPENMP`: OpenMP parallel execution
/// - `OMIX_BACKEND_TBB`: Intel Threading Building Blocks
///
/// @section Precision Control
///
/// Floating-point precision is controlled via `OMIX_PRECISION`:
/// - `0`: float32
/// - `1`: float64 (default)
///
/// =============================================================================

// =============================================================================
// SECTION 1: Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define OMIX_OS_WINDOWS
#elif defined(__linux__) || defined(__linux)
    #define OMIX_OS_LINUX
#endif

// =============================================================================
// SECTION 2: Threading Backend Selection
// =============================================================================
///
/// Backend selection follows this priority:
/// 1. User-explicit definition (highest priority)
/// 2. Platform-specific defaults (if no user definition)
/// 3. Validation (exactly one backend must be selected)
///

#if !defined(OMIX_BACKEND_SERIAL) && !defined(OMIX_BACKEND_OPENMP) && \
    !defined(OMIX_BACKEND_TBB)
    #if defined(OMIX_OS_WINDOWS) || defined(OMIX_OS_LINUX)
        // Windows/Linux: OpenMP
        #define OMIX_BACKEND_OPENMP
    #else
        // Other platforms (macOS ships without libomp) stay serial unless asked otherwise
        #define OMIX_BACKEND_SERIAL
    #endif
#endif

#if (defined(OMIX_BACKEND_SERIAL) && (defined(OMIX_BACKEND_OPENMP) || defined(OMIX_BACKEND_TBB))) || \
    (defined(OMIX_BACKEND_OPENMP) && defined(OMIX_BACKEND_TBB))
    #error "omix Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(OMIX_BACKEND_OPENMP)
    #define OMIX_USE_OPENMP 1
    #define OMIX_BACKEND_NAME "openmp"
#elif defined(OMIX_BACKEND_TBB)
    #define OMIX_USE_TBB 1
    #define OMIX_BACKEND_NAME "tbb"
#else
    #define OMIX_USE_SERIAL 1
    #define OMIX_BACKEND_NAME "serial"
#endif

// =============================================================================
// SECTION 3: Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default, PCA orientation is sensitive to rounding)
#ifndef OMIX_PRECISION
    #define OMIX_PRECISION 1
#endif

#if OMIX_PRECISION == 0
    #define OMIX_USE_FLOAT32
#elif OMIX_PRECISION == 1
    #define OMIX_USE_FLOAT64
#else
    #error "omix Configuration Error: Invalid OMIX_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// Integer index type precision selection
// 1: int32
// 2: int64 (default)
#ifndef OMIX_INDEX_PRECISION
    #define OMIX_INDEX_PRECISION 2
#endif

#if OMIX_INDEX_PRECISION == 1
    #define OMIX_USE_INT32
#elif OMIX_INDEX_PRECISION == 2
    #define OMIX_USE_INT64
#else
    #error "omix Configuration Error: Invalid OMIX_INDEX_PRECISION value. " \
           "Must be 1 (int32) or 2 (int64)."
#endif

// =============================================================================
// SECTION 4: Integration Defaults
// =============================================================================

#include <cstddef>
#include <cstdint>

namespace omix::defaults {
    // Components kept by every reduction stage when nothing is configured
    inline constexpr std::int64_t N_COMPONENTS = 10;

    // Stage label used for the joint reduction in reports and warnings
    inline constexpr const char* JOINT_STAGE = "joint";
}
