#pragma once

// =============================================================================
// FILE: omix/binding/c_api/core/core.h
// BRIEF: C ABI for the omix multi-omics integration library
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for scripting-language FFI
//   - Opaque handles; callers never see C++ objects
//   - Thread-local error reporting
//   - Compatible with C99 and C++11+
//
// MEMORY MODEL:
//   - Every handle is created by an omix_*_create / *_fit / *_run call and
//     released with the matching omix_*_destroy
//   - Input buffers are copied on entry; caller memory is never written
//     except for explicit output buffers
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define OMIX_C_API_VERSION_MAJOR 1
#define OMIX_C_API_VERSION_MINOR 0
#define OMIX_C_API_VERSION_PATCH 0

#if defined(_MSC_VER)
    #define OMIX_C_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define OMIX_C_EXPORT __attribute__((visibility("default")))
#else
    #define OMIX_C_EXPORT
#endif

// Runtime version string (e.g., "1.0.0")
const char* omix_get_version(void);

// Build configuration (e.g., "float64+int64+openmp")
const char* omix_get_build_config(void);

// =============================================================================
// Basic Value Types (Must Match omix::Real and omix::Index)
// =============================================================================

#if defined(OMIX_USE_FLOAT32) || (defined(OMIX_PRECISION) && OMIX_PRECISION == 0)
typedef float omix_real_t;
#define OMIX_REAL_TYPE_NAME "float32"
#else
typedef double omix_real_t;
#define OMIX_REAL_TYPE_NAME "float64"
#endif

#if defined(OMIX_USE_INT32) || (defined(OMIX_INDEX_PRECISION) && OMIX_INDEX_PRECISION == 1)
typedef int32_t omix_index_t;
#define OMIX_INDEX_TYPE_NAME "int32"
#else
typedef int64_t omix_index_t;
#define OMIX_INDEX_TYPE_NAME "int64"
#endif

typedef size_t omix_size_t;

typedef int omix_bool_t;
#define OMIX_TRUE 1
#define OMIX_FALSE 0

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, matches omix::ErrorCode)
typedef int32_t omix_error_t;

#define OMIX_OK 0

// General errors (1-9)
#define OMIX_ERROR_UNKNOWN 1
#define OMIX_ERROR_INTERNAL 2
#define OMIX_ERROR_OUT_OF_MEMORY 3
#define OMIX_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define OMIX_ERROR_INVALID_ARGUMENT 10
#define OMIX_ERROR_DIMENSION_MISMATCH 11
#define OMIX_ERROR_DOMAIN_ERROR 12
#define OMIX_ERROR_RANGE_ERROR 13
#define OMIX_ERROR_INDEX_OUT_OF_BOUNDS 14

// Numerical errors (50-59)
#define OMIX_ERROR_NUMERICAL_ERROR 50
#define OMIX_ERROR_CONVERGENCE_ERROR 54

// Integration errors (60-69)
#define OMIX_ERROR_SHAPE_MISMATCH 60
#define OMIX_ERROR_DUPLICATE_SAMPLE 61
#define OMIX_ERROR_INSUFFICIENT_RANK 62
#define OMIX_ERROR_EMPTY_INTERSECTION 63

// Message for the last error on this thread, "No error" if none
const char* omix_get_last_error(void);

// Code of the last error on this thread, OMIX_OK if none
omix_error_t omix_get_last_error_code(void);

// Reset the error state of this thread
void omix_clear_error(void);

// =============================================================================
// Threading
// =============================================================================

// Limit worker threads used by parallel per-modality reductions (0 = hardware)
omix_error_t omix_set_num_threads(omix_size_t n);

omix_size_t omix_get_num_threads(void);

#ifdef __cplusplus
}
#endif
