#pragma once

// =============================================================================
/// @file omix_c_api.h
/// @brief C ABI Interface for omix
///
/// Error Handling Pattern:
///
/// omix_error_t status = omix_function(...);
/// if (status != OMIX_OK) {
///     const char* error = omix_get_last_error();
///     // Handle error
/// }
///
/// Module Organization:
///
/// - Core: version, build config, last error, thread count
/// - Integration: integrator and result handles
/// - PCA: standalone model fit / transform / introspection
// =============================================================================

#include "omix/binding/c_api/core/core.h"
#include "omix/binding/c_api/integrate.h"
#include "omix/binding/c_api/pca.h"
