#pragma once

// =============================================================================
// FILE: omix/binding/c_api/integrate.h
// BRIEF: C API for two-stage multi-omics integration
// =============================================================================
//
// Typical use:
//
//   omix_integrator_t it;
//   omix_integrator_create(&it);
//   omix_integrator_add_modality(it, "rna", data, n, f, ids);
//   ...
//   omix_result_t res;
//   omix_integrator_run(it, &res);
//   omix_result_shape(res, &rows, &cols);
//   omix_result_embedding(res, out, rows * cols);
//   omix_result_destroy(&res);
//   omix_integrator_destroy(&it);
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include "omix/binding/c_api/core/core.h"

typedef struct omix_integrator omix_integrator;
typedef struct omix_result omix_result;

typedef omix_integrator* omix_integrator_t;
typedef omix_result* omix_result_t;

// =============================================================================
// Integrator Lifecycle
// =============================================================================

omix_error_t omix_integrator_create(omix_integrator_t* out);

// Sets *integrator to NULL; NULL or already-destroyed handles are accepted
omix_error_t omix_integrator_destroy(omix_integrator_t* integrator);

// Copy a row-major n_samples x n_features matrix and its sample identifiers.
// Validation happens at run time, so shape errors surface from
// omix_integrator_run together with everything else.
omix_error_t omix_integrator_add_modality(
    omix_integrator_t integrator,
    const char* name,
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    const char* const* sample_ids,
    omix_size_t n_sample_ids
);

omix_error_t omix_integrator_n_modalities(omix_integrator_t integrator, omix_size_t* out);

// =============================================================================
// Configuration
// =============================================================================

omix_error_t omix_integrator_set_components(
    omix_integrator_t integrator,
    const char* modality,
    omix_index_t n_components
);

omix_error_t omix_integrator_set_scale(
    omix_integrator_t integrator,
    const char* modality,
    omix_bool_t scale
);

omix_error_t omix_integrator_set_default_components(
    omix_integrator_t integrator,
    omix_index_t n_components
);

omix_error_t omix_integrator_set_joint_components(
    omix_integrator_t integrator,
    omix_index_t n_components
);

// Concatenation order; n_names == 0 restores insertion order
omix_error_t omix_integrator_set_order(
    omix_integrator_t integrator,
    const char* const* names,
    omix_size_t n_names
);

omix_error_t omix_integrator_set_parallel(omix_integrator_t integrator, omix_bool_t parallel);

omix_error_t omix_integrator_set_verbose(omix_integrator_t integrator, omix_bool_t verbose);

// =============================================================================
// Run
// =============================================================================

// On failure *out is left untouched and no result is allocated
omix_error_t omix_integrator_run(omix_integrator_t integrator, omix_result_t* out);

// =============================================================================
// Result Access
// =============================================================================

omix_error_t omix_result_destroy(omix_result_t* result);

omix_error_t omix_result_shape(
    omix_result_t result,
    omix_index_t* n_rows,
    omix_index_t* n_cols
);

// Copy the row-major embedding; capacity must be >= rows * cols
omix_error_t omix_result_embedding(
    omix_result_t result,
    omix_real_t* out,
    omix_size_t capacity
);

// Row label i; the string lives as long as the result handle
omix_error_t omix_result_sample_id(
    omix_result_t result,
    omix_index_t row,
    const char** out
);

omix_error_t omix_result_n_warnings(omix_result_t result, omix_size_t* out);

// Warning text i; the string lives as long as the result handle
omix_error_t omix_result_warning(
    omix_result_t result,
    omix_size_t index,
    const char** out
);

omix_error_t omix_result_n_modalities(omix_result_t result, omix_size_t* out);

// Report for modality i in concatenation order
omix_error_t omix_result_modality(
    omix_result_t result,
    omix_size_t index,
    const char** name,
    omix_index_t* requested,
    omix_index_t* effective
);

// Explained variance ratio of modality i; capacity must be >= effective
omix_error_t omix_result_modality_variance_ratio(
    omix_result_t result,
    omix_size_t index,
    omix_real_t* out,
    omix_size_t capacity
);

omix_error_t omix_result_joint_components(
    omix_result_t result,
    omix_index_t* requested,
    omix_index_t* effective
);

// Capacity must be >= joint effective components
omix_error_t omix_result_joint_variance_ratio(
    omix_result_t result,
    omix_real_t* out,
    omix_size_t capacity
);

#ifdef __cplusplus
}
#endif
