#pragma once

// =============================================================================
// FILE: omix/binding/c_api/pca.h
// BRIEF: C API for standalone principal component analysis
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include "omix/binding/c_api/core/core.h"

typedef struct omix_pca_model omix_pca_model;
typedef omix_pca_model* omix_pca_model_t;

// Fit PCA on a row-major n_samples x n_features matrix.
// n_components must lie in [1, min(n_samples, n_features) - 1].
// scores (optional, may be NULL) receives n_samples x n_components values;
// scores_capacity must be at least that when scores is given.
omix_error_t omix_pca_fit(
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    omix_index_t n_components,
    omix_bool_t scale,
    omix_pca_model_t* out,
    omix_real_t* scores,
    omix_size_t scores_capacity
);

omix_error_t omix_pca_destroy(omix_pca_model_t* model);

// Project n_samples new rows; capacity must be >= n_samples x n_components
omix_error_t omix_pca_transform(
    omix_pca_model_t model,
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    omix_real_t* out,
    omix_size_t capacity
);

omix_error_t omix_pca_n_components(omix_pca_model_t model, omix_index_t* out);

omix_error_t omix_pca_n_features(omix_pca_model_t model, omix_index_t* out);

// Row-major n_components x n_features loadings
omix_error_t omix_pca_components(omix_pca_model_t model, omix_real_t* out, omix_size_t capacity);

omix_error_t omix_pca_explained_variance_ratio(
    omix_pca_model_t model,
    omix_real_t* out,
    omix_size_t capacity
);

omix_error_t omix_pca_mean(omix_pca_model_t model, omix_real_t* out, omix_size_t capacity);

#ifdef __cplusplus
}
#endif
