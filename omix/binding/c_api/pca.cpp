// =============================================================================
// FILE: omix/binding/c_api/pca.cpp
// BRIEF: C API implementation for standalone PCA
// =============================================================================

#include "omix/binding/c_api/pca.h"
#include "omix/binding/c_api/core/internal.hpp"
#include "omix/kernel/dataset.hpp"
#include "omix/kernel/pca.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace omix;
using namespace omix::binding;

namespace {

template <typename Container>
omix_error_t copy_out(const Container& src, omix_real_t* out, omix_size_t capacity) {
    OMIX_C_API_CHECK_NULL(out, "Output buffer is null");
    OMIX_C_API_CHECK(capacity >= src.size(), OMIX_ERROR_DIMENSION_MISMATCH,
                     "Output buffer is too small");
    std::copy(src.begin(), src.end(), out);
    OMIX_C_API_RETURN_OK;
}

} // anonymous namespace

extern "C" {

OMIX_C_EXPORT omix_error_t omix_pca_fit(
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    omix_index_t n_components,
    omix_bool_t scale,
    omix_pca_model_t* out,
    omix_real_t* scores,
    omix_size_t scores_capacity) {

    OMIX_C_API_CHECK_NULL(data, "Input data pointer is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");
    OMIX_C_API_CHECK(n_samples > 0 && n_features > 0, OMIX_ERROR_INVALID_ARGUMENT,
                     "Matrix dimensions must be positive");
    OMIX_C_API_CHECK(scores == nullptr || n_components <= 0 ||
                     scores_capacity / static_cast<omix_size_t>(n_samples) >=
                         static_cast<omix_size_t>(n_components),
                     OMIX_ERROR_DIMENSION_MISMATCH, "Scores buffer is too small");

    OMIX_C_API_TRY
        RealView x(data, n_samples, n_features);
        kernel::dataset::check_finite(x, "PCA input");
        auto fitted = kernel::pca::fit_transform(x, n_components, scale != OMIX_FALSE);

        if (scores != nullptr) {
            std::copy(fitted.scores.values.begin(), fitted.scores.values.end(), scores);
        }
        *out = std::make_unique<omix_pca_model>(std::move(fitted.model)).release();
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_pca_destroy(omix_pca_model_t* model) {
    if (model == nullptr || *model == nullptr) {
        OMIX_C_API_RETURN_OK;
    }
    delete *model;
    *model = nullptr;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_pca_transform(
    omix_pca_model_t model,
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(model, "Model is null");
    OMIX_C_API_CHECK_NULL(data, "Input data pointer is null");
    OMIX_C_API_CHECK_NULL(out, "Output buffer is null");
    OMIX_C_API_CHECK(n_samples > 0 && n_features > 0, OMIX_ERROR_INVALID_ARGUMENT,
                     "Matrix dimensions must be positive");
    OMIX_C_API_CHECK(capacity / static_cast<omix_size_t>(n_samples) >=
                         static_cast<omix_size_t>(model->model.n_components),
                     OMIX_ERROR_DIMENSION_MISMATCH, "Output buffer is too small");

    OMIX_C_API_TRY
        RealView x(data, n_samples, n_features);
        kernel::dataset::check_finite(x, "PCA input");
        RealMatrix projected = kernel::pca::transform(model->model, x);
        std::copy(projected.values.begin(), projected.values.end(), out);
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_pca_n_components(omix_pca_model_t model, omix_index_t* out) {
    OMIX_C_API_CHECK_NULL(model, "Model is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = model->model.n_components;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_pca_n_features(omix_pca_model_t model, omix_index_t* out) {
    OMIX_C_API_CHECK_NULL(model, "Model is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = model->model.n_features;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_pca_components(
    omix_pca_model_t model,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(model, "Model is null");
    return copy_out(model->model.components.values, out, capacity);
}

OMIX_C_EXPORT omix_error_t omix_pca_explained_variance_ratio(
    omix_pca_model_t model,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(model, "Model is null");
    return copy_out(model->model.explained_variance_ratio, out, capacity);
}

OMIX_C_EXPORT omix_error_t omix_pca_mean(
    omix_pca_model_t model,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(model, "Model is null");
    return copy_out(model->model.mean, out, capacity);
}

} // extern "C"
