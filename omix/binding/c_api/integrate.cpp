// =============================================================================
// FILE: omix/binding/c_api/integrate.cpp
// BRIEF: C API implementation for multi-omics integration
// =============================================================================

#include "omix/binding/c_api/integrate.h"
#include "omix/binding/c_api/core/internal.hpp"
#include "omix/kernel/integrate.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace omix;
using namespace omix::binding;

namespace {

omix_error_t copy_out(const std::vector<Real>& src, omix_real_t* out, omix_size_t capacity) {
    OMIX_C_API_CHECK(capacity >= src.size(), OMIX_ERROR_DIMENSION_MISMATCH,
                     "Output buffer is too small");
    std::copy(src.begin(), src.end(), out);
    OMIX_C_API_RETURN_OK;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Integrator Lifecycle
// =============================================================================

OMIX_C_EXPORT omix_error_t omix_integrator_create(omix_integrator_t* out) {
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    OMIX_C_API_TRY
        *out = new omix_integrator();
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_integrator_destroy(omix_integrator_t* integrator) {
    if (integrator == nullptr || *integrator == nullptr) {
        OMIX_C_API_RETURN_OK;
    }
    delete *integrator;
    *integrator = nullptr;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_integrator_add_modality(
    omix_integrator_t integrator,
    const char* name,
    const omix_real_t* data,
    omix_index_t n_samples,
    omix_index_t n_features,
    const char* const* sample_ids,
    omix_size_t n_sample_ids) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK_NULL(name, "Modality name is null");
    OMIX_C_API_CHECK(n_samples >= 0 && n_features >= 0, OMIX_ERROR_INVALID_ARGUMENT,
                     "Matrix dimensions must be non-negative");
    OMIX_C_API_CHECK(n_samples == 0 ||
                     n_features <= std::numeric_limits<omix_index_t>::max() / n_samples,
                     OMIX_ERROR_INVALID_ARGUMENT, "Matrix dimensions are too large");
    OMIX_C_API_CHECK(data != nullptr || n_samples == 0 || n_features == 0, OMIX_ERROR_NULL_POINTER,
                     "Matrix data is null");
    OMIX_C_API_CHECK(sample_ids != nullptr || n_sample_ids == 0, OMIX_ERROR_NULL_POINTER,
                     "Sample identifier array is null");

    OMIX_C_API_TRY
        OwnedModality mod;
        mod.name = name;
        mod.values = RealMatrix(n_samples, n_features);
        if (mod.values.size() > 0) {
            std::memcpy(mod.values.data(), data, mod.values.size() * sizeof(Real));
        }
        mod.sample_ids.reserve(n_sample_ids);
        for (omix_size_t i = 0; i < n_sample_ids; ++i) {
            OMIX_CHECK_NULL(sample_ids[i], "Sample identifier " + std::to_string(i) + " is null");
            mod.sample_ids.emplace_back(sample_ids[i]);
        }
        integrator->modalities.push_back(std::move(mod));
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_integrator_n_modalities(
    omix_integrator_t integrator,
    omix_size_t* out) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = integrator->modalities.size();
    OMIX_C_API_RETURN_OK;
}

// =============================================================================
// Configuration
// =============================================================================

OMIX_C_EXPORT omix_error_t omix_integrator_set_components(
    omix_integrator_t integrator,
    const char* modality,
    omix_index_t n_components) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK_NULL(modality, "Modality name is null");
    OMIX_C_API_CHECK(n_components >= 1, OMIX_ERROR_INVALID_ARGUMENT,
                     "n_components must be >= 1");

    OMIX_C_API_TRY
        integrator->config.modality[modality].n_components = n_components;
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_scale(
    omix_integrator_t integrator,
    const char* modality,
    omix_bool_t scale) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK_NULL(modality, "Modality name is null");

    OMIX_C_API_TRY
        integrator->config.modality[modality].scale = (scale != OMIX_FALSE);
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_default_components(
    omix_integrator_t integrator,
    omix_index_t n_components) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK(n_components >= 1, OMIX_ERROR_INVALID_ARGUMENT,
                     "n_components must be >= 1");

    integrator->config.default_components = n_components;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_joint_components(
    omix_integrator_t integrator,
    omix_index_t n_components) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK(n_components >= 1, OMIX_ERROR_INVALID_ARGUMENT,
                     "n_components must be >= 1");

    integrator->config.joint_components = n_components;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_order(
    omix_integrator_t integrator,
    const char* const* names,
    omix_size_t n_names) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK(names != nullptr || n_names == 0, OMIX_ERROR_NULL_POINTER,
                     "Name array is null");

    OMIX_C_API_TRY
        std::vector<std::string> order;
        order.reserve(n_names);
        for (omix_size_t i = 0; i < n_names; ++i) {
            OMIX_CHECK_NULL(names[i], "Modality name " + std::to_string(i) + " is null");
            order.emplace_back(names[i]);
        }
        integrator->config.modality_order = std::move(order);
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_parallel(
    omix_integrator_t integrator,
    omix_bool_t parallel) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    integrator->config.parallel = (parallel != OMIX_FALSE);
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_integrator_set_verbose(
    omix_integrator_t integrator,
    omix_bool_t verbose) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    integrator->config.verbose = (verbose != OMIX_FALSE);
    OMIX_C_API_RETURN_OK;
}

// =============================================================================
// Run
// =============================================================================

OMIX_C_EXPORT omix_error_t omix_integrator_run(
    omix_integrator_t integrator,
    omix_result_t* out) {

    OMIX_C_API_CHECK_NULL(integrator, "Integrator is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    OMIX_C_API_TRY
        std::vector<kernel::dataset::ModalityDataset> datasets;
        datasets.reserve(integrator->modalities.size());
        for (const auto& mod : integrator->modalities) {
            datasets.push_back(mod.dataset());
        }

        auto handle = std::make_unique<omix_result>(
            kernel::integrate::integrate(datasets, integrator->config));
        *out = handle.release();
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

// =============================================================================
// Result Access
// =============================================================================

OMIX_C_EXPORT omix_error_t omix_result_destroy(omix_result_t* result) {
    if (result == nullptr || *result == nullptr) {
        OMIX_C_API_RETURN_OK;
    }
    delete *result;
    *result = nullptr;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_shape(
    omix_result_t result,
    omix_index_t* n_rows,
    omix_index_t* n_cols) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(n_rows, "Output pointer is null");
    OMIX_C_API_CHECK_NULL(n_cols, "Output pointer is null");

    *n_rows = result->result.embedding.rows;
    *n_cols = result->result.embedding.cols;
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_embedding(
    omix_result_t result,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output buffer is null");

    return copy_out(result->result.embedding.values, out, capacity);
}

OMIX_C_EXPORT omix_error_t omix_result_sample_id(
    omix_result_t result,
    omix_index_t row,
    const char** out) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    const auto& ids = result->result.sample_ids;
    OMIX_C_API_CHECK(row >= 0 && static_cast<Size>(row) < ids.size(),
                     OMIX_ERROR_INDEX_OUT_OF_BOUNDS, "Row index out of range");

    *out = ids[static_cast<Size>(row)].c_str();
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_n_warnings(omix_result_t result, omix_size_t* out) {
    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = result->warning_messages.size();
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_warning(
    omix_result_t result,
    omix_size_t index,
    const char** out) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");
    OMIX_C_API_CHECK(index < result->warning_messages.size(),
                     OMIX_ERROR_INDEX_OUT_OF_BOUNDS, "Warning index out of range");

    *out = result->warning_messages[index].c_str();
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_n_modalities(omix_result_t result, omix_size_t* out) {
    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = result->result.modalities.size();
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_modality(
    omix_result_t result,
    omix_size_t index,
    const char** name,
    omix_index_t* requested,
    omix_index_t* effective) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK(index < result->result.modalities.size(),
                     OMIX_ERROR_INDEX_OUT_OF_BOUNDS, "Modality index out of range");

    const auto& report = result->result.modalities[index];
    if (name != nullptr) {
        *name = report.name.c_str();
    }
    if (requested != nullptr) {
        *requested = report.requested;
    }
    if (effective != nullptr) {
        *effective = report.effective;
    }
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_modality_variance_ratio(
    omix_result_t result,
    omix_size_t index,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output buffer is null");
    OMIX_C_API_CHECK(index < result->result.modalities.size(),
                     OMIX_ERROR_INDEX_OUT_OF_BOUNDS, "Modality index out of range");

    return copy_out(result->result.modalities[index].explained_variance_ratio, out, capacity);
}

OMIX_C_EXPORT omix_error_t omix_result_joint_components(
    omix_result_t result,
    omix_index_t* requested,
    omix_index_t* effective) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");

    if (requested != nullptr) {
        *requested = result->result.joint_requested;
    }
    if (effective != nullptr) {
        *effective = result->result.joint_effective;
    }
    OMIX_C_API_RETURN_OK;
}

OMIX_C_EXPORT omix_error_t omix_result_joint_variance_ratio(
    omix_result_t result,
    omix_real_t* out,
    omix_size_t capacity) {

    OMIX_C_API_CHECK_NULL(result, "Result is null");
    OMIX_C_API_CHECK_NULL(out, "Output buffer is null");

    return copy_out(result->result.joint_explained_variance_ratio, out, capacity);
}

} // extern "C"
