// =============================================================================
// omix - Error Handling Tests
// =============================================================================
//
// Tests error reporting system defined in core.h.
//
// =============================================================================

#include "test.hpp"

#include <string>

using namespace omix::test;

OMIX_TEST_BEGIN

// =============================================================================
// Version Information
// =============================================================================

OMIX_TEST_UNIT(version_info_exists) {
    const char* version = omix_get_version();
    OMIX_ASSERT_NOT_NULL(version);
    OMIX_ASSERT_TRUE(version[0] != '\0');

    const std::string expected = std::to_string(OMIX_C_API_VERSION_MAJOR) + "." +
                                 std::to_string(OMIX_C_API_VERSION_MINOR) + "." +
                                 std::to_string(OMIX_C_API_VERSION_PATCH);
    OMIX_ASSERT_STR_EQ(expected, version);
}

OMIX_TEST_UNIT(build_config_names_precision) {
    const std::string config = omix_get_build_config();
    OMIX_ASSERT_STR_CONTAINS(config, OMIX_REAL_TYPE_NAME);
    OMIX_ASSERT_STR_CONTAINS(config, OMIX_INDEX_TYPE_NAME);
}

// =============================================================================
// Error Code Constants
// =============================================================================

OMIX_TEST_UNIT(error_codes_defined) {
    OMIX_ASSERT_EQ(OMIX_OK, 0);

    OMIX_ASSERT_EQ(OMIX_ERROR_UNKNOWN, 1);
    OMIX_ASSERT_EQ(OMIX_ERROR_NULL_POINTER, 4);
    OMIX_ASSERT_EQ(OMIX_ERROR_INVALID_ARGUMENT, 10);
    OMIX_ASSERT_EQ(OMIX_ERROR_DIMENSION_MISMATCH, 11);
    OMIX_ASSERT_EQ(OMIX_ERROR_DOMAIN_ERROR, 12);
    OMIX_ASSERT_EQ(OMIX_ERROR_RANGE_ERROR, 13);

    OMIX_ASSERT_EQ(OMIX_ERROR_SHAPE_MISMATCH, 60);
    OMIX_ASSERT_EQ(OMIX_ERROR_DUPLICATE_SAMPLE, 61);
    OMIX_ASSERT_EQ(OMIX_ERROR_INSUFFICIENT_RANK, 62);
    OMIX_ASSERT_EQ(OMIX_ERROR_EMPTY_INTERSECTION, 63);
}

// =============================================================================
// Error Reporting Functions
// =============================================================================

OMIX_TEST_UNIT(error_initial_state) {
    omix_clear_error();

    OMIX_ASSERT_EQ(omix_get_last_error_code(), OMIX_OK);
    OMIX_ASSERT_STR_EQ(omix_get_last_error(), "No error");
}

OMIX_TEST_UNIT(error_after_null_handle) {
    omix_clear_error();

    omix_index_t rows = 0;
    omix_index_t cols = 0;
    const omix_error_t err = omix_result_shape(nullptr, &rows, &cols);

    OMIX_ASSERT_EQ(err, OMIX_ERROR_NULL_POINTER);
    OMIX_ASSERT_EQ(omix_get_last_error_code(), OMIX_ERROR_NULL_POINTER);
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "null");
}

OMIX_TEST_UNIT(success_clears_previous_error) {
    omix_index_t rows = 0;
    omix_index_t cols = 0;
    OMIX_ASSERT_EQ(omix_result_shape(nullptr, &rows, &cols), OMIX_ERROR_NULL_POINTER);

    Integrator it;
    OMIX_ASSERT_EQ(omix_integrator_create(it.ptr()), OMIX_OK);
    OMIX_ASSERT_EQ(omix_get_last_error_code(), OMIX_OK);
}

OMIX_TEST_UNIT(destroy_null_is_ok) {
    OMIX_ASSERT_EQ(omix_integrator_destroy(nullptr), OMIX_OK);

    omix_integrator_t none = nullptr;
    OMIX_ASSERT_EQ(omix_integrator_destroy(&none), OMIX_OK);

    omix_result_t no_result = nullptr;
    OMIX_ASSERT_EQ(omix_result_destroy(&no_result), OMIX_OK);

    omix_pca_model_t no_model = nullptr;
    OMIX_ASSERT_EQ(omix_pca_destroy(&no_model), OMIX_OK);
}

OMIX_TEST_UNIT(destroy_resets_handle) {
    omix_integrator_t it = nullptr;
    OMIX_ASSERT_EQ(omix_integrator_create(&it), OMIX_OK);
    OMIX_ASSERT_NOT_NULL(it);
    OMIX_ASSERT_EQ(omix_integrator_destroy(&it), OMIX_OK);
    OMIX_ASSERT_NULL(it);
}

// =============================================================================
// Exception Mapping
// =============================================================================

OMIX_TEST_UNIT(integration_error_reaches_caller) {
    Integrator it;
    OMIX_ASSERT_EQ(omix_integrator_create(it.ptr()), OMIX_OK);

    Result res;
    OMIX_ASSERT_EQ(omix_integrator_run(it.get(), res.ptr()), OMIX_ERROR_INVALID_ARGUMENT);
    OMIX_ASSERT_FALSE(res.valid());
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "At least one modality");
}

OMIX_TEST_UNIT(last_error_tracks_latest_failure) {
    omix_clear_error();
    OMIX_ASSERT_EQ(omix_integrator_set_default_components(nullptr, 3), OMIX_ERROR_NULL_POINTER);
    const std::string first = omix_get_last_error();

    Integrator it;
    OMIX_ASSERT_EQ(omix_integrator_create(it.ptr()), OMIX_OK);
    OMIX_ASSERT_EQ(omix_integrator_set_default_components(it.get(), 0), OMIX_ERROR_INVALID_ARGUMENT);
    const std::string second = omix_get_last_error();

    OMIX_ASSERT_NE(first, second);
    OMIX_ASSERT_EQ(omix_get_last_error_code(), OMIX_ERROR_INVALID_ARGUMENT);
}

// =============================================================================
// Threading
// =============================================================================

OMIX_TEST_UNIT(thread_count_roundtrip) {
    OMIX_ASSERT_EQ(omix_set_num_threads(2), OMIX_OK);
    OMIX_ASSERT_GE(omix_get_num_threads(), static_cast<omix_size_t>(1));
    OMIX_ASSERT_EQ(omix_set_num_threads(0), OMIX_OK);
    OMIX_ASSERT_GE(omix_get_num_threads(), static_cast<omix_size_t>(1));
}

OMIX_TEST_END

OMIX_TEST_MAIN()
