#pragma once

// =============================================================================
// FILE: omix/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ structures behind the omix C API handles
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
// =============================================================================

#include "omix/binding/c_api/core/core.h"
#include "omix/core/type.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"
#include "omix/kernel/dataset.hpp"
#include "omix/kernel/integrate.hpp"
#include "omix/kernel/pca.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace omix::binding {

// =============================================================================
// Owned Modality (copied at omix_integrator_add_modality)
// =============================================================================

struct OwnedModality {
    std::string name;
    RealMatrix values;
    std::vector<std::string> sample_ids;

    OMIX_NODISCARD kernel::dataset::ModalityDataset dataset() const {
        return kernel::dataset::ModalityDataset{name, values.view(), sample_ids};
    }
};

// =============================================================================
// Handle Payloads
// =============================================================================

struct IntegratorState {
    std::vector<OwnedModality> modalities;
    kernel::integrate::IntegrationConfig config;

    IntegratorState() = default;
    IntegratorState(const IntegratorState&) = delete;
    IntegratorState& operator=(const IntegratorState&) = delete;
};

struct ResultState {
    kernel::integrate::IntegrationResult result;
    std::vector<std::string> warning_messages;  // backing storage for const char* returns

    explicit ResultState(kernel::integrate::IntegrationResult&& r)
        : result(std::move(r)) {
        warning_messages.reserve(result.warnings.size());
        for (const auto& w : result.warnings) {
            warning_messages.push_back(w.message());
        }
    }

    ResultState(const ResultState&) = delete;
    ResultState& operator=(const ResultState&) = delete;
};

struct PcaModelState {
    kernel::pca::PcaModel model;

    explicit PcaModelState(kernel::pca::PcaModel&& m) : model(std::move(m)) {}

    PcaModelState(const PcaModelState&) = delete;
    PcaModelState& operator=(const PcaModelState&) = delete;
};

static_assert(!std::is_copy_constructible_v<ResultState>,
              "ResultState must not be copyable");
static_assert(std::is_same_v<omix_real_t, Real>,
              "omix_real_t must match omix::Real");
static_assert(std::is_same_v<omix_index_t, Index>,
              "omix_index_t must match omix::Index");

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(omix_error_t code, const char* message) noexcept;

void set_last_error(omix_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> omix_error_t;

// Convert the active C++ exception to an error code; call from a catch block
[[nodiscard]] auto handle_exception() noexcept -> omix_error_t;

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define OMIX_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (OMIX_UNLIKELY((ptr) == nullptr)) { \
            omix::binding::set_last_error(OMIX_ERROR_NULL_POINTER, (msg)); \
            return OMIX_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define OMIX_C_API_CHECK(cond, code, msg) \
    do { \
        if (OMIX_UNLIKELY(!(cond))) { \
            omix::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define OMIX_C_API_TRY try {

#define OMIX_C_API_CATCH \
    } catch (...) { \
        return omix::binding::handle_exception(); \
    }

#define OMIX_C_API_RETURN_OK \
    do { \
        omix::binding::clear_last_error(); \
        return OMIX_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace omix::binding

// =============================================================================
// Opaque Handle Definitions (C ABI Compatibility)
// =============================================================================

// Complete the forward declarations of the public headers

struct omix_integrator : omix::binding::IntegratorState {
    using IntegratorState::IntegratorState;
};

struct omix_result : omix::binding::ResultState {
    using ResultState::ResultState;
};

struct omix_pca_model : omix::binding::PcaModelState {
    using PcaModelState::PcaModelState;
};
