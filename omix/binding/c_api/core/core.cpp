// =============================================================================
// FILE: omix/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-local error handling
// =============================================================================

#include "omix/binding/c_api/core/core.h"
#include "omix/binding/c_api/core/internal.hpp"
#include "omix/config.hpp"
#include "omix/core/error.hpp"
#include "omix/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace omix::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local omix_error_t g_last_error_code = OMIX_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(omix_error_t code, const char* message) noexcept {
    if (OMIX_LIKELY(message != nullptr)) {
        set_last_error(code, std::string_view(message));
        return;
    }
    g_last_error_code = code;
    g_last_error_message[0] = '\0';
}

void set_last_error(omix_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = OMIX_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (OMIX_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> omix_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

namespace {

omix_error_t report(omix_error_t code, const char* what) noexcept {
    set_last_error(code, what);
    return code;
}

} // anonymous namespace

// Most specific first: integration errors derive from ValueError/NumericalError
[[nodiscard]] auto handle_exception() noexcept -> omix_error_t {
    try {
        throw;
    }
    // Integration errors
    catch (const ShapeMismatchError& e) {
        return report(OMIX_ERROR_SHAPE_MISMATCH, e.what());
    }
    catch (const DuplicateSampleError& e) {
        return report(OMIX_ERROR_DUPLICATE_SAMPLE, e.what());
    }
    catch (const InsufficientRankError& e) {
        return report(OMIX_ERROR_INSUFFICIENT_RANK, e.what());
    }
    catch (const EmptyIntersectionError& e) {
        return report(OMIX_ERROR_EMPTY_INTERSECTION, e.what());
    }
    // Argument errors
    catch (const IndexOutOfBoundsError& e) {
        return report(OMIX_ERROR_INDEX_OUT_OF_BOUNDS, e.what());
    }
    catch (const DimensionError& e) {
        return report(OMIX_ERROR_DIMENSION_MISMATCH, e.what());
    }
    catch (const DomainError& e) {
        return report(OMIX_ERROR_DOMAIN_ERROR, e.what());
    }
    catch (const RangeError& e) {
        return report(OMIX_ERROR_RANGE_ERROR, e.what());
    }
    catch (const ValueError& e) {
        return report(OMIX_ERROR_INVALID_ARGUMENT, e.what());
    }
    // Runtime errors
    catch (const NullPointerError& e) {
        return report(OMIX_ERROR_NULL_POINTER, e.what());
    }
    catch (const InternalError& e) {
        return report(OMIX_ERROR_INTERNAL, e.what());
    }
    // Numerical errors
    catch (const ConvergenceError& e) {
        return report(OMIX_ERROR_CONVERGENCE_ERROR, e.what());
    }
    catch (const NumericalError& e) {
        return report(OMIX_ERROR_NUMERICAL_ERROR, e.what());
    }
    catch (const Exception& e) {
        return report(static_cast<omix_error_t>(e.code()), e.what());
    }
    // Standard exceptions
    catch (const std::bad_alloc&) {
        return report(OMIX_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
    }
    catch (const std::length_error& e) {
        return report(OMIX_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::out_of_range& e) {
        return report(OMIX_ERROR_RANGE_ERROR, e.what());
    }
    catch (const std::logic_error& e) {
        return report(OMIX_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::exception& e) {
        return report(OMIX_ERROR_UNKNOWN, e.what());
    }
    catch (...) {
        return report(OMIX_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
    }
}

} // namespace omix::binding

// =============================================================================
// C API Implementation (Stable ABI)
// =============================================================================

extern "C" {

#define OMIX_C_API_STR_(x) #x
#define OMIX_C_API_STR(x) OMIX_C_API_STR_(x)

OMIX_C_EXPORT const char* omix_get_version(void) {
    return OMIX_C_API_STR(OMIX_C_API_VERSION_MAJOR) "."
           OMIX_C_API_STR(OMIX_C_API_VERSION_MINOR) "."
           OMIX_C_API_STR(OMIX_C_API_VERSION_PATCH);
}

OMIX_C_EXPORT const char* omix_get_build_config(void) {
    static const char* config_str =
        OMIX_REAL_TYPE_NAME "+" OMIX_INDEX_TYPE_NAME "+" OMIX_BACKEND_NAME;
    return config_str;
}

OMIX_C_EXPORT const char* omix_get_last_error(void) {
    return omix::binding::get_last_error_message();
}

OMIX_C_EXPORT omix_error_t omix_get_last_error_code(void) {
    return omix::binding::get_last_error_code();
}

OMIX_C_EXPORT void omix_clear_error(void) {
    omix::binding::clear_last_error();
}

OMIX_C_EXPORT omix_error_t omix_set_num_threads(omix_size_t n) {
    OMIX_C_API_TRY
        omix::threading::set_num_threads(n);
        OMIX_C_API_RETURN_OK;
    OMIX_C_API_CATCH
}

OMIX_C_EXPORT omix_size_t omix_get_num_threads(void) {
    return omix::threading::num_threads();
}

} // extern "C"
