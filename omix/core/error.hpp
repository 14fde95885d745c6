#pragma once

#include "omix/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: omix/core/error.hpp
// BRIEF: omix Exception System
// =============================================================================

namespace omix {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    RANGE_ERROR = 13,
    INDEX_OUT_OF_BOUNDS = 14,

    // Numerical errors
    NUMERICAL_ERROR = 50,
    CONVERGENCE_ERROR = 54,

    // Integration errors
    SHAPE_MISMATCH = 60,
    DUPLICATE_SAMPLE = 61,
    INSUFFICIENT_RANK = 62,
    EMPTY_INTERSECTION = 63,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class OMIX_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal omix Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class DomainError : public ValueError {
public:
    explicit DomainError(const std::string& msg)
        : ValueError(ErrorCode::DOMAIN_ERROR, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

// =============================================================================
// Numerical Errors
// =============================================================================

class NumericalError : public Exception {
public:
    explicit NumericalError(const std::string& msg)
        : Exception(ErrorCode::NUMERICAL_ERROR, msg) {}

protected:
    explicit NumericalError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class ConvergenceError : public NumericalError {
public:
    explicit ConvergenceError(const std::string& msg = "Algorithm did not converge")
        : NumericalError(ErrorCode::CONVERGENCE_ERROR, msg) {}
};

// =============================================================================
// Integration Errors
// =============================================================================

/// Sample identifier count disagrees with the matrix row count, or the
/// matrix is empty.
class ShapeMismatchError : public ValueError {
public:
    explicit ShapeMismatchError(const std::string& msg)
        : ValueError(ErrorCode::SHAPE_MISMATCH, msg) {}
};

/// A sample identifier occurs twice within one modality.
class DuplicateSampleError : public ValueError {
public:
    explicit DuplicateSampleError(const std::string& msg)
        : ValueError(ErrorCode::DUPLICATE_SAMPLE, msg) {}
};

/// min(rows, cols) - 1 < 1: nothing left to reduce to.
class InsufficientRankError : public NumericalError {
public:
    explicit InsufficientRankError(const std::string& msg)
        : NumericalError(ErrorCode::INSUFFICIENT_RANK, msg) {}
};

/// No sample identifier is shared by every modality.
class EmptyIntersectionError : public Exception {
public:
    explicit EmptyIntersectionError(const std::string& msg)
        : Exception(ErrorCode::EMPTY_INTERSECTION, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define OMIX_ASSERT(condition, msg) \
    do { \
        if (OMIX_UNLIKELY(!(condition))) { \
            throw omix::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define OMIX_CHECK_ARG(condition, msg) \
    do { \
        if (OMIX_UNLIKELY(!(condition))) { \
            throw omix::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define OMIX_CHECK_DIM(condition, msg) \
    do { \
        if (OMIX_UNLIKELY(!(condition))) { \
            throw omix::DimensionError(msg); \
        } \
    } while(0)

// Validation for null pointers
#define OMIX_CHECK_NULL(ptr, msg) \
    do { \
        if (OMIX_UNLIKELY((ptr) == nullptr)) { \
            throw omix::NullPointerError(msg); \
        } \
    } while(0)

// Validation for index bounds
#define OMIX_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (OMIX_UNLIKELY((index) < 0 || static_cast<std::size_t>(index) >= (size))) { \
            throw omix::IndexOutOfBoundsError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace omix
