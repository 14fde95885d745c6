#pragma once

#include "omix/core/type.hpp"
#include "omix/core/error.hpp"
#include <string>
#include <vector>

// =============================================================================
/// @file dense.hpp
/// @brief Dense Matrix Types
///
/// - DenseArray<T>:  Non-owning row-major view (caller owns memory)
/// - DenseBuffer<T>: Owning row-major storage for results produced by omix
///
/// Both satisfy DenseLike and index as ptr[r * cols + c].
// =============================================================================

namespace omix {

// =============================================================================
// DenseArray: Contiguous Row-Major View
// =============================================================================

/// @brief Dense row-major matrix view over external storage.
///
/// Ownership: Non-owning (ptr must outlive this object)
///
/// Example:
///
/// std::vector<double> data(100);
/// DenseArray<const double> mat(data.data(), 10, 10);
template <typename T>
struct DenseArray {
    using ValueType = std::remove_const_t<T>;
    using Tag = TagDense;

    T* ptr;
    Index rows;
    Index cols;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c) {}

    // Mutable view converts to read-only view
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr DenseArray(const DenseArray<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols) {}

    OMIX_NODISCARD OMIX_FORCE_INLINE T& operator()(Index r, Index c) const {
#if !defined(NDEBUG)
        OMIX_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
        OMIX_ASSERT(c >= 0 && c < cols, "DenseArray: Col out of bounds");
#endif
        return ptr[r * cols + c];
    }

    /// @brief Get entire row as contiguous view.
    OMIX_NODISCARD OMIX_FORCE_INLINE Array<T> row(Index r) const {
#if !defined(NDEBUG)
        OMIX_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
#endif
        return Array<T>(ptr + (r * cols), static_cast<Size>(cols));
    }

    OMIX_NODISCARD constexpr T* data() const noexcept { return ptr; }

    OMIX_NODISCARD constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }

    OMIX_NODISCARD constexpr bool empty() const noexcept {
        return rows <= 0 || cols <= 0;
    }
};

// =============================================================================
// DenseBuffer: Owning Row-Major Storage
// =============================================================================

/// @brief Row-major matrix that owns its values.
///
/// Used for every matrix omix hands back to the caller (latent
/// representations, joint embeddings, loadings). Moves are cheap, copies
/// are deep.
template <typename T>
struct DenseBuffer {
    using ValueType = T;
    using Tag = TagDense;

    std::vector<T> values;
    Index rows = 0;
    Index cols = 0;

    DenseBuffer() = default;

    DenseBuffer(Index r, Index c, T fill_value = T(0))
        : values(static_cast<Size>(r) * static_cast<Size>(c), fill_value), rows(r), cols(c) {
        OMIX_CHECK_ARG(r >= 0 && c >= 0, "DenseBuffer: negative shape");
    }

    OMIX_NODISCARD OMIX_FORCE_INLINE T& operator()(Index r, Index c) {
        return values[static_cast<Size>(r * cols + c)];
    }

    OMIX_NODISCARD OMIX_FORCE_INLINE const T& operator()(Index r, Index c) const {
        return values[static_cast<Size>(r * cols + c)];
    }

    OMIX_NODISCARD T* data() noexcept { return values.data(); }
    OMIX_NODISCARD const T* data() const noexcept { return values.data(); }

    OMIX_NODISCARD Size size() const noexcept { return values.size(); }

    OMIX_NODISCARD DenseArray<T> view() noexcept {
        return DenseArray<T>(values.data(), rows, cols);
    }

    OMIX_NODISCARD DenseArray<const T> view() const noexcept {
        return DenseArray<const T>(values.data(), rows, cols);
    }

    /// @brief Copy of the leading `n_cols` columns.
    OMIX_NODISCARD DenseBuffer<T> leading_cols(Index n_cols) const {
        OMIX_CHECK_DIM(n_cols >= 0 && n_cols <= cols,
            "DenseBuffer::leading_cols: requested " + std::to_string(n_cols) +
            " of " + std::to_string(cols) + " columns");
        DenseBuffer<T> out(rows, n_cols);
        for (Index r = 0; r < rows; ++r) {
            for (Index c = 0; c < n_cols; ++c) {
                out(r, c) = (*this)(r, c);
            }
        }
        return out;
    }
};

static_assert(DenseLike<DenseArray<const Real>>);
static_assert(DenseLike<DenseBuffer<Real>>);

/// @brief Dense matrix of reals.
using RealMatrix = DenseBuffer<Real>;

/// @brief Read-only view used for every input matrix.
using RealView = DenseArray<const Real>;

} // namespace omix
