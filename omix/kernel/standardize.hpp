#pragma once

#include "omix/core/type.hpp"
#include "omix/core/simd.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"
#include "omix/core/dense.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// FILE: omix/kernel/standardize.hpp
// BRIEF: Column centring and scaling of row-major matrices with SIMD
// =============================================================================

namespace omix::kernel::standardize {

namespace config {
    constexpr Size SHORT_THRESHOLD = 16;
    constexpr Size PREFETCH_DISTANCE = 4;
}

// =============================================================================
// SIMD Helpers
// =============================================================================

namespace detail {

// acc[k] += row[k]
template <typename T>
OMIX_FORCE_INLINE void accumulate_row(
    T* OMIX_RESTRICT acc,
    const T* OMIX_RESTRICT row,
    Size len
) {
    namespace s = omix::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const Size lanes = s::Lanes(d);

    Size k = 0;
    if (len >= config::SHORT_THRESHOLD) {
        for (; k + 2 * lanes <= len; k += 2 * lanes) {
            auto a0 = s::LoadU(d, acc + k);
            auto a1 = s::LoadU(d, acc + k + lanes);
            a0 = s::Add(a0, s::LoadU(d, row + k));
            a1 = s::Add(a1, s::LoadU(d, row + k + lanes));
            s::StoreU(a0, d, acc + k);
            s::StoreU(a1, d, acc + k + lanes);
        }
        for (; k + lanes <= len; k += lanes) {
            s::StoreU(s::Add(s::LoadU(d, acc + k), s::LoadU(d, row + k)), d, acc + k);
        }
    }
    for (; k < len; ++k) {
        acc[k] += row[k];
    }
}

// acc[k] += (row[k] - mu[k])^2
template <typename T>
OMIX_FORCE_INLINE void accumulate_sq_dev(
    T* OMIX_RESTRICT acc,
    const T* OMIX_RESTRICT row,
    const T* OMIX_RESTRICT mu,
    Size len
) {
    namespace s = omix::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const Size lanes = s::Lanes(d);

    Size k = 0;
    if (len >= config::SHORT_THRESHOLD) {
        for (; k + lanes <= len; k += lanes) {
            auto dev = s::Sub(s::LoadU(d, row + k), s::LoadU(d, mu + k));
            s::StoreU(s::MulAdd(dev, dev, s::LoadU(d, acc + k)), d, acc + k);
        }
    }
    for (; k < len; ++k) {
        T dev = row[k] - mu[k];
        acc[k] += dev * dev;
    }
}

// dst[k] = (src[k] - mu[k]) * inv_sigma[k]   (inv_sigma == nullptr: no scaling)
template <typename T>
OMIX_FORCE_INLINE void standardize_row(
    T* OMIX_RESTRICT dst,
    const T* OMIX_RESTRICT src,
    const T* OMIX_RESTRICT mu,
    const T* OMIX_RESTRICT inv_sigma,
    Size len
) {
    namespace s = omix::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const Size lanes = s::Lanes(d);

    Size k = 0;
    if (len >= config::SHORT_THRESHOLD) {
        if (inv_sigma != nullptr) {
            for (; k + lanes <= len; k += lanes) {
                auto v = s::Sub(s::LoadU(d, src + k), s::LoadU(d, mu + k));
                s::StoreU(s::Mul(v, s::LoadU(d, inv_sigma + k)), d, dst + k);
            }
        } else {
            for (; k + lanes <= len; k += lanes) {
                s::StoreU(s::Sub(s::LoadU(d, src + k), s::LoadU(d, mu + k)), d, dst + k);
            }
        }
    }
    for (; k < len; ++k) {
        T v = src[k] - mu[k];
        dst[k] = (inv_sigma != nullptr) ? v * inv_sigma[k] : v;
    }
}

} // namespace detail

// =============================================================================
// Column Statistics
// =============================================================================

/// @brief Column means of a row-major matrix.
template <typename T>
std::vector<T> column_means(DenseArray<const T> x) {
    OMIX_CHECK_DIM(x.rows > 0 && x.cols > 0, "column_means: empty matrix");

    const Size n_cols = static_cast<Size>(x.cols);
    std::vector<T> means(n_cols, T(0));

    for (Index r = 0; r < x.rows; ++r) {
        if (r + static_cast<Index>(config::PREFETCH_DISTANCE) < x.rows) {
            OMIX_PREFETCH_READ(x.row(r + static_cast<Index>(config::PREFETCH_DISTANCE)).data(), 0);
        }
        detail::accumulate_row(means.data(), x.row(r).data(), n_cols);
    }

    const T inv_n = T(1) / static_cast<T>(x.rows);
    for (auto& m : means) {
        m *= inv_n;
    }
    return means;
}

/// @brief Population (ddof = 0) column standard deviations.
template <typename T>
std::vector<T> column_stddevs(DenseArray<const T> x, const std::vector<T>& means) {
    OMIX_CHECK_DIM(means.size() == static_cast<Size>(x.cols),
                   "column_stddevs: means length does not match column count");

    const Size n_cols = static_cast<Size>(x.cols);
    std::vector<T> sq(n_cols, T(0));

    for (Index r = 0; r < x.rows; ++r) {
        detail::accumulate_sq_dev(sq.data(), x.row(r).data(), means.data(), n_cols);
    }

    const T inv_n = T(1) / static_cast<T>(x.rows);
    for (auto& v : sq) {
        v = std::sqrt(v * inv_n);
    }
    return sq;
}

/// @brief Reciprocal scale factors; constant columns keep scale 1.
///
/// A column counts as constant when its stddev is within the rounding
/// noise of its mean: sd <= n * eps * max(|mean|, 1). The mean of a
/// constant column is not always exact, and dividing the residual by
/// such an sd would leave the column uncentred.
template <typename T>
std::vector<T> inverse_scales(const std::vector<T>& stddevs, const std::vector<T>& means, Index n_rows) {
    OMIX_CHECK_DIM(stddevs.size() == means.size(),
                   "inverse_scales: stddev and mean vectors differ in length");

    const T noise = static_cast<T>(n_rows) * std::numeric_limits<T>::epsilon();
    std::vector<T> inv(stddevs.size());
    for (Size k = 0; k < stddevs.size(); ++k) {
        const T floor = noise * std::max(std::abs(means[k]), T(1));
        inv[k] = (stddevs[k] > floor) ? T(1) / stddevs[k] : T(1);
    }
    return inv;
}

// =============================================================================
// Centring / Scaling
// =============================================================================

/// @brief Write (x - mu) * inv_sigma into a new buffer. x is never modified.
///
/// inv_sigma may be empty, in which case columns are only centred.
template <typename T>
DenseBuffer<T> standardize(
    DenseArray<const T> x,
    const std::vector<T>& mu,
    const std::vector<T>& inv_sigma
) {
    OMIX_CHECK_DIM(mu.size() == static_cast<Size>(x.cols),
                   "standardize: mean vector has " + std::to_string(mu.size()) +
                   " entries for " + std::to_string(x.cols) + " columns");
    OMIX_CHECK_DIM(inv_sigma.empty() || inv_sigma.size() == mu.size(),
                   "standardize: scale vector length does not match column count");

    DenseBuffer<T> out(x.rows, x.cols);
    const T* inv = inv_sigma.empty() ? nullptr : inv_sigma.data();
    const Size n_cols = static_cast<Size>(x.cols);

    for (Index r = 0; r < x.rows; ++r) {
        detail::standardize_row(out.view().row(r).data(), x.row(r).data(), mu.data(), inv, n_cols);
    }
    return out;
}

} // namespace omix::kernel::standardize
