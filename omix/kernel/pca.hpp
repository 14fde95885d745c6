#pragma once

#include "omix/core/type.hpp"
#include "omix/core/simd.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"
#include "omix/kernel/standardize.hpp"

#include <Eigen/Core>
#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

// =============================================================================
// FILE: omix/kernel/pca.hpp
// BRIEF: Deterministic principal component analysis via thin SVD
//
// X (n x f) is centred (optionally scaled), decomposed as U S V^T and
// projected onto the leading k right singular vectors. Scores are U_k S_k.
// Orientation: descending singular values; each loading vector is flipped
// so that its largest-magnitude entry is positive (ties: lowest index).
// =============================================================================

namespace omix::kernel::pca {

// =============================================================================
// Model
// =============================================================================

struct PcaModel {
    Index n_samples_fit = 0;
    Index n_features = 0;
    Index n_components = 0;

    std::vector<Real> mean;                      // [n_features]
    std::vector<Real> inv_scale;                 // [n_features], empty when unscaled
    RealMatrix components;                       // n_components x n_features
    std::vector<Real> singular_values;           // [n_components]
    std::vector<Real> explained_variance;        // [n_components]
    std::vector<Real> explained_variance_ratio;  // [n_components]

    OMIX_NODISCARD bool scaled() const noexcept { return !inv_scale.empty(); }
};

struct FitResult {
    PcaModel model;
    RealMatrix scores;  // n_samples x n_components
};

/// @brief Largest informative number of components for an n x f matrix.
///
/// A centred matrix with n rows has rank at most n - 1, so the ceiling is
/// min(n, f) - 1.
OMIX_NODISCARD constexpr Index ceiling(Index n_rows, Index n_cols) noexcept {
    return std::min(n_rows, n_cols) - 1;
}

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

using EigenMatrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic>;
using EigenRowMatrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Index of the first entry with the largest magnitude
template <typename Vec>
Index argmax_abs(const Vec& v) {
    Index best = 0;
    Real best_val = std::abs(v(0));
    for (Index i = 1; i < static_cast<Index>(v.size()); ++i) {
        const Real a = std::abs(v(i));
        if (a > best_val) {
            best_val = a;
            best = i;
        }
    }
    return best;
}

// sum_k a[k] * b[k]
OMIX_HOT OMIX_FORCE_INLINE Real dot(
    const Real* OMIX_RESTRICT a,
    const Real* OMIX_RESTRICT b,
    Size len
) noexcept {
    namespace s = omix::simd;
    const s::RealTag d;
    const Size lanes = s::Lanes(d);

    auto v_sum0 = s::Zero(d);
    auto v_sum1 = s::Zero(d);

    Size k = 0;
    for (; k + 2 * lanes <= len; k += 2 * lanes) {
        v_sum0 = s::MulAdd(s::LoadU(d, a + k), s::LoadU(d, b + k), v_sum0);
        v_sum1 = s::MulAdd(s::LoadU(d, a + k + lanes), s::LoadU(d, b + k + lanes), v_sum1);
    }
    for (; k + lanes <= len; k += lanes) {
        v_sum0 = s::MulAdd(s::LoadU(d, a + k), s::LoadU(d, b + k), v_sum0);
    }

    Real sum = s::GetLane(s::SumOfLanes(d, s::Add(v_sum0, v_sum1)));
    for (; k < len; ++k) {
        sum += a[k] * b[k];
    }
    return sum;
}

inline void check_components(Index n_rows, Index n_cols, Index n_components) {
    const Index ceil = ceiling(n_rows, n_cols);
    if (OMIX_UNLIKELY(ceil < 1)) {
        throw InsufficientRankError(
            "PCA needs min(rows, cols) >= 2, got " + std::to_string(n_rows) +
            " x " + std::to_string(n_cols));
    }
    if (OMIX_UNLIKELY(n_components < 1 || n_components > ceil)) {
        throw RangeError(
            "PCA: n_components=" + std::to_string(n_components) +
            " outside [1, " + std::to_string(ceil) + "]");
    }
}

} // namespace detail

// =============================================================================
// Fit
// =============================================================================

/// @brief Fit PCA on x and return the model together with the training scores.
///
/// @param x            Input (n_samples x n_features), not modified
/// @param n_components Components to keep, 1 <= k <= ceiling(n, f)
/// @param scale        Divide centred columns by their population stddev
///
/// @throws InsufficientRankError when ceiling(n, f) < 1
/// @throws RangeError when n_components is outside [1, ceiling]
inline FitResult fit_transform(RealView x, Index n_components, bool scale) {
    detail::check_components(x.rows, x.cols, n_components);

    const Index n = x.rows;
    const Index f = x.cols;

    FitResult result;
    PcaModel& model = result.model;
    model.n_samples_fit = n;
    model.n_features = f;
    model.n_components = n_components;

    model.mean = standardize::column_means(x);
    if (scale) {
        model.inv_scale = standardize::inverse_scales(
            standardize::column_stddevs(x, model.mean), model.mean, n);
    }
    RealMatrix centred = standardize::standardize(x, model.mean, model.inv_scale);

    const detail::EigenMatrix xc =
        Eigen::Map<const detail::EigenRowMatrix>(centred.data(), n, f);

    Eigen::BDCSVD<detail::EigenMatrix> svd(xc, Eigen::ComputeThinU | Eigen::ComputeThinV);
    if (OMIX_UNLIKELY(svd.info() != Eigen::Success)) {
        throw ConvergenceError("PCA: singular value decomposition did not converge");
    }

    detail::EigenMatrix u = svd.matrixU();
    detail::EigenMatrix v = svd.matrixV();
    const auto& sv = svd.singularValues();

    const Real dof = static_cast<Real>(n - 1);
    Real total_variance = Real(0);
    for (Index j = 0; j < static_cast<Index>(sv.size()); ++j) {
        total_variance += sv(j) * sv(j) / dof;
    }

    model.components = RealMatrix(n_components, f);
    model.singular_values.resize(static_cast<Size>(n_components));
    model.explained_variance.resize(static_cast<Size>(n_components));
    model.explained_variance_ratio.resize(static_cast<Size>(n_components));
    result.scores = RealMatrix(n, n_components);

    for (Index j = 0; j < n_components; ++j) {
        const Index pivot = detail::argmax_abs(v.col(j));
        if (v(pivot, j) < Real(0)) {
            v.col(j) = -v.col(j);
            u.col(j) = -u.col(j);
        }

        const Real s_j = sv(j);
        const Real ev = s_j * s_j / dof;
        model.singular_values[static_cast<Size>(j)] = s_j;
        model.explained_variance[static_cast<Size>(j)] = ev;
        model.explained_variance_ratio[static_cast<Size>(j)] =
            (total_variance > Real(0)) ? ev / total_variance : Real(0);

        for (Index c = 0; c < f; ++c) {
            model.components(j, c) = v(c, j);
        }
        for (Index r = 0; r < n; ++r) {
            result.scores(r, j) = u(r, j) * s_j;
        }
    }

    return result;
}

/// @brief Fit PCA and keep only the model.
inline PcaModel fit(RealView x, Index n_components, bool scale) {
    return fit_transform(x, n_components, scale).model;
}

// =============================================================================
// Transform
// =============================================================================

/// @brief Project new samples with a fitted model.
///
/// Rows of x are centred and scaled with the statistics of the training
/// data, then projected onto the stored loadings.
inline RealMatrix transform(const PcaModel& model, RealView x) {
    OMIX_CHECK_ARG(model.n_components > 0, "transform: model is not fitted");
    OMIX_CHECK_DIM(x.cols == model.n_features,
                   "transform: model expects " + std::to_string(model.n_features) +
                   " features, got " + std::to_string(x.cols));
    OMIX_CHECK_DIM(x.rows >= 1, "transform: empty input");

    RealMatrix centred = standardize::standardize(x, model.mean, model.inv_scale);
    RealMatrix out(x.rows, model.n_components);
    const Size f = static_cast<Size>(model.n_features);

    for (Index r = 0; r < x.rows; ++r) {
        const Real* row = centred.view().row(r).data();
        for (Index j = 0; j < model.n_components; ++j) {
            out(r, j) = detail::dot(row, model.components.view().row(j).data(), f);
        }
    }
    return out;
}

} // namespace omix::kernel::pca
