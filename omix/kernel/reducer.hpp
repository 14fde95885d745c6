#pragma once

#include "omix/core/type.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"
#include "omix/kernel/pca.hpp"

#include <concepts>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: omix/kernel/reducer.hpp
// BRIEF: Dimensionality reduction capability and component resolution
// =============================================================================

namespace omix::kernel::reducer {

// =============================================================================
// Reduction Contract
// =============================================================================

struct ReduceOptions {
    Index n_components = 0;  // already resolved against the ceiling
    bool scale = false;
};

struct Reduction {
    RealMatrix latent;                          // n_samples x n_components, input row order
    std::vector<Real> explained_variance_ratio; // may be empty for methods without one
};

/// @brief Anything that maps a samples x features matrix to samples x k.
///
/// Reducers must be deterministic and must not keep mutable state between
/// calls: the integrator invokes reduce() concurrently for different
/// modalities on the same reducer object.
template <typename R>
concept Reducer = requires(const R& r, RealView x, const ReduceOptions& opts) {
    { r.reduce(x, opts) } -> std::same_as<Reduction>;
};

// =============================================================================
// PCA Reducer
// =============================================================================

struct PcaReducer {
    OMIX_NODISCARD Reduction reduce(RealView x, const ReduceOptions& opts) const {
        auto fitted = pca::fit_transform(x, opts.n_components, opts.scale);
        return Reduction{
            std::move(fitted.scores),
            std::move(fitted.model.explained_variance_ratio)
        };
    }
};

static_assert(Reducer<PcaReducer>);

// =============================================================================
// Component Resolution
// =============================================================================

/// @brief Recorded when a requested width was lowered to the ceiling.
struct ClampWarning {
    std::string stage;   // modality name, or defaults::JOINT_STAGE
    Index requested = 0;
    Index effective = 0;

    OMIX_NODISCARD std::string message() const {
        return "'" + stage + "': requested " + std::to_string(requested) +
               " components, clamped to " + std::to_string(effective);
    }
};

struct ResolvedComponents {
    Index requested = 0;
    Index effective = 0;
    std::optional<ClampWarning> warning;
};

/// @brief Resolve the width used for one reduction stage.
///
/// requested <= 0 is rejected. A request above ceiling(rows, cols) is
/// lowered to the ceiling and a warning is attached. Throws
/// InsufficientRankError when the ceiling itself is below 1.
inline ResolvedComponents resolve_components(
    const std::string& stage,
    Index requested,
    Index n_rows,
    Index n_cols
) {
    OMIX_CHECK_ARG(requested >= 1,
                   "'" + stage + "': n_components must be >= 1, got " + std::to_string(requested));

    const Index ceil = pca::ceiling(n_rows, n_cols);
    if (OMIX_UNLIKELY(ceil < 1)) {
        throw InsufficientRankError(
            "'" + stage + "': cannot reduce a " + std::to_string(n_rows) + " x " +
            std::to_string(n_cols) + " matrix (min(rows, cols) - 1 = " +
            std::to_string(ceil) + ")");
    }

    ResolvedComponents out;
    out.requested = requested;
    out.effective = requested;
    if (requested > ceil) {
        out.effective = ceil;
        out.warning = ClampWarning{stage, requested, ceil};
    }
    return out;
}

/// @brief Print a clamp warning the way the library logs diagnostics.
inline void log_warning(const ClampWarning& w) {
    std::fprintf(stderr, "WARNING: %s\n", w.message().c_str());
}

} // namespace omix::kernel::reducer
