#pragma once

#include "omix/core/type.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"

#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// =============================================================================
// FILE: omix/kernel/dataset.hpp
// BRIEF: Modality datasets and their validation
// =============================================================================

namespace omix::kernel::dataset {

// =============================================================================
// Modality Dataset
// =============================================================================

/// @brief One omics layer: samples x features plus the row -> sample mapping.
///
/// The matrix is a read-only view; the caller keeps the values alive for
/// the duration of the run. sample_ids[r] names row r.
struct ModalityDataset {
    std::string name;
    RealView matrix;
    std::vector<std::string> sample_ids;

    OMIX_NODISCARD Index n_samples() const noexcept { return matrix.rows; }
    OMIX_NODISCARD Index n_features() const noexcept { return matrix.cols; }
};

// =============================================================================
// Validation
// =============================================================================

/// @brief Reject NaN and Inf. `what` prefixes the message.
inline void check_finite(RealView x, const std::string& what) {
    const Real* OMIX_RESTRICT p = x.ptr;
    const Size n = x.size();
    for (Size i = 0; i < n; ++i) {
        if (OMIX_UNLIKELY(!std::isfinite(p[i]))) {
            const auto r = static_cast<Index>(i) / x.cols;
            const auto c = static_cast<Index>(i) % x.cols;
            throw DomainError(what + ": non-finite value at row " +
                              std::to_string(r) + ", column " + std::to_string(c));
        }
    }
}

/// @brief Validate one modality.
///
/// Throws ShapeMismatchError when the matrix is empty or its row count does
/// not match the identifier count, DuplicateSampleError when an identifier
/// repeats, DomainError on NaN/Inf.
inline void validate(const ModalityDataset& ds) {
    OMIX_CHECK_ARG(!ds.name.empty(), "Modality name must not be empty");

    if (OMIX_UNLIKELY(ds.matrix.rows < 1 || ds.matrix.cols < 1)) {
        throw ShapeMismatchError("Modality '" + ds.name + "': matrix must be non-empty, got " +
                                 std::to_string(ds.matrix.rows) + " x " +
                                 std::to_string(ds.matrix.cols));
    }
    OMIX_CHECK_NULL(ds.matrix.ptr, "Modality '" + ds.name + "': null matrix data");

    if (OMIX_UNLIKELY(static_cast<Size>(ds.matrix.rows) != ds.sample_ids.size())) {
        throw ShapeMismatchError("Modality '" + ds.name + "': " +
                                 std::to_string(ds.matrix.rows) + " rows but " +
                                 std::to_string(ds.sample_ids.size()) + " sample identifiers");
    }

    std::unordered_set<std::string> seen;
    seen.reserve(ds.sample_ids.size());
    for (const auto& id : ds.sample_ids) {
        if (OMIX_UNLIKELY(!seen.insert(id).second)) {
            throw DuplicateSampleError("Modality '" + ds.name + "': duplicate sample identifier '" +
                                       id + "'");
        }
    }

    check_finite(ds.matrix, "Modality '" + ds.name + "'");
}

/// @brief Validate a whole collection before anything is reduced.
///
/// Modalities are checked in the given order so the first offending one is
/// the one reported.
inline void validate_all(const std::vector<ModalityDataset>& modalities) {
    OMIX_CHECK_ARG(!modalities.empty(), "At least one modality is required");

    std::unordered_set<std::string> names;
    for (const auto& ds : modalities) {
        validate(ds);
        OMIX_CHECK_ARG(names.insert(ds.name).second,
                       "Duplicate modality name '" + ds.name + "'");
    }
}

/// @brief Resolve the concatenation order to indices into `modalities`.
///
/// Empty `order` means insertion order. Otherwise it must name every
/// modality exactly once.
inline std::vector<Size> resolve_order(
    const std::vector<ModalityDataset>& modalities,
    const std::vector<std::string>& order
) {
    std::vector<Size> out;
    out.reserve(modalities.size());

    if (order.empty()) {
        for (Size i = 0; i < modalities.size(); ++i) {
            out.push_back(i);
        }
        return out;
    }

    std::unordered_map<std::string, Size> by_name;
    for (Size i = 0; i < modalities.size(); ++i) {
        by_name.emplace(modalities[i].name, i);
    }

    OMIX_CHECK_ARG(order.size() == modalities.size(),
                   "Modality order lists " + std::to_string(order.size()) +
                   " names for " + std::to_string(modalities.size()) + " modalities");

    std::unordered_set<std::string> used;
    for (const auto& name : order) {
        auto it = by_name.find(name);
        OMIX_CHECK_ARG(it != by_name.end(), "Modality order names unknown modality '" + name + "'");
        OMIX_CHECK_ARG(used.insert(name).second, "Modality order repeats '" + name + "'");
        out.push_back(it->second);
    }
    return out;
}

} // namespace omix::kernel::dataset
