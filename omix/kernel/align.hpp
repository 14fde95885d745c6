#pragma once

#include "omix/core/type.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"

#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: omix/kernel/align.hpp
// BRIEF: Cross-modality sample alignment and latent concatenation
// =============================================================================

namespace omix::kernel::align {

/// @brief Samples shared by every modality.
///
/// sample_ids follows the order of the first modality. rows[m][i] is the
/// row of sample_ids[i] inside modality m.
struct Alignment {
    std::vector<std::string> sample_ids;
    std::vector<std::vector<Index>> rows;

    OMIX_NODISCARD Size size() const noexcept { return sample_ids.size(); }
};

/// @brief Intersect identifier lists.
///
/// @param id_lists One identifier list per modality, already in
///                 concatenation order; identifiers are unique per list.
/// @param names    Modality names, for the error message only
///
/// @throws EmptyIntersectionError when no identifier is in every list
inline Alignment intersect(
    const std::vector<const std::vector<std::string>*>& id_lists,
    const std::vector<std::string>& names
) {
    OMIX_CHECK_ARG(!id_lists.empty(), "intersect: no modalities");
    OMIX_CHECK_DIM(id_lists.size() == names.size(), "intersect: names/id lists length mismatch");

    std::vector<std::unordered_map<std::string, Index>> lookup(id_lists.size());
    for (Size m = 1; m < id_lists.size(); ++m) {
        const auto& ids = *id_lists[m];
        lookup[m].reserve(ids.size());
        for (Size r = 0; r < ids.size(); ++r) {
            lookup[m].emplace(ids[r], static_cast<Index>(r));
        }
    }

    Alignment out;
    out.rows.resize(id_lists.size());

    const auto& first = *id_lists[0];
    std::vector<Index> hit(id_lists.size());
    for (Size r = 0; r < first.size(); ++r) {
        const std::string& id = first[r];
        hit[0] = static_cast<Index>(r);

        bool everywhere = true;
        for (Size m = 1; m < id_lists.size(); ++m) {
            auto it = lookup[m].find(id);
            if (it == lookup[m].end()) {
                everywhere = false;
                break;
            }
            hit[m] = it->second;
        }
        if (!everywhere) {
            continue;
        }

        out.sample_ids.push_back(id);
        for (Size m = 0; m < id_lists.size(); ++m) {
            out.rows[m].push_back(hit[m]);
        }
    }

    if (OMIX_UNLIKELY(out.sample_ids.empty())) {
        std::string listed;
        for (Size m = 0; m < names.size(); ++m) {
            listed += (m == 0 ? "'" : ", '") + names[m] + "'";
        }
        throw EmptyIntersectionError("No sample identifier is shared by all modalities (" + listed + ")");
    }
    return out;
}

/// @brief Build the joint feature matrix.
///
/// Row i is the concatenation, in block order, of row alignment.rows[m][i]
/// of each latent block m.
inline RealMatrix concatenate(
    const std::vector<const RealMatrix*>& blocks,
    const Alignment& alignment
) {
    OMIX_CHECK_DIM(blocks.size() == alignment.rows.size(),
                   "concatenate: " + std::to_string(blocks.size()) + " blocks for " +
                   std::to_string(alignment.rows.size()) + " aligned modalities");

    Index width = 0;
    for (const auto* b : blocks) {
        OMIX_CHECK_NULL(b, "concatenate: null latent block");
        width += b->cols;
    }

    const auto n = static_cast<Index>(alignment.size());
    RealMatrix joint(n, width);

    for (Index i = 0; i < n; ++i) {
        Real* dst = joint.view().row(i).data();
        for (Size m = 0; m < blocks.size(); ++m) {
            const RealMatrix& block = *blocks[m];
            const Index src_row = alignment.rows[m][static_cast<Size>(i)];
            OMIX_ASSERT(src_row >= 0 && src_row < block.rows, "concatenate: aligned row out of range");
            std::memcpy(dst, block.view().row(src_row).data(),
                        static_cast<Size>(block.cols) * sizeof(Real));
            dst += block.cols;
        }
    }
    return joint;
}

} // namespace omix::kernel::align
