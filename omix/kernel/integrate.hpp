#pragma once

#include "omix/config.hpp"
#include "omix/core/type.hpp"
#include "omix/core/dense.hpp"
#include "omix/core/error.hpp"
#include "omix/core/macros.hpp"
#include "omix/kernel/dataset.hpp"
#include "omix/kernel/reducer.hpp"
#include "omix/kernel/align.hpp"
#include "omix/threading/parallel_for.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =============================================================================
// FILE: omix/kernel/integrate.hpp
// BRIEF: Two-stage multi-omics integration
//
// validate -> reduce each modality -> intersect samples -> concatenate
// latent blocks in modality order -> reduce the joint matrix (centred only)
// =============================================================================

namespace omix::kernel::integrate {

using dataset::ModalityDataset;
using reducer::ClampWarning;

// =============================================================================
// Configuration
// =============================================================================

struct ModalityOptions {
    std::optional<Index> n_components;  // falls back to default_components
    bool scale = false;
};

/// @brief Everything a run depends on besides the data.
struct IntegrationConfig {
    Index default_components = static_cast<Index>(defaults::N_COMPONENTS);
    std::optional<Index> joint_components;              // falls back to default_components
    std::unordered_map<std::string, ModalityOptions> modality;
    std::vector<std::string> modality_order;            // empty: insertion order
    bool parallel = true;
    bool verbose = false;
};

// =============================================================================
// Result
// =============================================================================

struct ModalityReport {
    std::string name;
    Index n_samples = 0;
    Index n_features = 0;
    Index requested = 0;
    Index effective = 0;
    std::vector<Real> explained_variance_ratio;
};

struct IntegrationResult {
    RealMatrix embedding;                     // retained samples x joint_effective
    std::vector<std::string> sample_ids;      // row labels of embedding
    std::vector<ModalityReport> modalities;   // effective modality order
    std::vector<Real> joint_explained_variance_ratio;
    std::vector<ClampWarning> warnings;       // modalities in order, then joint
    Index joint_requested = 0;
    Index joint_effective = 0;
};

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

inline void check_config(
    const std::vector<ModalityDataset>& modalities,
    const IntegrationConfig& config
) {
    OMIX_CHECK_ARG(config.default_components >= 1,
                   "default_components must be >= 1, got " +
                   std::to_string(config.default_components));

    for (const auto& entry : config.modality) {
        const std::string& name = entry.first;
        bool known = false;
        for (const auto& ds : modalities) {
            if (ds.name == name) {
                known = true;
                break;
            }
        }
        OMIX_CHECK_ARG(known, "Options given for unknown modality '" + name + "'");
    }
}

inline ModalityOptions options_for(const IntegrationConfig& config, const std::string& name) {
    auto it = config.modality.find(name);
    return it == config.modality.end() ? ModalityOptions{} : it->second;
}

} // namespace detail

// =============================================================================
// Pipeline
// =============================================================================

/// @brief Integrate several modalities into one joint embedding.
///
/// Every modality is validated and every per-modality width resolved
/// before the first reduction runs. Per-modality reductions run through
/// the threading backend when config.parallel is set; the output does not
/// depend on it. Nothing is returned on failure.
///
/// @throws ShapeMismatchError, DuplicateSampleError, DomainError, ValueError
///         from validation
/// @throws InsufficientRankError when a stage has ceiling < 1
/// @throws EmptyIntersectionError when no sample is in every modality
template <reducer::Reducer R = reducer::PcaReducer>
IntegrationResult integrate(
    const std::vector<ModalityDataset>& modalities,
    const IntegrationConfig& config,
    const R& red = R{}
) {
    dataset::validate_all(modalities);
    const std::vector<Size> order = dataset::resolve_order(modalities, config.modality_order);
    detail::check_config(modalities, config);

    const Size n_mod = order.size();

    IntegrationResult result;
    result.modalities.resize(n_mod);

    // Resolve widths first so rank problems surface before any work
    std::vector<reducer::ReduceOptions> reduce_opts(n_mod);
    for (Size m = 0; m < n_mod; ++m) {
        const ModalityDataset& ds = modalities[order[m]];
        const ModalityOptions opts = detail::options_for(config, ds.name);

        auto resolved = reducer::resolve_components(
            ds.name, opts.n_components.value_or(config.default_components),
            ds.n_samples(), ds.n_features());

        reduce_opts[m] = reducer::ReduceOptions{resolved.effective, opts.scale};

        ModalityReport& report = result.modalities[m];
        report.name = ds.name;
        report.n_samples = ds.n_samples();
        report.n_features = ds.n_features();
        report.requested = resolved.requested;
        report.effective = resolved.effective;

        if (resolved.warning) {
            result.warnings.push_back(std::move(*resolved.warning));
        }
    }

    std::vector<reducer::Reduction> latents(n_mod);
    threading::parallel_for_each_slot(n_mod, config.parallel, [&](size_t m) {
        latents[m] = red.reduce(modalities[order[m]].matrix, reduce_opts[m]);
    });

    std::vector<const std::vector<std::string>*> id_lists(n_mod);
    std::vector<std::string> names(n_mod);
    std::vector<const RealMatrix*> blocks(n_mod);
    for (Size m = 0; m < n_mod; ++m) {
        const ModalityDataset& ds = modalities[order[m]];
        const reducer::Reduction& lat = latents[m];

        OMIX_ASSERT(lat.latent.rows == ds.n_samples() &&
                    lat.latent.cols == reduce_opts[m].n_components,
                    "Reducer returned a latent block of the wrong shape for '" + ds.name + "'");

        id_lists[m] = &ds.sample_ids;
        names[m] = ds.name;
        blocks[m] = &lat.latent;
        result.modalities[m].explained_variance_ratio = lat.explained_variance_ratio;
    }

    align::Alignment alignment = align::intersect(id_lists, names);
    RealMatrix joint = align::concatenate(blocks, alignment);

    auto joint_resolved = reducer::resolve_components(
        defaults::JOINT_STAGE,
        config.joint_components.value_or(config.default_components),
        joint.rows, joint.cols);
    if (joint_resolved.warning) {
        result.warnings.push_back(std::move(*joint_resolved.warning));
    }

    reducer::Reduction final_stage = red.reduce(
        joint.view(), reducer::ReduceOptions{joint_resolved.effective, false});

    result.embedding = std::move(final_stage.latent);
    result.joint_explained_variance_ratio = std::move(final_stage.explained_variance_ratio);
    result.sample_ids = std::move(alignment.sample_ids);
    result.joint_requested = joint_resolved.requested;
    result.joint_effective = joint_resolved.effective;

    if (config.verbose) {
        for (const auto& w : result.warnings) {
            reducer::log_warning(w);
        }
    }
    return result;
}

} // namespace omix::kernel::integrate
