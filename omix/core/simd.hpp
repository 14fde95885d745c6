#pragma once

#include "omix/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(OMIX_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: omix/core/simd.hpp
// BRIEF: omix SIMD Wrapper (Google Highway)
// =============================================================================

namespace omix::simd {

    // Import Highway functions into omix::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<omix::Real>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag, ScalableTag<T>>;

} // namespace omix::simd
