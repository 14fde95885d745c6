#pragma once

#include "omix/config.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <thread>

// =============================================================================
// FILE: omix/threading/scheduler.hpp
// BRIEF: Worker count control for the selected threading backend
// =============================================================================

#if defined(OMIX_USE_OPENMP)
    #include <omp.h>
#elif defined(OMIX_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace omix::threading {

inline constexpr std::size_t MAX_THREADS = 1024;

namespace detail {

#if defined(OMIX_USE_TBB)
// tbb::global_control only applies while alive
inline std::unique_ptr<tbb::global_control>& tbb_limit() {
    static std::unique_ptr<tbb::global_control> limit;
    return limit;
}
#endif

} // namespace detail

/// @brief Set the worker count used by per-modality reductions.
///
/// 0 selects the hardware thread count. Values are capped at MAX_THREADS.
/// Serial builds accept and ignore the request.
inline void set_num_threads(std::size_t n) {
    if (n == 0) {
        n = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    }
    n = std::min(n, MAX_THREADS);

#if defined(OMIX_USE_OPENMP)
    omp_set_num_threads(static_cast<int>(n));
#elif defined(OMIX_USE_TBB)
    detail::tbb_limit() = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, n);
#else
    (void)n;
#endif
}

/// @brief Worker count the next parallel region will use, at least 1.
inline std::size_t num_threads() noexcept {
#if defined(OMIX_USE_OPENMP)
    const int n = omp_get_max_threads();
#elif defined(OMIX_USE_TBB)
    const auto n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
#else
    const int n = 1;
#endif
    return n > 0 ? static_cast<std::size_t>(n) : 1;
}

} // namespace omix::threading
