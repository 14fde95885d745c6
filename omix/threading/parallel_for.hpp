#pragma once

#include "omix/config.hpp"
#include "omix/core/macros.hpp"
#include "omix/threading/scheduler.hpp"

#include <cstddef>
#include <exception>
#include <utility>
#include <vector>

// =============================================================================
// Backend Specific Headers
// =============================================================================

#if defined(OMIX_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
#elif defined(OMIX_USE_OPENMP)
    #include <omp.h>
#endif

namespace omix::threading {

// =============================================================================
// Parallel Loop Interface
// =============================================================================

// Runs func(i) for i in [start, end) on the active backend.
// func must not throw; use parallel_for_each_slot when bodies can fail.
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (OMIX_UNLIKELY(start >= end)) {
        return;
    }

#if defined(OMIX_USE_SERIAL)
    for (size_t i = start; i < end; ++i) {
        func(i);
    }

#elif defined(OMIX_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
    } else {
        // dynamic: per-item cost differs by orders of magnitude between modalities
        #pragma omp parallel for schedule(dynamic, 1)
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
    }

#elif defined(OMIX_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end, 1),
        [&](const tbb::blocked_range<size_t>& r) {
            for (size_t i = r.begin(); i != r.end(); ++i) {
                func(i);
            }
        });
#endif
}

// Runs func(i) for every i in [0, n), serially or in parallel, capturing
// exceptions per slot. After the loop the exception of the lowest failing
// index is rethrown, so the reported error never depends on scheduling.
template <typename Func>
inline void parallel_for_each_slot(size_t n, bool parallel, Func&& func) {
    std::vector<std::exception_ptr> errors(n);

    auto body = [&](size_t i) {
        try {
            func(i);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };

    if (parallel && n > 1) {
        parallel_for(0, n, body);
    } else {
        for (size_t i = 0; i < n; ++i) {
            body(i);
            if (errors[i]) {
                break;
            }
        }
    }

    for (const auto& err : errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }
}

} // namespace omix::threading
