#pragma once

#include "stmap/config.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/threading/scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <vector>

// =============================================================================
// FILE: stmap/threading/parallel_for.hpp
// BRIEF: Row-parallel loop over [begin, end) on the configured backend
// =============================================================================

#if defined(STMAP_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
#elif defined(STMAP_USE_OPENMP)
    #include <omp.h>
#endif

namespace stmap::threading {

// body(i) must only write state owned by iteration i. The first exception
// thrown by any iteration is rethrown to the caller once the loop drains.
template <typename Body>
void parallel_for(size_t begin, size_t end, Body&& body) {
    if (STMAP_UNLIKELY(begin >= end)) {
        return;
    }

#if defined(STMAP_USE_OPENMP)
    // Nested call from inside a worker: run inline
    if (omp_in_parallel()) {
        for (size_t i = begin; i < end; ++i) body(i);
        return;
    }

    std::exception_ptr first_error;
    #pragma omp parallel for schedule(static)
    for (size_t i = begin; i < end; ++i) {
        try {
            body(i);
        } catch (...) {
            #pragma omp critical(stmap_parallel_for_error)
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

#elif defined(STMAP_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(begin, end),
                      [&](const tbb::blocked_range<size_t>& block) {
                          for (size_t i = block.begin(); i != block.end(); ++i) body(i);
                      });

#elif defined(STMAP_USE_BS)
    auto& pool = detail::global_pool();
    const size_t workers = std::max<size_t>(pool.get_thread_count(), 1);
    const size_t step = (end - begin + workers - 1) / workers;

    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (size_t lo = begin; lo < end; lo += step) {
        const size_t hi = std::min(lo + step, end);
        pending.push_back(pool.submit([&body, lo, hi] {
            for (size_t i = lo; i < hi; ++i) body(i);
        }));
    }
    // get() rethrows; wait for every chunk first so no task outlives body
    for (auto& f : pending) f.wait();
    for (auto& f : pending) f.get();

#else
    for (size_t i = begin; i < end; ++i) body(i);
#endif
}

} // namespace stmap::threading
