#pragma once

#include "stmap/config.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <thread>

// =============================================================================
// FILE: stmap/threading/scheduler.hpp
// BRIEF: Process-wide worker count for the configured backend
// =============================================================================

#if defined(STMAP_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(STMAP_USE_OPENMP)
    #include <omp.h>
#elif defined(STMAP_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace stmap::threading {

namespace detail {

#if defined(STMAP_USE_BS)
inline BS::thread_pool& global_pool() {
    static BS::thread_pool pool;
    return pool;
}
#elif defined(STMAP_USE_TBB)
// Replaced on every set_num_threads; the limit lives as long as the object
inline std::unique_ptr<tbb::global_control>& parallelism_limit() {
    static std::unique_ptr<tbb::global_control> limit;
    return limit;
}
#endif

} // namespace detail

struct Scheduler {
    static size_t hardware_concurrency() noexcept {
        return std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }

    // 0 means "all hardware threads"; clamped to MAX_THREADS
    static void set_num_threads(size_t n) {
        n = std::min(n == 0 ? hardware_concurrency() : n, config::MAX_THREADS);
#if defined(STMAP_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));
#elif defined(STMAP_USE_TBB)
        detail::parallelism_limit() = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, n);
#elif defined(STMAP_USE_BS)
        detail::global_pool().reset(n);
#else
        (void)n;
#endif
    }

    static size_t get_num_threads() noexcept {
        size_t n = 1;
#if defined(STMAP_USE_OPENMP)
        n = static_cast<size_t>(std::max(omp_get_max_threads(), 1));
#elif defined(STMAP_USE_TBB)
        n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
#elif defined(STMAP_USE_BS)
        n = detail::global_pool().get_thread_count();
#endif
        return std::max<size_t>(n, 1);
    }
};

} // namespace stmap::threading
