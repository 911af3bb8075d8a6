#pragma once

#include <cstddef>

// =============================================================================
// FILE: stmap/config.hpp
// BRIEF: Build-time switches: threading backend, Real/Index width, Highway
// =============================================================================

#ifdef STMAP_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// -----------------------------------------------------------------------------
// Threading backend
//
// The build defines one STMAP_BACKEND_*. Header-only consumers get OpenMP on
// Linux and Windows, and the BS pool elsewhere (Apple clang has no libomp).
// -----------------------------------------------------------------------------

#if !defined(STMAP_BACKEND_SERIAL) && !defined(STMAP_BACKEND_TBB) && \
    !defined(STMAP_BACKEND_OPENMP) && !defined(STMAP_BACKEND_BS)
    #if defined(__linux__) || defined(_WIN32)
        #define STMAP_BACKEND_OPENMP
    #else
        #define STMAP_BACKEND_BS
    #endif
#endif

#if (defined(STMAP_BACKEND_SERIAL) + defined(STMAP_BACKEND_TBB) + \
     defined(STMAP_BACKEND_OPENMP) + defined(STMAP_BACKEND_BS)) != 1
    #error "stmap: define exactly one of STMAP_BACKEND_{SERIAL,TBB,OPENMP,BS}."
#endif

#if defined(STMAP_BACKEND_OPENMP)
    #define STMAP_USE_OPENMP 1
#elif defined(STMAP_BACKEND_TBB)
    #define STMAP_USE_TBB 1
#elif defined(STMAP_BACKEND_BS)
    #define STMAP_USE_BS 1
#else
    #define STMAP_USE_SERIAL 1
#endif

// -----------------------------------------------------------------------------
// Real width: 0 = float32 (default), 1 = float64
// -----------------------------------------------------------------------------

#ifndef STMAP_PRECISION
    #define STMAP_PRECISION 0
#endif

#if STMAP_PRECISION == 0
    #define STMAP_USE_FLOAT32
#elif STMAP_PRECISION == 1
    #define STMAP_USE_FLOAT64
#else
    #error "stmap: STMAP_PRECISION must be 0 (float32) or 1 (float64)."
#endif

// -----------------------------------------------------------------------------
// Index width: 0 = int16, 1 = int32, 2 = int64 (default)
// -----------------------------------------------------------------------------

#ifndef STMAP_INDEX_PRECISION
    #define STMAP_INDEX_PRECISION 2
#endif

#if STMAP_INDEX_PRECISION == 0
    #define STMAP_USE_INT16
#elif STMAP_INDEX_PRECISION == 1
    #define STMAP_USE_INT32
#elif STMAP_INDEX_PRECISION == 2
    #define STMAP_USE_INT64
#else
    #error "stmap: STMAP_INDEX_PRECISION must be 0, 1 or 2."
#endif

namespace stmap::memory {
    // Widest Highway vector (AVX-512)
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;
}

namespace stmap::threading::config {
    inline constexpr std::size_t MAX_THREADS = 1024;
}
