#pragma once

#include "stmap/config.hpp"

// =============================================================================
// FILE: stmap/core/macros.hpp
// BRIEF: Compiler hints used by the kernels
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define STMAP_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define STMAP_UNLIKELY(x) (__builtin_expect(!!(x), 0))
    #define STMAP_HOT __attribute__((hot))
    #define STMAP_PREFETCH_READ(ptr, locality) __builtin_prefetch((ptr), 0, (locality))
#else
    #define STMAP_LIKELY(x)   (x)
    #define STMAP_UNLIKELY(x) (x)
    #define STMAP_HOT
    #define STMAP_PREFETCH_READ(ptr, locality) ((void)0)
#endif

#define STMAP_NODISCARD [[nodiscard]]

#if defined(_MSC_VER)
    #define STMAP_FORCE_INLINE __forceinline
    #define STMAP_RESTRICT __restrict
#else
    #define STMAP_FORCE_INLINE inline __attribute__((always_inline))
    #define STMAP_RESTRICT __restrict__
#endif

// Same definition as the C ABI header, which cannot include this file
#ifndef STMAP_EXPORT
    #if defined(_MSC_VER)
        #define STMAP_EXPORT __declspec(dllexport)
    #else
        #define STMAP_EXPORT __attribute__((visibility("default")))
    #endif
#endif
