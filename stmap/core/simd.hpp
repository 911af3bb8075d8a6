#pragma once

#include "stmap/core/type.hpp"

#include <type_traits>

// =============================================================================
// FILE: stmap/core/simd.hpp
// BRIEF: Highway ops under stmap::simd, statically dispatched
// =============================================================================

#if defined(STMAP_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>
#include <hwy/contrib/math/math-inl.h>   // Exp

namespace stmap::simd {

using namespace hwy::HWY_NAMESPACE;

// Full-width tag for Real, the only lane type the kernels touch
using Tag = ScalableTag<Real>;

template <typename T>
using SimdTagFor = std::conditional_t<std::is_same_v<T, Real>, Tag, ScalableTag<T>>;

} // namespace stmap::simd
