#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/simd.hpp"

// =============================================================================
// FILE: stmap/core/vectorize.hpp
// BRIEF: Highway loops over Array views (row sums, dot products, AXPY)
// =============================================================================

namespace stmap::vectorize {

namespace detail {

// Two independent accumulators over full vector pairs, then single vectors,
// then a scalar tail. vec(d, i) loads lane block i, tail(i) gives element i.
template <typename T, typename VecTerm, typename ScalarTerm>
STMAP_FORCE_INLINE T reduce_add(size_t n, VecTerm vec, ScalarTerm tail) {
    namespace s = stmap::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    auto acc0 = s::Zero(d);
    auto acc1 = s::Zero(d);
    size_t i = 0;
    for (; i + 2 * lanes <= n; i += 2 * lanes) {
        acc0 = vec(d, i, acc0);
        acc1 = vec(d, i + lanes, acc1);
    }
    acc0 = s::Add(acc0, acc1);
    for (; i + lanes <= n; i += lanes) {
        acc0 = vec(d, i, acc0);
    }

    T total = s::GetLane(s::SumOfLanes(d, acc0));
    for (; i < n; ++i) {
        total += tail(i);
    }
    return total;
}

} // namespace detail

template <typename T>
STMAP_FORCE_INLINE T sum(Array<const T> x) {
    namespace s = stmap::simd;
    const T* p = x.ptr;
    return detail::reduce_add<T>(
        x.len,
        [p](const auto& d, size_t i, auto acc) { return s::Add(acc, s::LoadU(d, p + i)); },
        [p](size_t i) { return p[i]; });
}

template <typename T>
STMAP_FORCE_INLINE T dot(Array<const T> a, Array<const T> b) {
    STMAP_ASSERT(a.len == b.len, "dot: length mismatch");
    namespace s = stmap::simd;
    const T* pa = a.ptr;
    const T* pb = b.ptr;
    return detail::reduce_add<T>(
        a.len,
        [pa, pb](const auto& d, size_t i, auto acc) {
            return s::MulAdd(s::LoadU(d, pa + i), s::LoadU(d, pb + i), acc);
        },
        [pa, pb](size_t i) { return pa[i] * pb[i]; });
}

// y += alpha * x
template <typename T>
STMAP_FORCE_INLINE void axpy(T alpha, Array<const T> x, Array<T> y) {
    STMAP_ASSERT(x.len == y.len, "axpy: length mismatch");
    namespace s = stmap::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);
    const auto va = s::Set(d, alpha);

    size_t i = 0;
    for (; i + lanes <= x.len; i += lanes) {
        s::StoreU(s::MulAdd(va, s::LoadU(d, x.ptr + i), s::LoadU(d, y.ptr + i)), d, y.ptr + i);
    }
    for (; i < x.len; ++i) {
        y.ptr[i] += alpha * x.ptr[i];
    }
}

template <typename T>
STMAP_FORCE_INLINE void scale_inplace(Array<T> x, T factor) {
    namespace s = stmap::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);
    const auto vf = s::Set(d, factor);

    size_t i = 0;
    for (; i + lanes <= x.len; i += lanes) {
        s::StoreU(s::Mul(s::LoadU(d, x.ptr + i), vf), d, x.ptr + i);
    }
    for (; i < x.len; ++i) {
        x.ptr[i] *= factor;
    }
}

} // namespace stmap::vectorize
