#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/simd.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/core/vectorize.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <cmath>
#include <limits>

// =============================================================================
// FILE: stmap/kernel/softmax.hpp
// BRIEF: Row-wise softmax over the mapping logits and its backward pass
// =============================================================================

namespace stmap::kernel::softmax {

namespace config {
    // Below this length a row is handled with scalar code
    constexpr Size SHORT_THRESHOLD = 16;
    constexpr Size PREFETCH_DISTANCE = 16;
}

namespace detail {

template <typename T>
STMAP_FORCE_INLINE T row_max(const T* STMAP_RESTRICT vals, Size len) {
    T best = vals[0];
    Size k = 1;
    if (len >= config::SHORT_THRESHOLD) {
        namespace s = stmap::simd;
        const s::Tag d;
        const Size lanes = s::Lanes(d);

        auto hi0 = s::LoadU(d, vals);
        auto hi1 = hi0;
        for (k = 0; k + 2 * lanes <= len; k += 2 * lanes) {
            if (STMAP_LIKELY(k + config::PREFETCH_DISTANCE * lanes < len)) {
                STMAP_PREFETCH_READ(vals + k + config::PREFETCH_DISTANCE * lanes, 0);
            }
            hi0 = s::Max(hi0, s::LoadU(d, vals + k));
            hi1 = s::Max(hi1, s::LoadU(d, vals + k + lanes));
        }
        best = s::GetLane(s::MaxOfLanes(d, s::Max(hi0, hi1)));
    }
    for (; k < len; ++k) {
        if (vals[k] > best) best = vals[k];
    }
    return best;
}

// dst[k] = exp(src[k] - shift), returns the sum of dst; src may equal dst
template <typename T>
STMAP_HOT T exp_shifted(const T* src, T* dst, Size len, T shift) {
    T total = T(0);
    Size k = 0;
    if (len >= config::SHORT_THRESHOLD) {
        namespace s = stmap::simd;
        const s::Tag d;
        const Size lanes = s::Lanes(d);
        const auto vshift = s::Set(d, shift);

        auto acc0 = s::Zero(d);
        auto acc1 = s::Zero(d);
        for (; k + 2 * lanes <= len; k += 2 * lanes) {
            const auto e0 = s::Exp(d, s::Sub(s::LoadU(d, src + k), vshift));
            const auto e1 = s::Exp(d, s::Sub(s::LoadU(d, src + k + lanes), vshift));
            s::StoreU(e0, d, dst + k);
            s::StoreU(e1, d, dst + k + lanes);
            acc0 = s::Add(acc0, e0);
            acc1 = s::Add(acc1, e1);
        }
        total = s::GetLane(s::SumOfLanes(d, s::Add(acc0, acc1)));
    }
    for (; k < len; ++k) {
        dst[k] = std::exp(src[k] - shift);
        total += dst[k];
    }
    return total;
}

} // namespace detail

// =============================================================================
// Forward
// =============================================================================

// out = softmax(in); in and out may alias
inline void softmax_row(Array<const Real> in, Array<Real> out) {
    STMAP_ASSERT(in.len == out.len, "softmax_row: size mismatch");
    const Size len = in.len;
    if (STMAP_UNLIKELY(len == 0)) return;

    // Subtracting the row max keeps exp() finite for any finite logits
    const Real sum = detail::exp_shifted(in.ptr, out.ptr, len, detail::row_max(in.ptr, len));
    vectorize::scale_inplace<Real>(out, Real(1) / sum);
}

// Each row of probs becomes a distribution over spots
inline void softmax_rows(DenseArray<const Real> logits, DenseArray<Real> probs) {
    STMAP_CHECK_DIM(logits.rows == probs.rows && logits.cols == probs.cols,
                    "softmax_rows: logits and probabilities differ in shape");

    threading::parallel_for(Size(0), static_cast<Size>(logits.rows), [&](size_t i) {
        softmax_row(logits.row(static_cast<Index>(i)), probs.row(static_cast<Index>(i)));
    });
}

// =============================================================================
// Backward
// =============================================================================

// grad_logits[i,j] = P[i,j] * (grad_probs[i,j] - sum_k P[i,k] * grad_probs[i,k])
inline void softmax_backward_rows(DenseArray<const Real> probs,
                                  DenseArray<const Real> grad_probs,
                                  DenseArray<Real> grad_logits) {
    STMAP_CHECK_DIM(probs.rows == grad_probs.rows && probs.cols == grad_probs.cols,
                    "softmax_backward_rows: gradient shape differs from probabilities");
    STMAP_CHECK_DIM(probs.rows == grad_logits.rows && probs.cols == grad_logits.cols,
                    "softmax_backward_rows: output shape differs from probabilities");

    const Size n_cols = static_cast<Size>(probs.cols);

    threading::parallel_for(Size(0), static_cast<Size>(probs.rows), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        const Real* STMAP_RESTRICT p = probs.row(r).ptr;
        const Real* STMAP_RESTRICT g = grad_probs.row(r).ptr;
        Real* STMAP_RESTRICT out = grad_logits.row(r).ptr;

        const Real inner = vectorize::dot<Real>(probs.row(r), grad_probs.row(r));

        namespace s = stmap::simd;
        const s::Tag d;
        const size_t lanes = s::Lanes(d);
        const auto v_inner = s::Set(d, inner);

        Size k = 0;
        for (; k + lanes <= n_cols; k += lanes) {
            auto v = s::Mul(s::LoadU(d, p + k), s::Sub(s::LoadU(d, g + k), v_inner));
            s::StoreU(v, d, out + k);
        }
        for (; k < n_cols; ++k) {
            out[k] = p[k] * (g[k] - inner);
        }
    });
}

} // namespace stmap::kernel::softmax
