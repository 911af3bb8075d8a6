#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <cmath>

// =============================================================================
// FILE: stmap/kernel/entropy.hpp
// BRIEF: Entropy and KL divergence terms of the mapping objective
// =============================================================================

namespace stmap::kernel::entropy {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    // Floor applied before every logarithm
    constexpr Real EPSILON = Real(1e-12);
}

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

STMAP_FORCE_INLINE Real safe_log(Real x) noexcept {
    return std::log(x > config::EPSILON ? x : config::EPSILON);
}

STMAP_FORCE_INLINE Real plogp(Real p) noexcept {
    return (p > Real(0)) ? p * safe_log(p) : Real(0);
}

} // namespace detail

// =============================================================================
// Negative Entropy
// =============================================================================

// sum_k p[k] * log p[k]; zero entries contribute nothing
inline Real plogp_sum(Array<const Real> p) noexcept {
    Real acc0 = Real(0), acc1 = Real(0), acc2 = Real(0), acc3 = Real(0);
    Size k = 0;
    for (; k + 4 <= p.len; k += 4) {
        acc0 += detail::plogp(p.ptr[k + 0]);
        acc1 += detail::plogp(p.ptr[k + 1]);
        acc2 += detail::plogp(p.ptr[k + 2]);
        acc3 += detail::plogp(p.ptr[k + 3]);
    }
    Real acc = (acc0 + acc1) + (acc2 + acc3);
    for (; k < p.len; ++k) {
        acc += detail::plogp(p.ptr[k]);
    }
    return acc;
}

// Rows are reduced in order so the total is independent of the worker count
inline Real plogp_total(DenseArray<const Real> probs) noexcept {
    Real total = Real(0);
    for (Index r = 0; r < probs.rows; ++r) {
        total += plogp_sum(probs.row(r));
    }
    return total;
}

// grad[i, j] += coef * (log P[i, j] + 1)
inline void plogp_backward(DenseArray<const Real> probs, Real coef, DenseArray<Real> grad) {
    STMAP_CHECK_DIM(probs.rows == grad.rows && probs.cols == grad.cols,
                    "plogp_backward: gradient shape differs from probabilities");

    threading::parallel_for(Size(0), static_cast<Size>(probs.rows), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        const Real* STMAP_RESTRICT p = probs.row(r).ptr;
        Real* STMAP_RESTRICT g = grad.row(r).ptr;
        for (Index j = 0; j < probs.cols; ++j) {
            g[j] += coef * (detail::safe_log(p[j]) + Real(1));
        }
    });
}

// =============================================================================
// KL Divergence
// =============================================================================

// KL(p || q) = sum_k p[k] * (log p[k] - log q[k]); q is floored at EPSILON
inline Real kl_divergence(Array<const Real> p, Array<const Real> q) {
    STMAP_CHECK_DIM(p.len == q.len, "kl_divergence: length mismatch");

    Real kl = Real(0);
    for (Size k = 0; k < p.len; ++k) {
        if (p.ptr[k] > Real(0)) {
            kl += p.ptr[k] * (detail::safe_log(p.ptr[k]) - detail::safe_log(q.ptr[k]));
        }
    }
    return kl;
}

// out[k] = d KL(p || q) / d p[k] = log p[k] - log q[k] + 1
inline void kl_gradient(Array<const Real> p, Array<const Real> q, Array<Real> out) {
    STMAP_CHECK_DIM(p.len == q.len && p.len == out.len, "kl_gradient: length mismatch");

    for (Size k = 0; k < p.len; ++k) {
        out.ptr[k] = detail::safe_log(p.ptr[k]) - detail::safe_log(q.ptr[k]) + Real(1);
    }
}

} // namespace stmap::kernel::entropy
