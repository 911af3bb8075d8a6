#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/simd.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/memory.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/core/vectorize.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <cmath>

// =============================================================================
// FILE: stmap/kernel/similarity.hpp
// BRIEF: Cosine similarity between matching rows or columns, with gradients
// =============================================================================
//
// A zero-norm operand yields cosine 0 and contributes no gradient.
// Column statistics are accumulated row by row in a fixed order so results
// do not depend on the worker count.
// =============================================================================

namespace stmap::kernel::similarity {

namespace detail {

struct ColumnMoments {
    memory::AlignedBuffer<Real> ab;
    memory::AlignedBuffer<Real> aa;
    memory::AlignedBuffer<Real> bb;
};

// a += x * y, element-wise
STMAP_FORCE_INLINE void fma_accumulate(const Real* STMAP_RESTRICT x,
                                       const Real* STMAP_RESTRICT y,
                                       Real* STMAP_RESTRICT acc, Size len) {
    namespace s = stmap::simd;
    const s::Tag d;
    const size_t lanes = s::Lanes(d);

    Size k = 0;
    for (; k + lanes <= len; k += lanes) {
        auto v = s::MulAdd(s::LoadU(d, x + k), s::LoadU(d, y + k), s::LoadU(d, acc + k));
        s::StoreU(v, d, acc + k);
    }
    for (; k < len; ++k) {
        acc[k] += x[k] * y[k];
    }
}

inline ColumnMoments column_moments(DenseArray<const Real> a, DenseArray<const Real> b) {
    const Size n_cols = static_cast<Size>(a.cols);
    ColumnMoments m{memory::AlignedBuffer<Real>(n_cols),
                    memory::AlignedBuffer<Real>(n_cols),
                    memory::AlignedBuffer<Real>(n_cols)};

    for (Index r = 0; r < a.rows; ++r) {
        const Real* ra = a.row(r).ptr;
        const Real* rb = b.row(r).ptr;
        fma_accumulate(ra, rb, m.ab.get(), n_cols);
        fma_accumulate(ra, ra, m.aa.get(), n_cols);
        fma_accumulate(rb, rb, m.bb.get(), n_cols);
    }
    return m;
}

STMAP_FORCE_INLINE Real cosine_from_moments(Real ab, Real aa, Real bb) noexcept {
    if (aa <= Real(0) || bb <= Real(0)) return Real(0);
    return ab / (std::sqrt(aa) * std::sqrt(bb));
}

inline void check_same_shape(DenseArray<const Real> a, DenseArray<const Real> b, const char* who) {
    STMAP_CHECK_DIM(a.rows == b.rows && a.cols == b.cols,
                    std::string(who) + ": operands differ in shape (" +
                    std::to_string(a.rows) + "x" + std::to_string(a.cols) + " vs " +
                    std::to_string(b.rows) + "x" + std::to_string(b.cols) + ")");
}

} // namespace detail

// =============================================================================
// Forward
// =============================================================================

inline Real cosine(Array<const Real> a, Array<const Real> b) {
    STMAP_CHECK_DIM(a.len == b.len, "cosine: length mismatch");
    return detail::cosine_from_moments(vectorize::dot<Real>(a, b),
                                       vectorize::dot<Real>(a, a),
                                       vectorize::dot<Real>(b, b));
}

// out[j] = cos(a[:, j], b[:, j])
inline void cosine_columns(DenseArray<const Real> a, DenseArray<const Real> b, Array<Real> out) {
    detail::check_same_shape(a, b, "cosine_columns");
    STMAP_CHECK_DIM(out.len == static_cast<Size>(a.cols), "cosine_columns: output length mismatch");

    auto m = detail::column_moments(a, b);
    for (Size j = 0; j < out.len; ++j) {
        out.ptr[j] = detail::cosine_from_moments(m.ab[j], m.aa[j], m.bb[j]);
    }
}

// out[i] = cos(a[i, :], b[i, :])
inline void cosine_rows(DenseArray<const Real> a, DenseArray<const Real> b, Array<Real> out) {
    detail::check_same_shape(a, b, "cosine_rows");
    STMAP_CHECK_DIM(out.len == static_cast<Size>(a.rows), "cosine_rows: output length mismatch");

    threading::parallel_for(Size(0), out.len, [&](size_t i) {
        const Index r = static_cast<Index>(i);
        out.ptr[i] = cosine(a.row(r), b.row(r));
    });
}

// =============================================================================
// Backward
// =============================================================================
//
// d cos(a, b) / d a = b / (|a| |b|) - cos(a, b) * a / |a|^2
// Both functions accumulate coef times that derivative into grad_a.

inline void cosine_columns_backward(DenseArray<const Real> a, DenseArray<const Real> b,
                                    Real coef, DenseArray<Real> grad_a) {
    detail::check_same_shape(a, b, "cosine_columns_backward");
    detail::check_same_shape(a, grad_a, "cosine_columns_backward");

    const Size n_cols = static_cast<Size>(a.cols);
    auto m = detail::column_moments(a, b);

    // grad[:, j] += alpha[j] * b[:, j] - beta[j] * a[:, j]
    memory::AlignedBuffer<Real> alpha(n_cols);
    memory::AlignedBuffer<Real> beta(n_cols);
    for (Size j = 0; j < n_cols; ++j) {
        if (m.aa[j] <= Real(0) || m.bb[j] <= Real(0)) continue;
        const Real na = std::sqrt(m.aa[j]);
        const Real nb = std::sqrt(m.bb[j]);
        const Real cos = m.ab[j] / (na * nb);
        alpha[j] = coef / (na * nb);
        beta[j] = coef * cos / m.aa[j];
    }

    threading::parallel_for(Size(0), static_cast<Size>(a.rows), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        const Real* STMAP_RESTRICT ra = a.row(r).ptr;
        const Real* STMAP_RESTRICT rb = b.row(r).ptr;
        Real* STMAP_RESTRICT rg = grad_a.row(r).ptr;
        const Real* STMAP_RESTRICT al = alpha.get();
        const Real* STMAP_RESTRICT be = beta.get();

        namespace s = stmap::simd;
        const s::Tag d;
        const size_t lanes = s::Lanes(d);

        Size k = 0;
        for (; k + lanes <= n_cols; k += lanes) {
            auto acc = s::LoadU(d, rg + k);
            acc = s::MulAdd(s::LoadU(d, al + k), s::LoadU(d, rb + k), acc);
            acc = s::NegMulAdd(s::LoadU(d, be + k), s::LoadU(d, ra + k), acc);
            s::StoreU(acc, d, rg + k);
        }
        for (; k < n_cols; ++k) {
            rg[k] += al[k] * rb[k] - be[k] * ra[k];
        }
    });
}

inline void cosine_rows_backward(DenseArray<const Real> a, DenseArray<const Real> b,
                                 Real coef, DenseArray<Real> grad_a) {
    detail::check_same_shape(a, b, "cosine_rows_backward");
    detail::check_same_shape(a, grad_a, "cosine_rows_backward");

    threading::parallel_for(Size(0), static_cast<Size>(a.rows), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        const Real aa = vectorize::dot<Real>(a.row(r), a.row(r));
        const Real bb = vectorize::dot<Real>(b.row(r), b.row(r));
        if (aa <= Real(0) || bb <= Real(0)) return;

        const Real na = std::sqrt(aa);
        const Real nb = std::sqrt(bb);
        const Real cos = vectorize::dot<Real>(a.row(r), b.row(r)) / (na * nb);

        vectorize::axpy<Real>(coef / (na * nb), b.row(r), grad_a.row(r));
        vectorize::axpy<Real>(-coef * cos / aa, a.row(r), grad_a.row(r));
    });
}

} // namespace stmap::kernel::similarity
