#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/simd.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <cmath>

// =============================================================================
// FILE: stmap/kernel/adam.hpp
// BRIEF: Bias-corrected Adam update over a dense parameter matrix
// =============================================================================
//
//   m <- b1 * m + (1 - b1) * g
//   v <- b2 * v + (1 - b2) * g^2
//   x <- x - (lr / (1 - b1^t)) * m / (sqrt(v) / sqrt(1 - b2^t) + eps)
// =============================================================================

namespace stmap::kernel::adam {

namespace config {
    constexpr Real BETA1 = Real(0.9);
    constexpr Real BETA2 = Real(0.999);
    constexpr Real EPSILON = Real(1e-8);
}

struct Config {
    Real beta1 = config::BETA1;
    Real beta2 = config::BETA2;
    Real epsilon = config::EPSILON;
};

// First and second moment estimates; step counts completed updates
struct Moments {
    DenseMatrix m;
    DenseMatrix v;
    Index step = 0;

    Moments() = default;
    Moments(Index rows, Index cols) : m(rows, cols), v(rows, cols) {}

    STMAP_NODISCARD Moments clone() const {
        Moments out;
        out.m = m.clone();
        out.v = v.clone();
        out.step = step;
        return out;
    }

    void reset() noexcept {
        memory::zero(m.values());
        memory::zero(v.values());
        step = 0;
    }
};

inline void update(DenseArray<Real> params, DenseArray<const Real> grad,
                   Moments& moments, Real lr, const Config& cfg = Config{}) {
    STMAP_CHECK_DIM(params.rows == grad.rows && params.cols == grad.cols,
                    "adam::update: gradient shape differs from parameters");
    STMAP_CHECK_DIM(params.rows == moments.m.rows() && params.cols == moments.m.cols(),
                    "adam::update: moment shape differs from parameters");

    moments.step += 1;
    const Real t = static_cast<Real>(moments.step);
    const Real bias1 = Real(1) - std::pow(cfg.beta1, t);
    const Real bias2 = Real(1) - std::pow(cfg.beta2, t);
    const Real step_size = lr / bias1;
    const Real inv_sqrt_bias2 = Real(1) / std::sqrt(bias2);

    const Real b1 = cfg.beta1;
    const Real b2 = cfg.beta2;
    const Real c1 = Real(1) - cfg.beta1;
    const Real c2 = Real(1) - cfg.beta2;
    const Real eps = cfg.epsilon;
    const Size n_cols = static_cast<Size>(params.cols);

    DenseArray<Real> m = moments.m.view();
    DenseArray<Real> v = moments.v.view();

    threading::parallel_for(Size(0), static_cast<Size>(params.rows), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        Real* STMAP_RESTRICT x = params.row(r).ptr;
        const Real* STMAP_RESTRICT g = grad.row(r).ptr;
        Real* STMAP_RESTRICT mr = m.row(r).ptr;
        Real* STMAP_RESTRICT vr = v.row(r).ptr;

        namespace s = stmap::simd;
        const s::Tag d;
        const size_t lanes = s::Lanes(d);

        const auto v_b1 = s::Set(d, b1);
        const auto v_b2 = s::Set(d, b2);
        const auto v_c1 = s::Set(d, c1);
        const auto v_c2 = s::Set(d, c2);
        const auto v_eps = s::Set(d, eps);
        const auto v_step = s::Set(d, step_size);
        const auto v_ib2 = s::Set(d, inv_sqrt_bias2);

        Size k = 0;
        for (; k + lanes <= n_cols; k += lanes) {
            const auto vg = s::LoadU(d, g + k);
            const auto vm = s::MulAdd(v_b1, s::LoadU(d, mr + k), s::Mul(v_c1, vg));
            const auto vv = s::MulAdd(v_b2, s::LoadU(d, vr + k), s::Mul(v_c2, s::Mul(vg, vg)));
            const auto denom = s::MulAdd(s::Sqrt(vv), v_ib2, v_eps);
            const auto vx = s::NegMulAdd(v_step, s::Div(vm, denom), s::LoadU(d, x + k));
            s::StoreU(vm, d, mr + k);
            s::StoreU(vv, d, vr + k);
            s::StoreU(vx, d, x + k);
        }
        for (; k < n_cols; ++k) {
            mr[k] = b1 * mr[k] + c1 * g[k];
            vr[k] = b2 * vr[k] + c2 * g[k] * g[k];
            x[k] -= step_size * mr[k] / (std::sqrt(vr[k]) * inv_sqrt_bias2 + eps);
        }
    });
}

} // namespace stmap::kernel::adam
