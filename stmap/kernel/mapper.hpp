#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/memory.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/core/macros.hpp"
#include "stmap/core/vectorize.hpp"
#include "stmap/device/device.hpp"
#include "stmap/kernel/softmax.hpp"
#include "stmap/kernel/similarity.hpp"
#include "stmap/kernel/entropy.hpp"
#include "stmap/kernel/adam.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>

// =============================================================================
// FILE: stmap/kernel/mapper.hpp
// BRIEF: Learn a row-stochastic cell-to-spot mapping by gradient descent
// =============================================================================
//
// Parameterization: P = softmax_rows(Theta), Theta unconstrained (cells x spots).
//
// Objective (minimized):
//   L = lambda_g1 * mean_g (1 - cos(Gp[:, g], G[:, g]))
//     + lambda_g2 * mean_s (1 - cos(Gp[s, :], G[s, :]))
//     + lambda_d  * KL(p || d~)
//     + lambda_r  * sum_ij P_ij log P_ij
// with Gp = P^T S, p = column sums of P / n_cells and d~ = d / sum(d).
//
// A step evaluates L at the current Theta, back-propagates analytically
// through the row softmax and applies one Adam update. The reported loss is
// the value before the update.
// =============================================================================

namespace stmap::kernel::mapper {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Real LEARNING_RATE = Real(0.1);
    constexpr Index NUM_EPOCHS = 1000;
    constexpr std::uint64_t SEED = 0;
    constexpr Index PRINT_EACH = 100;
    // Floor for log(M) when resuming from a previous mapping
    constexpr Real RESUME_FLOOR = Real(1e-30);
}

// =============================================================================
// Types
// =============================================================================

struct Hyperparameters {
    Real lambda_d = Real(0);
    Real lambda_g1 = Real(1);
    Real lambda_g2 = Real(0);
    Real lambda_r = Real(0);
};

// Weighted contribution of each term; total is their sum
struct LossTerms {
    Real gene = Real(0);
    Real spot = Real(0);
    Real density = Real(0);
    Real entropy = Real(0);
    Real total = Real(0);
};

// Everything a step mutates. Exclusively owned by whoever drives training.
struct MapperState {
    DenseMatrix logits;
    adam::Moments moments;
    Index epoch = 0;

    MapperState() = default;
    MapperState(Index n_cells, Index n_spots)
        : logits(n_cells, n_spots), moments(n_cells, n_spots) {}

    STMAP_NODISCARD MapperState clone() const {
        MapperState out;
        out.logits = logits.clone();
        out.moments = moments.clone();
        out.epoch = epoch;
        return out;
    }
};

// Read-only inputs of a step. density is the normalized target and may be
// empty when lambda_d == 0.
struct Problem {
    DenseArray<const Real> cells;
    DenseArray<const Real> space;
    Array<const Real> density;
    Hyperparameters hp;

    STMAP_NODISCARD Index n_cells() const noexcept { return cells.rows; }
    STMAP_NODISCARD Index n_spots() const noexcept { return space.rows; }
    STMAP_NODISCARD Index n_genes() const noexcept { return cells.cols; }
};

// Scratch buffers reused across steps
struct Workspace {
    DenseMatrix probs;        // cells x spots
    DenseMatrix predicted;    // spots x genes
    DenseMatrix grad_pred;    // spots x genes
    DenseMatrix grad_probs;   // cells x spots
    DenseMatrix grad_logits;  // cells x spots
    memory::AlignedBuffer<Real> gene_cos;
    memory::AlignedBuffer<Real> spot_cos;
    memory::AlignedBuffer<Real> spot_mass;
    memory::AlignedBuffer<Real> density_grad;

    Workspace() = default;
    Workspace(Index n_cells, Index n_spots, Index n_genes)
        : probs(n_cells, n_spots),
          predicted(n_spots, n_genes),
          grad_pred(n_spots, n_genes),
          grad_probs(n_cells, n_spots),
          grad_logits(n_cells, n_spots),
          gene_cos(static_cast<Size>(n_genes)),
          spot_cos(static_cast<Size>(n_spots)),
          spot_mass(static_cast<Size>(n_spots)),
          density_grad(static_cast<Size>(n_spots)) {}
};

struct EpochRecord {
    Index epoch;
    Real loss;
    LossTerms terms;
};

using EpochObserver = std::function<void(const EpochRecord&)>;

// =============================================================================
// Forward / Backward
// =============================================================================

namespace detail {

// predicted[j, :] = sum_i P[i, j] * S[i, :]
inline void predict(DenseArray<const Real> probs, DenseArray<const Real> cells,
                    DenseArray<Real> predicted) {
    threading::parallel_for(Size(0), static_cast<Size>(predicted.rows), [&](size_t j) {
        const Index spot = static_cast<Index>(j);
        Array<Real> out = predicted.row(spot);
        memory::zero(out);
        for (Index i = 0; i < cells.rows; ++i) {
            const Real w = probs(i, spot);
            if (w != Real(0)) {
                vectorize::axpy<Real>(w, cells.row(i), out);
            }
        }
    });
}

// mass[j] = sum_i P[i, j] / n_cells, accumulated in row order
inline void spot_mass(DenseArray<const Real> probs, Array<Real> mass) {
    memory::zero(mass);
    for (Index i = 0; i < probs.rows; ++i) {
        vectorize::axpy<Real>(Real(1), probs.row(i), mass);
    }
    if (probs.rows > 0) {
        vectorize::scale_inplace<Real>(mass, Real(1) / static_cast<Real>(probs.rows));
    }
}

inline Real mean_dissimilarity(Array<const Real> cos) noexcept {
    if (cos.len == 0) return Real(0);
    Real acc = Real(0);
    for (Size k = 0; k < cos.len; ++k) {
        acc += Real(1) - cos.ptr[k];
    }
    return acc / static_cast<Real>(cos.len);
}

// Loss at ws.probs, which must already hold softmax(logits)
inline LossTerms loss_at(const Problem& pb, Workspace& ws) {
    LossTerms terms;
    const Hyperparameters& hp = pb.hp;

    predict(ws.probs.view(), pb.cells, ws.predicted.view());

    if (hp.lambda_g1 > Real(0)) {
        similarity::cosine_columns(ws.predicted.view(), pb.space, ws.gene_cos.array());
        terms.gene = hp.lambda_g1 * mean_dissimilarity(ws.gene_cos.array());
    }
    if (hp.lambda_g2 > Real(0)) {
        similarity::cosine_rows(ws.predicted.view(), pb.space, ws.spot_cos.array());
        terms.spot = hp.lambda_g2 * mean_dissimilarity(ws.spot_cos.array());
    }
    if (hp.lambda_d > Real(0)) {
        spot_mass(ws.probs.view(), ws.spot_mass.array());
        terms.density = hp.lambda_d * entropy::kl_divergence(ws.spot_mass.array(), pb.density);
    }
    if (hp.lambda_r > Real(0)) {
        terms.entropy = hp.lambda_r * entropy::plogp_total(ws.probs.view());
    }

    terms.total = terms.gene + terms.spot + terms.density + terms.entropy;
    return terms;
}

// ws.grad_logits = dL / dTheta; relies on the buffers filled by loss_at
inline void backward(const Problem& pb, Workspace& ws) {
    const Hyperparameters& hp = pb.hp;
    auto grad_probs = ws.grad_probs.view();
    memory::zero(ws.grad_probs.values());

    const bool similarity_active = hp.lambda_g1 > Real(0) || hp.lambda_g2 > Real(0);
    if (similarity_active) {
        auto grad_pred = ws.grad_pred.view();
        memory::zero(ws.grad_pred.values());

        if (hp.lambda_g1 > Real(0)) {
            similarity::cosine_columns_backward(ws.predicted.view(), pb.space,
                -hp.lambda_g1 / static_cast<Real>(pb.n_genes()), grad_pred);
        }
        if (hp.lambda_g2 > Real(0)) {
            similarity::cosine_rows_backward(ws.predicted.view(), pb.space,
                -hp.lambda_g2 / static_cast<Real>(pb.n_spots()), grad_pred);
        }

        // dL/dP[i, j] = <S[i, :], dL/dGp[j, :]>
        DenseArray<const Real> gp = grad_pred;
        threading::parallel_for(Size(0), static_cast<Size>(pb.n_cells()), [&](size_t i) {
            const Index cell = static_cast<Index>(i);
            Array<const Real> s_row = pb.cells.row(cell);
            Real* STMAP_RESTRICT out = grad_probs.row(cell).ptr;
            for (Index j = 0; j < pb.n_spots(); ++j) {
                out[j] = vectorize::dot<Real>(s_row, gp.row(j));
            }
        });
    }

    if (hp.lambda_d > Real(0)) {
        entropy::kl_gradient(ws.spot_mass.array(), pb.density, ws.density_grad.array());
        vectorize::scale_inplace<Real>(ws.density_grad.array(),
                                       hp.lambda_d / static_cast<Real>(pb.n_cells()));
        Array<const Real> dg = ws.density_grad.array();
        threading::parallel_for(Size(0), static_cast<Size>(pb.n_cells()), [&](size_t i) {
            vectorize::axpy<Real>(Real(1), dg, grad_probs.row(static_cast<Index>(i)));
        });
    }

    if (hp.lambda_r > Real(0)) {
        entropy::plogp_backward(ws.probs.view(), hp.lambda_r, grad_probs);
    }

    softmax::softmax_backward_rows(ws.probs.view(), ws.grad_probs.view(), ws.grad_logits.view());
}

} // namespace detail

// Loss of the current logits without updating anything
inline LossTerms evaluate(const MapperState& state, const Problem& pb, Workspace& ws) {
    softmax::softmax_rows(state.logits.view(), ws.probs.view());
    return detail::loss_at(pb, ws);
}

// One epoch: loss and gradient at the current logits, then one Adam update
inline LossTerms step(MapperState& state, const Problem& pb, Real lr, Workspace& ws) {
    STMAP_CHECK_ARG(std::isfinite(lr) && lr > Real(0),
                    "step: learning rate must be positive and finite");

    LossTerms terms = evaluate(state, pb, ws);
    detail::backward(pb, ws);
    adam::update(state.logits.view(), ws.grad_logits.view(), state.moments, lr);
    state.epoch += 1;
    return terms;
}

// =============================================================================
// Mapper
// =============================================================================

class Mapper;

// Lazily trains one epoch per increment
class EpochIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EpochRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = const EpochRecord*;
    using reference = const EpochRecord&;

    EpochIterator() = default;
    EpochIterator(Mapper* mapper, Index remaining, Real lr);

    // The epoch under the iterator is trained on first access
    reference operator*() const { settle(); return current_; }
    pointer operator->() const { settle(); return &current_; }

    EpochIterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(std::default_sentinel_t) const noexcept { return remaining_ <= 0; }

private:
    void settle() const;

    Mapper* mapper_ = nullptr;
    Index remaining_ = 0;
    Real lr_ = config::LEARNING_RATE;
    mutable bool pending_ = false;
    mutable EpochRecord current_{0, Real(0), LossTerms{}};
};

class EpochRange {
public:
    EpochRange(Mapper* mapper, Index n, Real lr) noexcept
        : mapper_(mapper), n_(n), lr_(lr) {}

    EpochIterator begin() const { return EpochIterator(mapper_, n_, lr_); }
    std::default_sentinel_t end() const noexcept { return {}; }

private:
    Mapper* mapper_;
    Index n_;
    Real lr_;
};

class Mapper {
public:
    // cells: n_cells x n_genes, space: n_spots x n_genes, density: n_spots
    // (ignored when lambda_d == 0). previous, when given, is a trained
    // n_cells x n_spots mapping to resume from. All inputs are copied.
    Mapper(DenseArray<const Real> cells,
           DenseArray<const Real> space,
           Array<const Real> density,
           const Hyperparameters& hp,
           std::string_view device_id = "cpu",
           std::optional<DenseArray<const Real>> previous = std::nullopt,
           std::uint64_t seed = config::SEED,
           size_t num_threads = 0)
        : spec_(validate(cells, space, density, hp, device_id, previous)),
          device_(spec_, num_threads),
          cells_(device_.upload(cells)),
          space_(device_.upload(space)),
          density_(hp.lambda_d > Real(0) ? device_.allocate(static_cast<Size>(space.rows))
                                         : memory::AlignedBuffer<Real>()),
          hp_(hp),
          state_(cells.rows, space.rows),
          ws_(cells.rows, space.rows, cells.cols)
    {
        if (hp_.lambda_d > Real(0)) {
            normalize_density(density, density_.array());
        }
        if (previous) {
            init_from_mapping(*previous);
        } else {
            init_random(seed);
        }
        STMAP_LOG_DEBUG("Mapper: %lld cells, %lld spots, %lld genes",
                        static_cast<long long>(n_cells()),
                        static_cast<long long>(n_spots()),
                        static_cast<long long>(n_genes()));
    }

    Mapper(const Mapper&) = delete;
    Mapper& operator=(const Mapper&) = delete;

    STMAP_NODISCARD Index n_cells() const noexcept { return cells_.rows(); }
    STMAP_NODISCARD Index n_spots() const noexcept { return space_.rows(); }
    STMAP_NODISCARD Index n_genes() const noexcept { return cells_.cols(); }
    STMAP_NODISCARD Index epochs_done() const noexcept { return state_.epoch; }
    STMAP_NODISCARD const Hyperparameters& hyperparameters() const noexcept { return hp_; }
    STMAP_NODISCARD const device::ComputeDevice& device() const noexcept { return device_; }
    STMAP_NODISCARD const MapperState& state() const noexcept { return state_; }

    STMAP_NODISCARD Problem problem() const noexcept {
        return Problem{cells_.view(), space_.view(), density_.array(), hp_};
    }

    LossTerms step(Real lr = config::LEARNING_RATE) {
        return mapper::step(state_, problem(), lr, ws_);
    }

    LossTerms evaluate() {
        return mapper::evaluate(state_, problem(), ws_);
    }

    // Range of n lazily trained epochs
    EpochRange epochs(Index n, Real lr = config::LEARNING_RATE) {
        STMAP_CHECK_ARG(n >= 0, "epochs: negative epoch count");
        STMAP_CHECK_ARG(std::isfinite(lr) && lr > Real(0),
                        "epochs: learning rate must be positive and finite");
        return EpochRange(this, n, lr);
    }

    // Runs exactly n epochs; returns the loss of the last one (or the current
    // loss when n == 0)
    Real train(Index n = config::NUM_EPOCHS,
               Real lr = config::LEARNING_RATE,
               const EpochObserver& observer = nullptr,
               Index print_each = config::PRINT_EACH) {
        Real last = Real(0);
        bool ran = false;
        for (const EpochRecord& rec : epochs(n, lr)) {
            if (print_each > 0 && rec.epoch % print_each == 0) {
                STMAP_LOG_DEBUG("epoch %lld: loss %.6g (gene %.6g, spot %.6g, density %.6g, entropy %.6g)",
                                static_cast<long long>(rec.epoch),
                                static_cast<double>(rec.loss),
                                static_cast<double>(rec.terms.gene),
                                static_cast<double>(rec.terms.spot),
                                static_cast<double>(rec.terms.density),
                                static_cast<double>(rec.terms.entropy));
            }
            if (observer) observer(rec);
            last = rec.loss;
            ran = true;
        }
        return ran ? last : evaluate().total;
    }

    // Continue exactly where another session stopped: logits, Adam moments
    // and epoch count are copied, so further epochs follow the same path as
    // if training had never been interrupted. Hyperparameters stay this
    // session's own.
    void restore(const MapperState& saved) {
        const DenseMatrix& lg = saved.logits;
        if (lg.rows() != n_cells() || lg.cols() != n_spots() ||
            saved.moments.m.rows() != n_cells() || saved.moments.m.cols() != n_spots() ||
            saved.moments.v.rows() != n_cells() || saved.moments.v.cols() != n_spots()) {
            throw ShapeMismatchError(
                "Mapper::restore: saved state is " + std::to_string(lg.rows()) + "x" +
                std::to_string(lg.cols()) + ", expected " + std::to_string(n_cells()) +
                "x" + std::to_string(n_spots()));
        }
        STMAP_CHECK_ARG(saved.epoch >= 0 && saved.moments.step >= 0,
                        "Mapper::restore: negative step count");
        if (&saved == &state_) return;

        memory::copy_fast(lg.values(), state_.logits.values());
        memory::copy_fast(saved.moments.m.values(), state_.moments.m.values());
        memory::copy_fast(saved.moments.v.values(), state_.moments.v.values());
        state_.moments.step = saved.moments.step;
        state_.epoch = saved.epoch;
    }

    // Row-stochastic mapping softmax(logits), cells x spots
    void write_mapping(DenseArray<Real> out) const {
        STMAP_CHECK_DIM(out.rows == n_cells() && out.cols == n_spots(),
                        "write_mapping: output must be " + std::to_string(n_cells()) +
                        "x" + std::to_string(n_spots()));
        softmax::softmax_rows(state_.logits.view(), out);
    }

    STMAP_NODISCARD DenseMatrix mapping() const {
        DenseMatrix out(n_cells(), n_spots());
        write_mapping(out.view());
        return out;
    }

private:
    static device::DeviceSpec validate(DenseArray<const Real> cells,
                                       DenseArray<const Real> space,
                                       Array<const Real> density,
                                       const Hyperparameters& hp,
                                       std::string_view device_id,
                                       const std::optional<DenseArray<const Real>>& previous) {
        device::DeviceSpec spec = device::parse_device(device_id);

        if (cells.cols != space.cols) {
            throw DimensionMismatchError(
                "Mapper: cells have " + std::to_string(cells.cols) + " genes but space has " +
                std::to_string(space.cols));
        }
        STMAP_CHECK_ARG(cells.rows > 0, "Mapper: no cells");
        STMAP_CHECK_ARG(space.rows > 0, "Mapper: no spots");
        STMAP_CHECK_ARG(cells.cols > 0, "Mapper: no training genes");
        STMAP_CHECK_NULL(cells.ptr, "Mapper: cell expression is null");
        STMAP_CHECK_NULL(space.ptr, "Mapper: spatial expression is null");

        if (previous) {
            if (previous->rows != cells.rows || previous->cols != space.rows) {
                throw ShapeMismatchError(
                    "Mapper: previous mapping is " + std::to_string(previous->rows) + "x" +
                    std::to_string(previous->cols) + ", expected " +
                    std::to_string(cells.rows) + "x" + std::to_string(space.rows));
            }
            STMAP_CHECK_NULL(previous->ptr, "Mapper: previous mapping is null");
        }

        if (hp.lambda_d > Real(0)) {
            if (density.len != static_cast<Size>(space.rows)) {
                throw DimensionMismatchError(
                    "Mapper: density has " + std::to_string(density.len) +
                    " entries for " + std::to_string(space.rows) + " spots");
            }
            Real mass = Real(0);
            for (Size k = 0; k < density.len; ++k) {
                STMAP_CHECK_ARG(std::isfinite(density[static_cast<Index>(k)]) &&
                                density[static_cast<Index>(k)] >= Real(0),
                                "Mapper: density entries must be finite and non-negative");
                mass += density[static_cast<Index>(k)];
            }
            STMAP_CHECK_ARG(mass > Real(0), "Mapper: density has no mass");
        }

        auto check_weight = [](Real w, const char* name) {
            STMAP_CHECK_ARG(std::isfinite(w) && w >= Real(0),
                            std::string("Mapper: ") + name + " must be finite and non-negative");
        };
        check_weight(hp.lambda_d, "lambda_d");
        check_weight(hp.lambda_g1, "lambda_g1");
        check_weight(hp.lambda_g2, "lambda_g2");
        check_weight(hp.lambda_r, "lambda_r");

        return spec;
    }

    static void normalize_density(Array<const Real> src, Array<Real> dst) {
        memory::copy_fast(src, dst);
        vectorize::scale_inplace<Real>(dst, Real(1) / vectorize::sum<Real>(src));
    }

    void init_random(std::uint64_t seed) {
        std::mt19937_64 rng(seed);
        std::normal_distribution<Real> normal(Real(0), Real(1));
        for (Real& x : state_.logits.values()) {
            x = normal(rng);
        }
    }

    // softmax(log M) == M for row-stochastic M
    void init_from_mapping(DenseArray<const Real> previous) {
        auto logits = state_.logits.values();
        const Real* src = previous.ptr;
        for (Size k = 0; k < logits.len; ++k) {
            const Real m = src[k];
            logits.ptr[k] = std::log(m > config::RESUME_FLOOR ? m : config::RESUME_FLOOR);
        }
    }

    device::DeviceSpec spec_;
    device::ComputeDevice device_;
    DenseMatrix cells_;
    DenseMatrix space_;
    memory::AlignedBuffer<Real> density_;
    Hyperparameters hp_;
    MapperState state_;
    Workspace ws_;
};

// =============================================================================
// EpochIterator
// =============================================================================

inline EpochIterator::EpochIterator(Mapper* mapper, Index remaining, Real lr)
    : mapper_(mapper), remaining_(remaining), lr_(lr), pending_(remaining > 0) {}

// Skipping an epoch without reading it still trains it
inline EpochIterator& EpochIterator::operator++() {
    settle();
    remaining_ -= 1;
    pending_ = remaining_ > 0;
    return *this;
}

inline void EpochIterator::settle() const {
    if (!pending_) return;
    pending_ = false;
    const LossTerms terms = mapper_->step(lr_);
    current_ = EpochRecord{mapper_->epochs_done(), terms.total, terms};
}

} // namespace stmap::kernel::mapper
