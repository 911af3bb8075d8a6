// =============================================================================
// stmap - Training Kernel Tests
// =============================================================================
//
// Exercises kernel/mapper.hpp, kernel/align.hpp, kernel/ingest.hpp,
// kernel/mapping.hpp and device/device.hpp through their C++ interfaces.
//
// =============================================================================

#include "test.hpp"

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"
#include "stmap/device/device.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/kernel/align.hpp"
#include "stmap/kernel/mapper.hpp"
#include "stmap/kernel/mapping.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

using namespace stmap::test;

using stmap::Array;
using stmap::DenseArray;
using stmap::DenseMatrix;
using stmap::Index;
using stmap::Real;
using stmap::Size;

namespace mp = stmap::kernel::mapper;

namespace {

constexpr bool DOUBLE_PRECISION = std::is_same_v<Real, double>;

DenseMatrix dense_from(const std::vector<Real>& v, Index rows, Index cols) {
    return DenseMatrix::from(DenseArray<const Real>(v.data(), rows, cols));
}

DenseArray<const Real> view_of(const std::vector<Real>& v, Index rows, Index cols) {
    return DenseArray<const Real>(v.data(), rows, cols);
}

stmap::Dataset annotated(const std::vector<Real>& values, Index rows, Index cols,
                         std::vector<std::string> obs, std::vector<std::string> var) {
    stmap::Dataset ds;
    ds.X = dense_from(values, rows, cols);
    ds.obs_names = std::move(obs);
    ds.var_names = std::move(var);
    return ds;
}

mp::Hyperparameters all_terms() {
    mp::Hyperparameters hp;
    hp.lambda_d = Real(0.5);
    hp.lambda_g1 = Real(1);
    hp.lambda_g2 = Real(0.3);
    hp.lambda_r = Real(0.01);
    return hp;
}

// Inputs for one objective evaluation, in library and oracle form
struct Objective {
    Index n_cells, n_spots, n_genes;
    std::vector<Real> cells;
    std::vector<Real> space;
    std::vector<Real> density;  // normalized
    std::vector<Real> logits;
    mp::Hyperparameters hp;

    Objective(Index c, Index s, Index g, const mp::Hyperparameters& h)
        : n_cells(c), n_spots(s), n_genes(g),
          cells(random_expression(c, g, 0.7)),
          space(random_expression(s, g, 0.7)),
          density(static_cast<std::size_t>(s)),
          logits(static_cast<std::size_t>(c * s)),
          hp(h)
    {
        double mass = 0.0;
        for (auto& d : density) {
            d = static_cast<Real>(global_rng().uniform(0.5, 2.0));
            mass += d;
        }
        for (auto& d : density) d = static_cast<Real>(d / mass);
        for (auto& x : logits) x = static_cast<Real>(global_rng().normal());
    }

    mp::Problem problem() const {
        return mp::Problem{view_of(cells, n_cells, n_genes), view_of(space, n_spots, n_genes),
                           Array<const Real>(density.data(), density.size()), hp};
    }

    oracle::Problem oracle_problem() const {
        oracle::Problem pb;
        pb.cells = to_oracle(cells, n_cells, n_genes);
        pb.space = to_oracle(space, n_spots, n_genes);
        pb.density = to_oracle(density);
        pb.hp.lambda_d = hp.lambda_d;
        pb.hp.lambda_g1 = hp.lambda_g1;
        pb.hp.lambda_g2 = hp.lambda_g2;
        pb.hp.lambda_r = hp.lambda_r;
        return pb;
    }

    mp::MapperState state() const {
        mp::MapperState st(n_cells, n_spots);
        std::copy(logits.begin(), logits.end(), st.logits.data());
        return st;
    }
};

} // namespace

STMAP_TEST_BEGIN

// =============================================================================
// Objective and Gradient
// =============================================================================

STMAP_TEST_SUITE(objective)

STMAP_TEST_CASE(loss_matches_oracle) {
    Objective obj(9, 5, 13, all_terms());
    mp::MapperState st = obj.state();
    mp::Workspace ws(obj.n_cells, obj.n_spots, obj.n_genes);

    const mp::LossTerms terms = mp::evaluate(st, obj.problem(), ws);
    const double expected = oracle::loss(to_oracle(obj.logits, obj.n_cells, obj.n_spots),
                                         obj.oracle_problem());

    const double tol = DOUBLE_PRECISION ? 1e-9 : 1e-4;
    STMAP_ASSERT_NEAR(terms.total, expected, tol * std::max(1.0, std::abs(expected)));
    STMAP_ASSERT_NEAR(double(terms.total),
                      double(terms.gene + terms.spot + terms.density + terms.entropy), tol);
}

STMAP_TEST_CASE(gradient_matches_oracle) {
    Objective obj(8, 6, 11, all_terms());
    mp::MapperState st = obj.state();
    mp::Workspace ws(obj.n_cells, obj.n_spots, obj.n_genes);
    const mp::Problem pb = obj.problem();

    mp::evaluate(st, pb, ws);
    mp::detail::backward(pb, ws);

    const OracleMatrix expected = oracle::gradient(to_oracle(obj.logits, obj.n_cells, obj.n_spots),
                                                   obj.oracle_problem());
    const OracleMatrix actual = to_oracle(ws.grad_logits.data(), obj.n_cells, obj.n_spots);

    const double scale = std::max(1e-3, expected.cwiseAbs().maxCoeff());
    const double tol = DOUBLE_PRECISION ? 1e-8 : 1e-3;
    STMAP_ASSERT_LT(max_abs_diff(actual, expected) / scale, tol);
}

STMAP_TEST_CASE(single_term_gradients_match_oracle) {
    // Each weight alone, so a wrong term cannot hide behind another
    for (int term = 0; term < 4; ++term) {
        mp::Hyperparameters hp;
        hp.lambda_g1 = Real(0);
        if (term == 0) hp.lambda_g1 = Real(1);
        if (term == 1) hp.lambda_g2 = Real(1);
        if (term == 2) hp.lambda_d = Real(1);
        if (term == 3) hp.lambda_r = Real(1);

        Objective obj(5, 4, 7, hp);
        mp::MapperState st = obj.state();
        mp::Workspace ws(obj.n_cells, obj.n_spots, obj.n_genes);
        const mp::Problem pb = obj.problem();
        mp::evaluate(st, pb, ws);
        mp::detail::backward(pb, ws);

        const OracleMatrix expected = oracle::gradient(
            to_oracle(obj.logits, obj.n_cells, obj.n_spots), obj.oracle_problem());
        const OracleMatrix actual = to_oracle(ws.grad_logits.data(), obj.n_cells, obj.n_spots);

        const double scale = std::max(1e-3, expected.cwiseAbs().maxCoeff());
        const double tol = DOUBLE_PRECISION ? 1e-8 : 1e-3;
        STMAP_ASSERT_LT(max_abs_diff(actual, expected) / scale, tol);
    }
}

STMAP_TEST_CASE(oracle_gradient_agrees_with_finite_differences) {
    Objective obj(4, 3, 6, all_terms());
    const OracleMatrix logits = to_oracle(obj.logits, obj.n_cells, obj.n_spots);
    const oracle::Problem pb = obj.oracle_problem();

    const OracleMatrix analytic = oracle::gradient(logits, pb);
    const OracleMatrix numeric = oracle::numerical_gradient(logits, pb);
    STMAP_ASSERT_LT(max_abs_diff(analytic, numeric), 1e-6);
}

STMAP_TEST_CASE(step_reports_loss_before_update) {
    Objective obj(6, 4, 8, all_terms());
    mp::MapperState st = obj.state();
    mp::Workspace ws(obj.n_cells, obj.n_spots, obj.n_genes);
    const mp::Problem pb = obj.problem();

    const Real before = mp::evaluate(st, pb, ws).total;
    const Real reported = mp::step(st, pb, Real(0.01), ws).total;
    STMAP_ASSERT_EQ(reported, before);
    STMAP_ASSERT_EQ(st.epoch, Index(1));
    STMAP_ASSERT_EQ(st.moments.step, Index(1));
    STMAP_ASSERT_LT(mp::evaluate(st, pb, ws).total, before);
}

STMAP_TEST_CASE(step_rejects_bad_learning_rate) {
    Objective obj(3, 3, 4, all_terms());
    mp::MapperState st = obj.state();
    mp::Workspace ws(obj.n_cells, obj.n_spots, obj.n_genes);
    STMAP_ASSERT_THROWS(mp::step(st, obj.problem(), Real(0), ws), stmap::ValueError);
    STMAP_ASSERT_THROWS(mp::step(st, obj.problem(), Real(-1), ws), stmap::ValueError);
    STMAP_ASSERT_EQ(st.epoch, Index(0));
}

STMAP_TEST_SUITE_END

// =============================================================================
// Mapper
// =============================================================================

STMAP_TEST_SUITE(mapper)

STMAP_TEST_CASE(validation_errors) {
    const auto cells = random_expression(4, 5);
    const auto space = random_expression(3, 5);
    const auto narrow = random_expression(3, 4);
    const std::vector<Real> density = {Real(1), Real(2), Real(1)};
    const std::vector<Real> no_mass = {Real(0), Real(0), Real(0)};
    const Array<const Real> d(density.data(), density.size());
    const mp::Hyperparameters simple{};

    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(narrow, 3, 4), d, simple),
                        stmap::DimensionMismatchError);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5), d, simple, "tpu"),
                        stmap::ValueError);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 0, 5), view_of(space, 3, 5), d, simple),
                        stmap::ValueError);

    const auto wrong = random_stochastic(4, 2);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5), d, simple, "cpu",
                                   view_of(wrong, 4, 2)),
                        stmap::ShapeMismatchError);

    mp::Hyperparameters weighted = simple;
    weighted.lambda_d = Real(1);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5),
                                   Array<const Real>(density.data(), 2), weighted),
                        stmap::DimensionMismatchError);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5),
                                   Array<const Real>(no_mass.data(), no_mass.size()), weighted),
                        stmap::ValueError);

    mp::Hyperparameters negative = simple;
    negative.lambda_r = Real(-0.1);
    STMAP_ASSERT_THROWS((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5), d, negative),
                        stmap::ValueError);
}

STMAP_TEST_CASE(density_ignored_when_unweighted) {
    const auto cells = random_expression(4, 5);
    const auto space = random_expression(3, 5);
    STMAP_ASSERT_NO_THROW((void)mp::Mapper(view_of(cells, 4, 5), view_of(space, 3, 5),
                                     Array<const Real>(), mp::Hyperparameters{}));
}

STMAP_TEST_CASE(accelerator_request_falls_back_to_host) {
    const auto cells = random_expression(4, 5);
    const auto space = random_expression(3, 5);
    mp::Mapper m(view_of(cells, 4, 5), view_of(space, 3, 5), Array<const Real>(),
                 mp::Hyperparameters{}, "cuda:0");
    STMAP_ASSERT_TRUE(m.device().is_fallback());
    STMAP_ASSERT_TRUE(m.device().kind() == stmap::device::DeviceKind::Host);
}

STMAP_TEST_CASE(epochs_range_trains_lazily) {
    const auto cells = random_expression(6, 8);
    const auto space = random_expression(4, 8);
    mp::Mapper m(view_of(cells, 6, 8), view_of(space, 4, 8), Array<const Real>(),
                 mp::Hyperparameters{});

    auto range = m.epochs(5, Real(0.1));
    STMAP_ASSERT_EQ(m.epochs_done(), Index(0));

    std::vector<Index> seen;
    for (const mp::EpochRecord& rec : range) {
        seen.push_back(rec.epoch);
        STMAP_ASSERT_EQ(m.epochs_done(), rec.epoch);
        STMAP_ASSERT_EQ(rec.loss, rec.terms.total);
    }
    STMAP_ASSERT_EQ(seen.size(), std::size_t(5));
    for (std::size_t k = 0; k < seen.size(); ++k) {
        STMAP_ASSERT_EQ(seen[k], Index(k + 1));
    }

    // An empty range trains nothing
    for (const mp::EpochRecord& rec : m.epochs(0)) {
        (void)rec;
        STMAP_FAIL("empty range yielded an epoch");
    }
    STMAP_ASSERT_EQ(m.epochs_done(), Index(5));
    STMAP_ASSERT_THROWS((void)m.epochs(-1), stmap::ValueError);
}

STMAP_TEST_CASE(begin_does_not_train) {
    const auto cells = random_expression(5, 6);
    const auto space = random_expression(3, 6);
    mp::Mapper m(view_of(cells, 5, 6), view_of(space, 3, 6), Array<const Real>(),
                 mp::Hyperparameters{});

    auto range = m.epochs(4, Real(0.1));
    (void)range.begin();
    (void)range.begin();
    STMAP_ASSERT_EQ(m.epochs_done(), Index(0));

    auto it = range.begin();
    ++it;
    STMAP_ASSERT_EQ(m.epochs_done(), Index(1));
    STMAP_ASSERT_EQ(it->epoch, Index(2));
    STMAP_ASSERT_EQ((*it).epoch, Index(2));
    STMAP_ASSERT_EQ(m.epochs_done(), Index(2));
}

STMAP_TEST_CASE(train_notifies_observer) {
    const auto cells = random_expression(5, 6);
    const auto space = random_expression(3, 6);
    mp::Mapper m(view_of(cells, 5, 6), view_of(space, 3, 6), Array<const Real>(),
                 mp::Hyperparameters{});

    std::vector<Real> losses;
    const Real last = m.train(20, Real(0.1), [&](const mp::EpochRecord& rec) {
        losses.push_back(rec.loss);
    }, 0);

    STMAP_ASSERT_EQ(losses.size(), std::size_t(20));
    STMAP_ASSERT_EQ(last, losses.back());
    STMAP_ASSERT_LT(losses.back(), losses.front());
}

STMAP_TEST_CASE(mapping_rows_are_distributions) {
    const auto cells = random_expression(7, 6);
    const auto space = random_expression(5, 6);
    const std::vector<Real> density = {Real(1), Real(1), Real(2), Real(1), Real(3)};
    mp::Mapper m(view_of(cells, 7, 6), view_of(space, 5, 6),
                 Array<const Real>(density.data(), density.size()), all_terms());
    m.train(50, Real(0.1), nullptr, 0);

    DenseMatrix out = m.mapping();
    STMAP_ASSERT_EQ(out.rows(), Index(7));
    STMAP_ASSERT_EQ(out.cols(), Index(5));
    for (Real p : out.values()) {
        STMAP_ASSERT_GE(p, Real(0));
    }
    const std::vector<Real> flat(out.data(), out.data() + out.size());
    STMAP_ASSERT_LT(max_row_sum_error(flat, 7, 5), 1e-5);

    DenseMatrix small(5, 7);
    STMAP_ASSERT_THROWS(m.write_mapping(small.view()), stmap::DimensionMismatchError);
}

STMAP_TEST_CASE(same_seed_same_mapping) {
    const auto cells = random_expression(5, 6);
    const auto space = random_expression(4, 6);

    auto run = [&](std::uint64_t seed) {
        mp::Mapper m(view_of(cells, 5, 6), view_of(space, 4, 6), Array<const Real>(),
                     mp::Hyperparameters{}, "cpu", std::nullopt, seed);
        m.train(30, Real(0.1), nullptr, 0);
        return m.mapping();
    };

    DenseMatrix a = run(11);
    DenseMatrix b = run(11);
    DenseMatrix c = run(12);

    const OracleMatrix oa = to_oracle(a.data(), 5, 4);
    STMAP_ASSERT_EQ(max_abs_diff(oa, to_oracle(b.data(), 5, 4)), 0.0);
    STMAP_ASSERT_GT(max_abs_diff(oa, to_oracle(c.data(), 5, 4)), 0.0);
}

STMAP_TEST_CASE(resume_starts_from_previous_mapping) {
    const auto cells = random_expression(6, 5);
    const auto space = random_expression(4, 5);
    const auto previous = random_stochastic(6, 4);

    mp::Mapper m(view_of(cells, 6, 5), view_of(space, 4, 5), Array<const Real>(),
                 mp::Hyperparameters{}, "cpu", view_of(previous, 6, 4));
    STMAP_ASSERT_EQ(m.epochs_done(), Index(0));
    STMAP_ASSERT_EQ(m.state().moments.step, Index(0));

    DenseMatrix out = m.mapping();
    const double tol = DOUBLE_PRECISION ? 1e-12 : 1e-5;
    STMAP_ASSERT_LT(max_abs_diff(to_oracle(out.data(), 6, 4), to_oracle(previous, 6, 4)), tol);
}

STMAP_TEST_CASE(resume_tolerates_zero_entries) {
    const auto cells = random_expression(2, 3);
    const auto space = random_expression(2, 3);
    const std::vector<Real> previous = {Real(1), Real(0), Real(0.25), Real(0.75)};

    mp::Mapper m(view_of(cells, 2, 3), view_of(space, 2, 3), Array<const Real>(),
                 mp::Hyperparameters{}, "cpu", view_of(previous, 2, 2));
    for (Real x : m.state().logits.values()) {
        STMAP_ASSERT_TRUE(std::isfinite(x));
    }
    DenseMatrix out = m.mapping();
    STMAP_ASSERT_NEAR(out(0, 0), 1.0, 1e-6);
    STMAP_ASSERT_NEAR(out(0, 1), 0.0, 1e-6);
}

STMAP_TEST_CASE(restored_session_matches_uninterrupted_run) {
    Random rng(5);
    const auto cells = random_expression(8, 6, 0.7, rng);
    const auto space = random_expression(4, 6, 0.7, rng);
    const auto S = view_of(cells, 8, 6);
    const auto G = view_of(space, 4, 6);
    const std::vector<Real> density = {Real(1), Real(2), Real(0.5), Real(1.5)};
    const Array<const Real> d(density.data(), density.size());
    const Real lr = Real(0.1);

    mp::Mapper first(S, G, d, all_terms(), "cpu", std::nullopt, 5);
    mp::Mapper whole(S, G, d, all_terms(), "cpu", std::nullopt, 5);
    first.train(30, lr);
    whole.train(50, lr);

    DenseMatrix prev = first.mapping();
    mp::Mapper resumed(S, G, d, all_terms(), "cpu", prev.view(), 77);
    resumed.restore(first.state());
    STMAP_ASSERT_EQ(resumed.epochs_done(), Index(30));
    STMAP_ASSERT_EQ(resumed.state().moments.step, Index(30));
    resumed.train(20, lr);

    DenseMatrix a = resumed.mapping();
    DenseMatrix b = whole.mapping();
    const double tol = DOUBLE_PRECISION ? 1e-12 : 1e-6;
    STMAP_ASSERT_LT(max_abs_diff(to_oracle(a.data(), 8, 4), to_oracle(b.data(), 8, 4)), tol);
    STMAP_ASSERT_EQ(resumed.epochs_done(), Index(50));

    // The source session is left untouched
    STMAP_ASSERT_EQ(first.epochs_done(), Index(30));

    mp::MapperState other(7, 4);
    STMAP_ASSERT_THROWS(resumed.restore(other), stmap::ShapeMismatchError);
}

STMAP_TEST_SUITE_END

// =============================================================================
// Device Identifiers
// =============================================================================

STMAP_TEST_SUITE(device)

STMAP_TEST_CASE(parse_accepts_known_kinds) {
    using stmap::device::DeviceKind;
    using stmap::device::parse_device;

    STMAP_ASSERT_TRUE(parse_device("cpu").kind == DeviceKind::Host);
    STMAP_ASSERT_TRUE(parse_device("host").kind == DeviceKind::Host);
    STMAP_ASSERT_TRUE(parse_device("cuda").kind == DeviceKind::Cuda);
    STMAP_ASSERT_EQ(parse_device("cuda:3").ordinal, 3);
    STMAP_ASSERT_TRUE(parse_device("hip:1").kind == DeviceKind::Hip);
    STMAP_ASSERT_STR_EQ(stmap::device::to_string(parse_device("cuda:2")), "cuda:2");
}

STMAP_TEST_CASE(parse_rejects_malformed) {
    using stmap::device::parse_device;
    STMAP_ASSERT_THROWS((void)parse_device("gpu"), stmap::ValueError);
    STMAP_ASSERT_THROWS((void)parse_device("cuda:"), stmap::ValueError);
    STMAP_ASSERT_THROWS((void)parse_device("cuda:x"), stmap::ValueError);
    STMAP_ASSERT_THROWS((void)parse_device("cuda:-1"), stmap::ValueError);
}

STMAP_TEST_CASE(thread_override_is_scoped) {
    using stmap::device::ComputeDevice;
    using stmap::threading::Scheduler;

    const std::size_t before = Scheduler::get_num_threads();
    {
        ComputeDevice dev("cpu", 2);
        STMAP_SKIP_IF(Scheduler::get_num_threads() != 2, "serial backend");
        {
            // No override: leaves the active count alone
            ComputeDevice plain("cpu");
            STMAP_ASSERT_EQ(Scheduler::get_num_threads(), std::size_t(2));
        }
        STMAP_ASSERT_EQ(Scheduler::get_num_threads(), std::size_t(2));
    }
    STMAP_ASSERT_EQ(Scheduler::get_num_threads(), before);
}

STMAP_TEST_SUITE_END

// =============================================================================
// Ingest and Alignment
// =============================================================================

STMAP_TEST_SUITE(pipeline)

STMAP_TEST_CASE(format_codes_and_encodings) {
    using stmap::kernel::ingest::MatrixFormat;
    namespace in = stmap::kernel::ingest;

    STMAP_ASSERT_TRUE(in::parse_format(0) == MatrixFormat::Dense);
    STMAP_ASSERT_TRUE(in::parse_format(2) == MatrixFormat::CSC);
    STMAP_ASSERT_THROWS((void)in::parse_format(5), stmap::UnsupportedMatrixTypeError);

    STMAP_ASSERT_TRUE(in::format_from_encoding("csr_matrix") == MatrixFormat::CSR);
    STMAP_ASSERT_THROWS((void)in::format_from_encoding("coo_matrix"),
                        stmap::UnsupportedMatrixTypeError);
    STMAP_ASSERT_STR_EQ(in::format_name(MatrixFormat::CSC), "csc_matrix");
}

STMAP_TEST_CASE(sparse_buffers_densify) {
    // [[1, 0, 2], [0, 0, 3]]
    const std::vector<Real> data = {Real(1), Real(2), Real(3)};
    const std::vector<Index> indices = {0, 2, 2};
    const std::vector<Index> indptr = {0, 2, 3};

    namespace in = stmap::kernel::ingest;
    stmap::ExpressionMatrix x = in::from_buffers(in::MatrixFormat::CSR, 2, 3, data.data(),
                                                 indices.data(), indptr.data(), 3);
    STMAP_ASSERT_TRUE(in::format_of(x) == in::MatrixFormat::CSR);

    DenseMatrix d = in::to_dense(x);
    STMAP_ASSERT_EQ(d(0, 0), Real(1));
    STMAP_ASSERT_EQ(d(0, 1), Real(0));
    STMAP_ASSERT_EQ(d(0, 2), Real(2));
    STMAP_ASSERT_EQ(d(1, 2), Real(3));

    const std::vector<Index> bad_indptr = {0, 3, 2};
    STMAP_ASSERT_THROWS((void)in::from_buffers(in::MatrixFormat::CSR, 2, 3, data.data(),
                                               indices.data(), bad_indptr.data(), 3),
                        stmap::ValueError);
}

STMAP_TEST_CASE(align_keeps_cell_gene_order) {
    const std::vector<Real> cv = {Real(1), Real(2), Real(3),
                                  Real(4), Real(5), Real(6)};
    const std::vector<Real> sv = {Real(10), Real(20), Real(30)};
    stmap::Dataset cells = annotated(cv, 2, 3, {"c0", "c1"}, {"Actb", "Sox2", "Gapdh"});
    stmap::Dataset space = annotated(sv, 1, 3, {"s0"}, {"Gapdh", "Mbp", "Actb"});

    auto pair = stmap::kernel::align::align_genes(cells, space);
    STMAP_ASSERT_EQ(pair.genes.size(), std::size_t(2));
    STMAP_ASSERT_STR_EQ(pair.genes[0], "Actb");
    STMAP_ASSERT_STR_EQ(pair.genes[1], "Gapdh");

    const auto& c = std::get<DenseMatrix>(pair.cells.X);
    const auto& s = std::get<DenseMatrix>(pair.space.X);
    STMAP_ASSERT_EQ(c(0, 0), Real(1));
    STMAP_ASSERT_EQ(c(1, 1), Real(6));
    STMAP_ASSERT_EQ(s(0, 0), Real(30));
    STMAP_ASSERT_EQ(s(0, 1), Real(10));
    STMAP_ASSERT_NO_THROW(stmap::kernel::align::check_aligned(pair.cells, pair.space));

    // A candidate list narrows the shared set
    auto only = stmap::kernel::align::align_genes(cells, space,
                                                  std::vector<std::string>{"Gapdh", "Sox2"});
    STMAP_ASSERT_EQ(only.genes.size(), std::size_t(1));
    STMAP_ASSERT_STR_EQ(only.genes[0], "Gapdh");
}

STMAP_TEST_CASE(align_errors) {
    const std::vector<Real> v = {Real(1), Real(2)};
    stmap::Dataset a = annotated(v, 1, 2, {}, {"g1", "g2"});
    stmap::Dataset b = annotated(v, 1, 2, {}, {"g3", "g4"});
    stmap::Dataset dup = annotated(v, 1, 2, {}, {"g1", "g1"});
    stmap::Dataset reordered = annotated(v, 1, 2, {}, {"g2", "g1"});

    namespace al = stmap::kernel::align;
    STMAP_ASSERT_THROWS((void)al::align_genes(a, b), stmap::GeneAlignmentError);
    STMAP_ASSERT_THROWS((void)al::align_genes(dup, a), stmap::ValueError);
    STMAP_ASSERT_THROWS(al::check_aligned(a, reordered), stmap::GeneAlignmentError);

    const std::vector<Real> wide = {Real(1), Real(2), Real(3)};
    stmap::Dataset three = annotated(wide, 1, 3, {}, {});
    STMAP_ASSERT_THROWS(al::check_aligned(a, three), stmap::GeneAlignmentError);
}

STMAP_TEST_SUITE_END

// =============================================================================
// Mapping Entry Point
// =============================================================================

STMAP_TEST_SUITE(mapping)

STMAP_TEST_CASE(unsupported_mode_checked_first) {
    namespace mg = stmap::kernel::mapping;
    STMAP_ASSERT_THROWS((void)mg::hyperparameters_for("constrained"), stmap::UnsupportedModeError);

    // Misaligned genes would also fail; the mode is reported instead
    const std::vector<Real> v = {Real(1), Real(2)};
    stmap::Dataset cells = annotated(v, 1, 2, {}, {"g1", "g2"});
    stmap::Dataset space = annotated(v, 1, 2, {}, {"g2", "g1"});

    mg::MappingOptions options;
    options.mode = "clusters";
    STMAP_ASSERT_THROWS((void)mg::map_cells_to_space(cells, space, options),
                        stmap::UnsupportedModeError);

    options.mode = "simple";
    STMAP_ASSERT_THROWS((void)mg::map_cells_to_space(cells, space, options),
                        stmap::GeneAlignmentError);
}

STMAP_TEST_CASE(simple_mode_weights) {
    const mp::Hyperparameters hp = stmap::kernel::mapping::hyperparameters_for("simple");
    STMAP_ASSERT_EQ(hp.lambda_g1, Real(1));
    STMAP_ASSERT_EQ(hp.lambda_g2, Real(0));
    STMAP_ASSERT_EQ(hp.lambda_d, Real(0));
    STMAP_ASSERT_EQ(hp.lambda_r, Real(0));
}

STMAP_TEST_CASE(scenario_result) {
    namespace mg = stmap::kernel::mapping;
    const auto cv = fixture::scenario_cells();
    const auto sv = fixture::scenario_space();
    stmap::Dataset cells = annotated(cv, 3, 2, {"a", "b", "ab"}, {"g1", "g2"});
    stmap::Dataset space = annotated(sv, 2, 2, {"s1", "s2"}, {"g1", "g2"});

    mg::MappingOptions options;
    options.device = "cpu";
    Index observed = 0;
    options.observer = [&](const mp::EpochRecord&) { ++observed; };

    mg::MappingResult r = mg::map_cells_to_space(cells, space, options);
    STMAP_ASSERT_EQ(observed, mp::config::NUM_EPOCHS);
    STMAP_ASSERT_EQ(r.n_cells(), Index(3));
    STMAP_ASSERT_EQ(r.n_spots(), Index(2));
    STMAP_ASSERT_GT(r.mapping(0, 0), Real(0.9));
    STMAP_ASSERT_GT(r.mapping(1, 1), Real(0.9));
    STMAP_ASSERT_NEAR(r.mapping(2, 0), 0.5, 0.1);

    STMAP_ASSERT_EQ(r.cell_names.size(), std::size_t(3));
    STMAP_ASSERT_STR_EQ(r.spot_names[1], "s2");
    STMAP_ASSERT_EQ(r.gene_scores.size(), std::size_t(2));
    STMAP_ASSERT_GE(r.gene_scores[0].second, r.gene_scores[1].second);

    // Zero further epochs reproduce the previous mapping
    options.num_epochs = 0;
    options.observer = nullptr;
    mg::MappingResult again = mg::map_cells_to_space(cells, space, options, &r);
    const double tol = DOUBLE_PRECISION ? 1e-10 : 1e-5;
    STMAP_ASSERT_LT(max_abs_diff(to_oracle(again.mapping.data(), 3, 2),
                                 to_oracle(r.mapping.data(), 3, 2)), tol);

    // Wrong previous shape
    stmap::Dataset fewer = annotated(std::vector<Real>(cv.begin(), cv.begin() + 4), 2, 2,
                                     {"a", "b"}, {"g1", "g2"});
    STMAP_ASSERT_THROWS((void)mg::map_cells_to_space(fewer, space, options, &r),
                        stmap::ShapeMismatchError);
}

STMAP_TEST_CASE(resumed_result_continues_training) {
    namespace mg = stmap::kernel::mapping;
    Random rng(9);
    const auto cv = random_expression(8, 6, 1.0, rng);
    const auto sv = random_expression(4, 6, 1.0, rng);
    const std::vector<std::string> genes = {"g0", "g1", "g2", "g3", "g4", "g5"};
    stmap::Dataset cells = annotated(cv, 8, 6, {"c0", "c1", "c2", "c3", "c4", "c5", "c6", "c7"},
                                     genes);
    stmap::Dataset space = annotated(sv, 4, 6, {"s0", "s1", "s2", "s3"}, genes);

    mg::MappingOptions options;
    options.device = "cpu";
    options.seed = 5;

    options.num_epochs = 30;
    mg::MappingResult first = mg::map_cells_to_space(cells, space, options);
    STMAP_ASSERT_TRUE(first.optimizer.has_value());
    STMAP_ASSERT_EQ(first.optimizer->epoch, Index(30));

    options.num_epochs = 20;
    mg::MappingResult resumed = mg::map_cells_to_space(cells, space, options, &first);
    STMAP_ASSERT_EQ(resumed.optimizer->epoch, Index(50));

    options.num_epochs = 50;
    mg::MappingResult whole = mg::map_cells_to_space(cells, space, options);

    const double tol = DOUBLE_PRECISION ? 1e-12 : 1e-6;
    STMAP_ASSERT_LT(max_abs_diff(to_oracle(resumed.mapping.data(), 8, 4),
                                 to_oracle(whole.mapping.data(), 8, 4)), tol);
}

STMAP_TEST_SUITE_END

STMAP_TEST_END

STMAP_TEST_MAIN()
