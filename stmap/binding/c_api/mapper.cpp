// =============================================================================
// FILE: stmap/binding/c_api/mapper.cpp
// BRIEF: C API implementation for the mapping optimizer
// =============================================================================

#include "stmap/binding/c_api/mapper.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/kernel/mapper.hpp"
#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"

#include <memory>
#include <optional>
#include <string_view>

using namespace stmap;
using namespace stmap::binding;

namespace {

namespace mp = stmap::kernel::mapper;

stmap_loss_terms_t to_c(const mp::LossTerms& t) noexcept {
    stmap_loss_terms_t out;
    out.gene = t.gene;
    out.spot = t.spot;
    out.density = t.density;
    out.entropy = t.entropy;
    out.total = t.total;
    return out;
}

mp::Hyperparameters from_c(const stmap_hyperparameters_t* hyper) noexcept {
    mp::Hyperparameters hp;
    if (hyper != nullptr) {
        hp.lambda_d = hyper->lambda_d;
        hp.lambda_g1 = hyper->lambda_g1;
        hp.lambda_g2 = hyper->lambda_g2;
        hp.lambda_r = hyper->lambda_r;
    }
    return hp;
}

} // anonymous namespace

extern "C" {

STMAP_EXPORT stmap_error_t stmap_hyperparameters_default(stmap_hyperparameters_t* out) {
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    const mp::Hyperparameters hp;
    out->lambda_d = hp.lambda_d;
    out->lambda_g1 = hp.lambda_g1;
    out->lambda_g2 = hp.lambda_g2;
    out->lambda_r = hp.lambda_r;
    STMAP_C_API_RETURN_OK;
}

// =============================================================================
// Lifecycle Management
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_mapper_create(
    const stmap_real_t* S,
    const stmap_index_t n_cells,
    const stmap_index_t n_genes_s,
    const stmap_real_t* G,
    const stmap_index_t n_spots,
    const stmap_index_t n_genes_g,
    const stmap_real_t* d,
    const stmap_index_t n_d,
    const stmap_hyperparameters_t* hyper,
    const char* device,
    const stmap_real_t* prev,
    const stmap_index_t prev_rows,
    const stmap_index_t prev_cols,
    const uint64_t seed,
    stmap_mapper_t* out) {

    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");
    STMAP_C_API_CHECK(d == nullptr || n_d >= 0, STMAP_ERROR_INVALID_ARGUMENT,
                      "Density length must be non-negative");

    STMAP_C_API_TRY
        const DenseArray<const Real> cells(S, n_cells, n_genes_s);
        const DenseArray<const Real> space(G, n_spots, n_genes_g);
        const Array<const Real> density = (d != nullptr)
            ? Array<const Real>(d, static_cast<Size>(n_d))
            : Array<const Real>(nullptr, 0);

        std::optional<DenseArray<const Real>> previous;
        if (prev != nullptr) {
            previous = DenseArray<const Real>(prev, prev_rows, prev_cols);
        }

        const std::string_view device_id = (device != nullptr) ? device : "cpu";

        auto session = std::make_unique<mp::Mapper>(
            cells, space, density, from_c(hyper), device_id, previous, seed);
        *out = new stmap_mapper(std::move(session));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_mapper_destroy(stmap_mapper_t* mapper) {
    if (mapper == nullptr || *mapper == nullptr) {
        STMAP_C_API_RETURN_OK;
    }
    delete *mapper;
    *mapper = nullptr;
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_mapper_resume_from(
    stmap_mapper_t mapper,
    stmap_mapper_t source) {

    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(source, "Source mapper is null");

    STMAP_C_API_TRY
        if (mapper != source) {
            mapper->mapper->restore(source->mapper->state());
        }
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

// =============================================================================
// Training
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_mapper_step(
    stmap_mapper_t mapper,
    const stmap_real_t lr,
    stmap_loss_terms_t* out_loss_terms) {

    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");

    STMAP_C_API_TRY
        const mp::LossTerms terms = mapper->mapper->step(lr);
        if (out_loss_terms != nullptr) {
            *out_loss_terms = to_c(terms);
        }
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_mapper_train(
    stmap_mapper_t mapper,
    const stmap_index_t epochs,
    const stmap_real_t lr,
    stmap_epoch_callback_t callback,
    void* user_data,
    stmap_real_t* out_loss) {

    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");

    STMAP_C_API_TRY
        mp::EpochObserver observer;
        if (callback != nullptr) {
            observer = [callback, user_data](const mp::EpochRecord& rec) {
                stmap_epoch_record_t c;
                c.epoch = rec.epoch;
                c.loss = rec.loss;
                c.terms = to_c(rec.terms);
                callback(&c, user_data);
            };
        }
        const Real loss = mapper->mapper->train(epochs, lr, observer);
        if (out_loss != nullptr) {
            *out_loss = loss;
        }
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_mapper_evaluate(
    stmap_mapper_t mapper,
    stmap_loss_terms_t* out) {

    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        *out = to_c(mapper->mapper->evaluate());
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

// =============================================================================
// Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_mapper_get_mapping(
    stmap_mapper_t mapper,
    stmap_real_t* out,
    const stmap_size_t out_size) {

    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(out, "Output buffer is null");

    STMAP_C_API_TRY
        const auto& m = *mapper->mapper;
        const Size need = static_cast<Size>(m.n_cells()) * static_cast<Size>(m.n_spots());
        STMAP_CHECK_DIM(out_size >= need,
                        "Output buffer holds " + std::to_string(out_size) +
                        " values, need " + std::to_string(need));
        m.write_mapping(DenseArray<Real>(out, m.n_cells(), m.n_spots()));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_mapper_epochs_done(stmap_mapper_t mapper, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = mapper->mapper->epochs_done();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_mapper_n_cells(stmap_mapper_t mapper, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = mapper->mapper->n_cells();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_mapper_n_spots(stmap_mapper_t mapper, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(mapper, "Mapper is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = mapper->mapper->n_spots();
    STMAP_C_API_RETURN_OK;
}

} // extern "C"
