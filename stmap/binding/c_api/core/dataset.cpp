// =============================================================================
// FILE: stmap/binding/c_api/core/dataset.cpp
// BRIEF: Annotated dataset C API implementation
// =============================================================================

#include "stmap/binding/c_api/core/dataset.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/kernel/align.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace stmap;
using namespace stmap::binding;

extern "C" {

// =============================================================================
// Lifecycle Management
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_dataset_create(
    stmap_matrix_t matrix,
    const char* const* obs_names,
    const char* const* var_names,
    stmap_dataset_t* out) {

    STMAP_C_API_CHECK_NULL(matrix, "Matrix is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        Dataset ds;
        ds.X = kernel::ingest::clone(matrix->matrix);
        ds.obs_names = copy_names(obs_names, ds.n_obs());
        ds.var_names = copy_names(var_names, ds.n_vars());
        ds.validate();

        *out = new stmap_dataset(std::move(ds));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_dataset_destroy(stmap_dataset_t* dataset) {
    if (dataset == nullptr || *dataset == nullptr) {
        STMAP_C_API_RETURN_OK;
    }
    delete *dataset;
    *dataset = nullptr;
    STMAP_C_API_RETURN_OK;
}

// =============================================================================
// Property Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_dataset_n_obs(stmap_dataset_t dataset, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = dataset->dataset.n_obs();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_dataset_n_vars(stmap_dataset_t dataset, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = dataset->dataset.n_vars();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_dataset_obs_name(
    stmap_dataset_t dataset,
    const stmap_index_t k,
    const char** out) {

    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto& names = dataset->dataset.obs_names;
        check_position(k, names.size(), "Observation name");
        *out = names[static_cast<Size>(k)].c_str();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_dataset_var_name(
    stmap_dataset_t dataset,
    const stmap_index_t k,
    const char** out) {

    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto& names = dataset->dataset.var_names;
        check_position(k, names.size(), "Gene name");
        *out = names[static_cast<Size>(k)].c_str();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_dataset_to_dense(
    stmap_dataset_t dataset,
    stmap_real_t* out,
    const stmap_size_t out_size) {

    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");

    STMAP_C_API_TRY
        const DenseMatrix dense = kernel::ingest::to_dense(dataset->dataset.X);
        copy_out(dense.view(), out, out_size);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

// =============================================================================
// Gene Alignment
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_align_genes(
    stmap_dataset_t cells,
    stmap_dataset_t space,
    const char* const* genes,
    const stmap_size_t n_genes,
    stmap_dataset_t* out_cells,
    stmap_dataset_t* out_space) {

    STMAP_C_API_CHECK_NULL(cells, "Cells dataset is null");
    STMAP_C_API_CHECK_NULL(space, "Space dataset is null");
    STMAP_C_API_CHECK_NULL(out_cells, "Output cells pointer is null");
    STMAP_C_API_CHECK_NULL(out_space, "Output space pointer is null");

    STMAP_C_API_TRY
        std::optional<std::vector<std::string>> candidates;
        if (genes != nullptr) {
            candidates = copy_names(genes, static_cast<stmap_index_t>(n_genes));
        }

        auto aligned = kernel::align::align_genes(cells->dataset, space->dataset, candidates);

        auto a = std::make_unique<stmap_dataset>(std::move(aligned.cells));
        auto b = std::make_unique<stmap_dataset>(std::move(aligned.space));
        *out_cells = a.release();
        *out_space = b.release();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

} // extern "C"
