// =============================================================================
// FILE: stmap/binding/c_api/mapping.cpp
// BRIEF: C API implementation for end-to-end mapping and its results
// =============================================================================

#include "stmap/binding/c_api/mapping.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/kernel/mapping.hpp"
#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"

#include <string>

using namespace stmap;
using namespace stmap::binding;

namespace mapping = stmap::kernel::mapping;

extern "C" {

// =============================================================================
// Orchestration
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_map_cells_to_space(
    stmap_dataset_t cells,
    stmap_dataset_t space,
    const char* mode,
    stmap_result_t prev,
    const char* device,
    const stmap_real_t lr,
    const stmap_index_t epochs,
    const uint64_t seed,
    stmap_result_t* out) {

    STMAP_C_API_CHECK_NULL(cells, "Cells dataset is null");
    STMAP_C_API_CHECK_NULL(space, "Space dataset is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        mapping::MappingOptions options;
        if (mode != nullptr) options.mode = mode;
        if (device != nullptr) options.device = device;
        options.learning_rate = lr;
        options.num_epochs = epochs;
        options.seed = seed;

        const mapping::MappingResult* previous = (prev != nullptr) ? &prev->result : nullptr;

        *out = new stmap_result(
            mapping::map_cells_to_space(cells->dataset, space->dataset, options, previous));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_result_destroy(stmap_result_t* result) {
    if (result == nullptr || *result == nullptr) {
        STMAP_C_API_RETURN_OK;
    }
    delete *result;
    *result = nullptr;
    STMAP_C_API_RETURN_OK;
}

// =============================================================================
// Result Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_result_n_cells(stmap_result_t result, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = result->result.n_cells();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_result_n_spots(stmap_result_t result, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = result->result.n_spots();
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_result_n_genes(stmap_result_t result, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<stmap_index_t>(result->result.training_genes.size());
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_result_get_mapping(
    stmap_result_t result,
    stmap_real_t* out,
    const stmap_size_t out_size) {

    STMAP_C_API_CHECK_NULL(result, "Result is null");

    STMAP_C_API_TRY
        copy_out(result->result.mapping.view(), out, out_size);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_result_gene_score(
    stmap_result_t result,
    const stmap_index_t rank,
    const char** out_name,
    stmap_real_t* out_score) {

    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out_name, "Output name pointer is null");
    STMAP_C_API_CHECK_NULL(out_score, "Output score pointer is null");

    STMAP_C_API_TRY
        const auto& table = result->result.gene_scores;
        check_position(rank, table.size(), "Gene score");
        const auto& row = table[static_cast<Size>(rank)];
        *out_name = row.first.c_str();
        *out_score = row.second;
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_result_training_gene(
    stmap_result_t result,
    const stmap_index_t k,
    const char** out) {

    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto& genes = result->result.training_genes;
        check_position(k, genes.size(), "Training gene");
        *out = genes[static_cast<Size>(k)].c_str();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_result_cell_name(
    stmap_result_t result,
    const stmap_index_t k,
    const char** out) {

    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto& names = result->result.cell_names;
        check_position(k, names.size(), "Cell name");
        *out = names[static_cast<Size>(k)].c_str();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_result_spot_name(
    stmap_result_t result,
    const stmap_index_t k,
    const char** out) {

    STMAP_C_API_CHECK_NULL(result, "Result is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto& names = result->result.spot_names;
        check_position(k, names.size(), "Spot name");
        *out = names[static_cast<Size>(k)].c_str();
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

} // extern "C"
