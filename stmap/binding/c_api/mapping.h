#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/mapping.h
// BRIEF: C API for end-to-end cell-to-space mapping
// =============================================================================
//
// The two datasets must already share an identical gene axis (see
// stmap_align_genes). The result holds the cells x spots mapping, cell and
// spot identifiers, the training genes, and a per-gene score table ranked by
// descending cosine similarity between predicted and observed spatial
// expression.
//
// String getters return pointers owned by the result handle.
// =============================================================================

#include "stmap/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Orchestration
// =============================================================================

/// @brief Map cells onto spots
/// @param[in] cells Single-cell dataset (non-null)
/// @param[in] space Spatial dataset with the same genes (non-null)
/// @param[in] mode Operating mode; only "simple" is supported. NULL means "simple"
/// @param[in] prev Earlier result to resume from, or NULL. Training continues
///            from its saved logits and Adam moments; a result without them
///            starts from log of its mapping with fresh moments
/// @param[in] device Compute device; NULL means "cuda:0" (falls back to host)
/// @param[in] lr Learning rate (> 0)
/// @param[in] epochs Number of training epochs (>= 0)
/// @param[in] seed Random seed
/// @param[out] out Output handle (non-null)
/// @return STMAP_ERROR_UNSUPPORTED_MODE for an unknown mode (checked first),
///         STMAP_ERROR_GENE_ALIGNMENT when gene axes differ,
///         STMAP_ERROR_SHAPE_MISMATCH when prev does not fit
STMAP_EXPORT stmap_error_t stmap_map_cells_to_space(
    stmap_dataset_t cells,
    stmap_dataset_t space,
    const char* mode,
    stmap_result_t prev,
    const char* device,
    stmap_real_t lr,
    stmap_index_t epochs,
    uint64_t seed,
    stmap_result_t* out
);

/// @brief Destroy result handle
/// @param[in,out] result Pointer to handle (may be null); set to NULL
STMAP_EXPORT stmap_error_t stmap_result_destroy(stmap_result_t* result);

// =============================================================================
// Result Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_result_n_cells(stmap_result_t result, stmap_index_t* out);

STMAP_EXPORT stmap_error_t stmap_result_n_spots(stmap_result_t result, stmap_index_t* out);

/// @brief Number of training genes (and of rows in the score table)
STMAP_EXPORT stmap_error_t stmap_result_n_genes(stmap_result_t result, stmap_index_t* out);

/// @brief Mapping matrix
/// @param[out] out Caller-allocated buffer of at least n_cells * n_spots values
STMAP_EXPORT stmap_error_t stmap_result_get_mapping(
    stmap_result_t result,
    stmap_real_t* out,
    stmap_size_t out_size
);

/// @brief Score table row; rank 0 is the best-fitting gene
/// @param[out] out_name Gene identifier (non-null)
/// @param[out] out_score Cosine similarity (non-null)
STMAP_EXPORT stmap_error_t stmap_result_gene_score(
    stmap_result_t result,
    stmap_index_t rank,
    const char** out_name,
    stmap_real_t* out_score
);

/// @brief Training gene at position k, in training order
STMAP_EXPORT stmap_error_t stmap_result_training_gene(
    stmap_result_t result,
    stmap_index_t k,
    const char** out
);

/// @brief Cell identifier of mapping row k
STMAP_EXPORT stmap_error_t stmap_result_cell_name(
    stmap_result_t result,
    stmap_index_t k,
    const char** out
);

/// @brief Spot identifier of mapping column k
STMAP_EXPORT stmap_error_t stmap_result_spot_name(
    stmap_result_t result,
    stmap_index_t k,
    const char** out
);

#ifdef __cplusplus
}
#endif
