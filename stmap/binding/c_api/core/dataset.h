#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/core/dataset.h
// BRIEF: C API for annotated expression datasets
// =============================================================================
//
// A dataset is an expression matrix (observations x genes) with optional
// observation and gene identifiers. Name arrays, when given, must hold exactly
// one entry per row / column; pass NULL for an unnamed axis.
//
// Name getters return pointers owned by the dataset handle. They stay valid
// until the handle is destroyed.
// =============================================================================

#include "stmap/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Lifecycle Management
// =============================================================================

/// @brief Create a dataset from a matrix and optional axis names
/// @param[in] matrix Expression matrix (non-null, copied)
/// @param[in] obs_names One name per row, or NULL
/// @param[in] var_names One name per column, or NULL
/// @param[out] out Output handle (non-null)
/// @return STMAP_OK on success, error code otherwise
STMAP_EXPORT stmap_error_t stmap_dataset_create(
    stmap_matrix_t matrix,
    const char* const* obs_names,
    const char* const* var_names,
    stmap_dataset_t* out
);

/// @brief Destroy dataset handle
/// @param[in,out] dataset Pointer to handle (may be null); set to NULL
STMAP_EXPORT stmap_error_t stmap_dataset_destroy(stmap_dataset_t* dataset);

// =============================================================================
// Property Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_dataset_n_obs(stmap_dataset_t dataset, stmap_index_t* out);

STMAP_EXPORT stmap_error_t stmap_dataset_n_vars(stmap_dataset_t dataset, stmap_index_t* out);

/// @brief Observation identifier at position k
/// @return STMAP_ERROR_INDEX_OUT_OF_BOUNDS if k is out of range or the axis is unnamed
STMAP_EXPORT stmap_error_t stmap_dataset_obs_name(
    stmap_dataset_t dataset,
    stmap_index_t k,
    const char** out
);

/// @brief Gene identifier at position k
/// @return STMAP_ERROR_INDEX_OUT_OF_BOUNDS if k is out of range or the axis is unnamed
STMAP_EXPORT stmap_error_t stmap_dataset_var_name(
    stmap_dataset_t dataset,
    stmap_index_t k,
    const char** out
);

/// @brief Write the expression matrix as dense row-major values
/// @param[out] out Caller-allocated buffer of at least n_obs * n_vars values
STMAP_EXPORT stmap_error_t stmap_dataset_to_dense(
    stmap_dataset_t dataset,
    stmap_real_t* out,
    stmap_size_t out_size
);

// =============================================================================
// Gene Alignment
// =============================================================================

/// @brief Restrict two datasets to their shared genes
/// @param[in] cells Single-cell dataset with gene names (non-null)
/// @param[in] space Spatial dataset with gene names (non-null)
/// @param[in] genes Candidate genes, or NULL to use every gene of cells
/// @param[in] n_genes Number of candidate genes (ignored when genes is NULL)
/// @param[out] out_cells Aligned dense copy of cells (non-null)
/// @param[out] out_space Aligned dense copy of space (non-null)
/// @return STMAP_ERROR_GENE_ALIGNMENT when no gene is shared
/// @note Shared genes keep the order they have in cells
STMAP_EXPORT stmap_error_t stmap_align_genes(
    stmap_dataset_t cells,
    stmap_dataset_t space,
    const char* const* genes,
    stmap_size_t n_genes,
    stmap_dataset_t* out_cells,
    stmap_dataset_t* out_space
);

#ifdef __cplusplus
}
#endif
