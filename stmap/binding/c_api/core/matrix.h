#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/core/matrix.h
// BRIEF: C API for expression matrices (dense, CSR, CSC)
// =============================================================================
//
// MEMORY LAYOUT:
//   - Dense: row-major, A[i][j] = data[i * cols + j]
//   - CSR:   indptr has rows + 1 entries, indices are column positions
//   - CSC:   indptr has cols + 1 entries, indices are row positions
//
// LIFETIME MANAGEMENT:
//   - stmap_matrix_create() copies every buffer; the caller may free its
//     arrays as soon as the call returns
//   - stmap_matrix_destroy() releases the handle and its storage
//
// ERROR HANDLING:
//   - Unknown format codes return STMAP_ERROR_UNSUPPORTED_MATRIX_TYPE
//   - Malformed sparse structure returns STMAP_ERROR_INVALID_ARGUMENT
// =============================================================================

#include "stmap/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

#define STMAP_FORMAT_DENSE 0
#define STMAP_FORMAT_CSR 1
#define STMAP_FORMAT_CSC 2

// =============================================================================
// Lifecycle Management
// =============================================================================

/// @brief Create an expression matrix from caller buffers (copied)
/// @param[in] format STMAP_FORMAT_DENSE, STMAP_FORMAT_CSR or STMAP_FORMAT_CSC
/// @param[in] rows Number of rows (>= 0)
/// @param[in] cols Number of columns (>= 0)
/// @param[in] data Values: rows * cols for dense, nnz for sparse
/// @param[in] indices Sparse minor indices (ignored for dense)
/// @param[in] indptr Sparse offsets (ignored for dense)
/// @param[in] nnz Number of stored entries (ignored for dense)
/// @param[out] out Output handle (non-null)
/// @return STMAP_OK on success, error code otherwise
STMAP_EXPORT stmap_error_t stmap_matrix_create(
    int32_t format,
    stmap_index_t rows,
    stmap_index_t cols,
    const stmap_real_t* data,
    const stmap_index_t* indices,
    const stmap_index_t* indptr,
    stmap_index_t nnz,
    stmap_matrix_t* out
);

/// @brief Destroy matrix handle
/// @param[in,out] matrix Pointer to handle (may be null); set to NULL
/// @return STMAP_OK on success
STMAP_EXPORT stmap_error_t stmap_matrix_destroy(stmap_matrix_t* matrix);

// =============================================================================
// Property Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_matrix_rows(stmap_matrix_t matrix, stmap_index_t* out);

STMAP_EXPORT stmap_error_t stmap_matrix_cols(stmap_matrix_t matrix, stmap_index_t* out);

/// @brief Storage format of the matrix
/// @param[out] out One of STMAP_FORMAT_*
STMAP_EXPORT stmap_error_t stmap_matrix_format(stmap_matrix_t matrix, int32_t* out);

// =============================================================================
// Conversion
// =============================================================================

/// @brief Write the matrix as dense row-major values
/// @param[in] matrix Handle (non-null)
/// @param[out] out Caller-allocated buffer of at least rows * cols values
/// @param[in] out_size Capacity of out in elements
/// @return STMAP_OK on success, STMAP_ERROR_DIMENSION_MISMATCH if too small
/// @note Duplicate sparse entries are summed
STMAP_EXPORT stmap_error_t stmap_matrix_to_dense(
    stmap_matrix_t matrix,
    stmap_real_t* out,
    stmap_size_t out_size
);

#ifdef __cplusplus
}
#endif
