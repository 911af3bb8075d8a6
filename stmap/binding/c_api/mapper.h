#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/mapper.h
// BRIEF: C API for the cell-to-space mapping optimizer
// =============================================================================
//
// MODEL:
//   M = softmax(logits) row-wise, n_cells x n_spots
//   predicted space = M^T S
//   loss = lambda_g1 * mean_g(1 - cos(pred[:, g], G[:, g]))
//        + lambda_g2 * mean_j(1 - cos(pred[j, :], G[j, :]))
//        + lambda_d  * KL(mean_i M[i, :] || d / sum(d))
//        + lambda_r  * sum_ij M_ij log M_ij
//   Terms with a zero weight are skipped. Logits are trained with Adam.
//
// WORKFLOW:
//   1. stmap_mapper_create() validates inputs and copies them
//   2. stmap_mapper_step() / stmap_mapper_train() advance training
//   3. stmap_mapper_get_mapping() reads the current mapping at any time
//   4. stmap_mapper_destroy() releases the session
//
// A previous mapping (n_cells x n_spots) seeds the logits so that training
// starts from it; optimizer moments start fresh.
// =============================================================================

#include "stmap/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct stmap_hyperparameters_t {
    stmap_real_t lambda_d;   // density term weight
    stmap_real_t lambda_g1;  // gene-wise cosine weight
    stmap_real_t lambda_g2;  // spot-wise cosine weight
    stmap_real_t lambda_r;   // entropy regularizer weight
} stmap_hyperparameters_t;

typedef struct stmap_loss_terms_t {
    stmap_real_t gene;
    stmap_real_t spot;
    stmap_real_t density;
    stmap_real_t entropy;
    stmap_real_t total;
} stmap_loss_terms_t;

typedef struct stmap_epoch_record_t {
    stmap_index_t epoch;       // 1-based count of epochs completed
    stmap_real_t loss;         // loss before this epoch's update
    stmap_loss_terms_t terms;
} stmap_epoch_record_t;

/// @brief Per-epoch observer; must not unwind through the library
typedef void (*stmap_epoch_callback_t)(const stmap_epoch_record_t* record, void* user_data);

/// @brief Fill hyperparameters with the defaults (d 0, g1 1, g2 0, r 0)
STMAP_EXPORT stmap_error_t stmap_hyperparameters_default(stmap_hyperparameters_t* out);

// =============================================================================
// Lifecycle Management
// =============================================================================

/// @brief Validate inputs and start a training session
/// @param[in] S Single-cell expression, n_cells x n_genes_s row-major (copied)
/// @param[in] n_cells Number of cells
/// @param[in] n_genes_s Gene count of S
/// @param[in] G Spatial expression, n_spots x n_genes_g row-major (copied)
/// @param[in] n_spots Number of spots
/// @param[in] n_genes_g Gene count of G
/// @param[in] d Spot density prior (n_spots values) or NULL; used only when lambda_d > 0
/// @param[in] n_d Length of d
/// @param[in] hyper Loss weights, or NULL for defaults
/// @param[in] device "cpu", "cuda[:N]", "hip[:N]"; NULL means "cpu"
/// @param[in] prev Mapping to resume from (n_cells x n_spots) or NULL
/// @param[in] prev_rows Rows of prev
/// @param[in] prev_cols Columns of prev
/// @param[in] seed Seed for the random logit initialization
/// @param[out] out Output handle (non-null)
/// @return STMAP_OK on success. Errors, in the order they are checked:
///         STMAP_ERROR_INVALID_ARGUMENT (device string),
///         STMAP_ERROR_DIMENSION_MISMATCH (gene counts differ),
///         STMAP_ERROR_INVALID_ARGUMENT (empty axis),
///         STMAP_ERROR_SHAPE_MISMATCH (prev shape),
///         STMAP_ERROR_DIMENSION_MISMATCH (density length),
///         STMAP_ERROR_INVALID_ARGUMENT (hyperparameters)
STMAP_EXPORT stmap_error_t stmap_mapper_create(
    const stmap_real_t* S,
    stmap_index_t n_cells,
    stmap_index_t n_genes_s,
    const stmap_real_t* G,
    stmap_index_t n_spots,
    stmap_index_t n_genes_g,
    const stmap_real_t* d,
    stmap_index_t n_d,
    const stmap_hyperparameters_t* hyper,
    const char* device,
    const stmap_real_t* prev,
    stmap_index_t prev_rows,
    stmap_index_t prev_cols,
    uint64_t seed,
    stmap_mapper_t* out
);

/// @brief Continue another session's training exactly
/// @details Copies source's logits and Adam moments, with its epoch count, into mapper.
///          A session created from a bare prev matrix starts its optimizer
///          afresh; calling this afterwards makes it equivalent to never
///          having stopped.
/// @param[in,out] mapper Session to overwrite (non-null)
/// @param[in] source Session to copy from (non-null, unchanged)
/// @return STMAP_ERROR_SHAPE_MISMATCH when the two sessions differ in
///         n_cells or n_spots
STMAP_EXPORT stmap_error_t stmap_mapper_resume_from(
    stmap_mapper_t mapper,
    stmap_mapper_t source
);

/// @brief Destroy session
/// @param[in,out] mapper Pointer to handle (may be null); set to NULL
STMAP_EXPORT stmap_error_t stmap_mapper_destroy(stmap_mapper_t* mapper);

// =============================================================================
// Training
// =============================================================================

/// @brief Run one epoch
/// @param[in] lr Learning rate (> 0)
/// @param[out] out_loss_terms Loss before the update, or NULL
STMAP_EXPORT stmap_error_t stmap_mapper_step(
    stmap_mapper_t mapper,
    stmap_real_t lr,
    stmap_loss_terms_t* out_loss_terms
);

/// @brief Run epochs consecutive epochs
/// @param[in] epochs Number of epochs (>= 0)
/// @param[in] lr Learning rate (> 0)
/// @param[in] callback Called after every epoch, or NULL
/// @param[in] user_data Passed through to callback
/// @param[out] out_loss Loss of the last epoch (current loss if epochs == 0), or NULL
STMAP_EXPORT stmap_error_t stmap_mapper_train(
    stmap_mapper_t mapper,
    stmap_index_t epochs,
    stmap_real_t lr,
    stmap_epoch_callback_t callback,
    void* user_data,
    stmap_real_t* out_loss
);

/// @brief Loss terms at the current parameters, without updating them
STMAP_EXPORT stmap_error_t stmap_mapper_evaluate(
    stmap_mapper_t mapper,
    stmap_loss_terms_t* out
);

// =============================================================================
// Queries
// =============================================================================

/// @brief Current row-stochastic mapping
/// @param[out] out Caller-allocated buffer of at least n_cells * n_spots values
STMAP_EXPORT stmap_error_t stmap_mapper_get_mapping(
    stmap_mapper_t mapper,
    stmap_real_t* out,
    stmap_size_t out_size
);

STMAP_EXPORT stmap_error_t stmap_mapper_epochs_done(stmap_mapper_t mapper, stmap_index_t* out);

STMAP_EXPORT stmap_error_t stmap_mapper_n_cells(stmap_mapper_t mapper, stmap_index_t* out);

STMAP_EXPORT stmap_error_t stmap_mapper_n_spots(stmap_mapper_t mapper, stmap_index_t* out);

#ifdef __cplusplus
}
#endif
