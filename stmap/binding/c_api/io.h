#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/io.h
// BRIEF: C API for h5ad-style dataset and result files
// =============================================================================
//
// All functions return STMAP_ERROR_FEATURE_UNAVAILABLE when the library was
// built without HDF5 (see stmap_get_build_config()).
// =============================================================================

#include "stmap/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

/// @brief Read a dataset (X, obs, var) from an h5ad-style file
/// @param[in] path File path (non-null)
/// @param[out] out Output handle (non-null)
/// @return STMAP_ERROR_FILE_NOT_FOUND, STMAP_ERROR_READ_ERROR,
///         STMAP_ERROR_UNSUPPORTED_MATRIX_TYPE on failure
STMAP_EXPORT stmap_error_t stmap_io_read_dataset(const char* path, stmap_dataset_t* out);

/// @brief Write a dataset, replacing any existing file
STMAP_EXPORT stmap_error_t stmap_io_write_dataset(const char* path, stmap_dataset_t dataset);

/// @brief Write a mapping result, replacing any existing file
STMAP_EXPORT stmap_error_t stmap_io_write_result(const char* path, stmap_result_t result);

/// @brief Read a mapping result written by stmap_io_write_result()
STMAP_EXPORT stmap_error_t stmap_io_read_result(const char* path, stmap_result_t* out);

#ifdef __cplusplus
}
#endif
