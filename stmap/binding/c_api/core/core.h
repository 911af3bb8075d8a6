#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/core/core.h
// BRIEF: C ABI for the stmap cell-to-space mapping library
// =============================================================================
//
// Every call returns stmap_error_t and leaves a thread-local message for
// stmap_get_last_error(). Handles come from stmap_*_create() and go back
// through stmap_*_destroy(), which nulls the caller's pointer. Input buffers
// are copied; strings handed out live as long as the handle they came from.
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define STMAP_C_API_VERSION_MAJOR 1
#define STMAP_C_API_VERSION_MINOR 0
#define STMAP_C_API_VERSION_PATCH 0

// =============================================================================
// Export Macro (Platform-Specific DLL/SO Symbol Visibility)
// =============================================================================

#ifndef STMAP_EXPORT
    #if defined(_MSC_VER)
        #define STMAP_EXPORT __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define STMAP_EXPORT __attribute__((visibility("default")))
    #else
        #define STMAP_EXPORT
    #endif
#endif

// Get runtime version string (e.g., "1.0.0")
const char* stmap_get_version(void);

// Get build configuration (e.g., "float32+int64+avx2+openmp")
const char* stmap_get_build_config(void);

// =============================================================================
// Opaque Handle Types
// =============================================================================

typedef struct stmap_matrix stmap_matrix;
typedef struct stmap_dataset stmap_dataset;
typedef struct stmap_mapper stmap_mapper;
typedef struct stmap_result stmap_result;

// NULL is never a valid handle
typedef stmap_matrix* stmap_matrix_t;
typedef stmap_dataset* stmap_dataset_t;
typedef stmap_mapper* stmap_mapper_t;
typedef stmap_result* stmap_result_t;

// =============================================================================
// Basic Value Types (Must Match C++ stmap::Real and stmap::Index)
// =============================================================================

// Real type follows STMAP_PRECISION: 0 = float32 (default), 1 = float64
#if defined(STMAP_PRECISION) && STMAP_PRECISION == 1
typedef double stmap_real_t;
#define STMAP_REAL_TYPE_NAME "float64"
#else
typedef float stmap_real_t;
#define STMAP_REAL_TYPE_NAME "float32"
#endif

// Index type follows STMAP_INDEX_PRECISION: 0 = int16, 1 = int32, 2 = int64 (default)
#if defined(STMAP_INDEX_PRECISION) && STMAP_INDEX_PRECISION == 0
typedef int16_t stmap_index_t;
#define STMAP_INDEX_TYPE_NAME "int16"
#elif defined(STMAP_INDEX_PRECISION) && STMAP_INDEX_PRECISION == 1
typedef int32_t stmap_index_t;
#define STMAP_INDEX_TYPE_NAME "int32"
#else
typedef int64_t stmap_index_t;
#define STMAP_INDEX_TYPE_NAME "int64"
#endif

typedef size_t stmap_size_t;

typedef int stmap_bool_t;
#define STMAP_TRUE 1
#define STMAP_FALSE 0

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, matches stmap::ErrorCode)
typedef int32_t stmap_error_t;

#define STMAP_OK 0

// General errors (1-9)
#define STMAP_ERROR_UNKNOWN 1
#define STMAP_ERROR_INTERNAL 2
#define STMAP_ERROR_OUT_OF_MEMORY 3
#define STMAP_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define STMAP_ERROR_INVALID_ARGUMENT 10
#define STMAP_ERROR_DIMENSION_MISMATCH 11
#define STMAP_ERROR_INDEX_OUT_OF_BOUNDS 14
#define STMAP_ERROR_SHAPE_MISMATCH 15
#define STMAP_ERROR_GENE_ALIGNMENT 16

// Type errors (20-29)
#define STMAP_ERROR_TYPE_ERROR 20
#define STMAP_ERROR_UNSUPPORTED_MATRIX_TYPE 22

// I/O errors (30-39)
#define STMAP_ERROR_IO_ERROR 30
#define STMAP_ERROR_FILE_NOT_FOUND 31
#define STMAP_ERROR_READ_ERROR 33
#define STMAP_ERROR_WRITE_ERROR 34

// Feature errors (40-49)
#define STMAP_ERROR_NOT_IMPLEMENTED 40
#define STMAP_ERROR_FEATURE_UNAVAILABLE 41
#define STMAP_ERROR_UNSUPPORTED_MODE 42

// Message of the calling thread's last failure, "No error" when there is none
const char* stmap_get_last_error(void);
stmap_error_t stmap_get_last_error_code(void);
void stmap_clear_error(void);

stmap_bool_t stmap_is_ok(stmap_error_t code);
stmap_bool_t stmap_is_error(stmap_error_t code);

// =============================================================================
// Runtime Configuration
// =============================================================================

/// @brief Set the worker count used by parallel kernels
/// @param[in] n Number of threads (must be > 0)
/// @return STMAP_OK on success, error code otherwise
stmap_error_t stmap_set_num_threads(stmap_size_t n);

/// @brief Current worker count
stmap_size_t stmap_get_num_threads(void);

#define STMAP_LOG_LEVEL_DEBUG 0
#define STMAP_LOG_LEVEL_INFO 1
#define STMAP_LOG_LEVEL_WARNING 2
#define STMAP_LOG_LEVEL_ERROR 3
#define STMAP_LOG_LEVEL_OFF 4

/// @brief Set the process-wide diagnostic threshold
/// @param[in] level One of STMAP_LOG_LEVEL_*
/// @return STMAP_OK, or STMAP_ERROR_INVALID_ARGUMENT for an unknown level
stmap_error_t stmap_set_log_level(int32_t level);

#ifdef __cplusplus
}
#endif
