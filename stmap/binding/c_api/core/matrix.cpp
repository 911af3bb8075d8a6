// =============================================================================
// FILE: stmap/binding/c_api/core/matrix.cpp
// BRIEF: Expression matrix C API implementation
// =============================================================================

#include "stmap/binding/c_api/core/matrix.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"

using namespace stmap;
using namespace stmap::binding;

extern "C" {

// =============================================================================
// Lifecycle Management
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_matrix_create(
    const int32_t format,
    const stmap_index_t rows,
    const stmap_index_t cols,
    const stmap_real_t* data,
    const stmap_index_t* indices,
    const stmap_index_t* indptr,
    const stmap_index_t nnz,
    stmap_matrix_t* out) {

    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    STMAP_C_API_TRY
        const auto fmt = kernel::ingest::parse_format(format);
        auto* handle = new stmap_matrix(
            kernel::ingest::from_buffers(fmt, rows, cols, data, indices, indptr, nnz));
        *out = handle;
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

STMAP_EXPORT stmap_error_t stmap_matrix_destroy(stmap_matrix_t* matrix) {
    if (matrix == nullptr || *matrix == nullptr) {
        STMAP_C_API_RETURN_OK;
    }
    delete *matrix;
    *matrix = nullptr;
    STMAP_C_API_RETURN_OK;
}

// =============================================================================
// Property Queries
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_matrix_rows(stmap_matrix_t matrix, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(matrix, "Matrix is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = expression_rows(matrix->matrix);
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_matrix_cols(stmap_matrix_t matrix, stmap_index_t* out) {
    STMAP_C_API_CHECK_NULL(matrix, "Matrix is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = expression_cols(matrix->matrix);
    STMAP_C_API_RETURN_OK;
}

STMAP_EXPORT stmap_error_t stmap_matrix_format(stmap_matrix_t matrix, int32_t* out) {
    STMAP_C_API_CHECK_NULL(matrix, "Matrix is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<int32_t>(kernel::ingest::format_of(matrix->matrix));
    STMAP_C_API_RETURN_OK;
}

// =============================================================================
// Conversion
// =============================================================================

STMAP_EXPORT stmap_error_t stmap_matrix_to_dense(
    stmap_matrix_t matrix,
    stmap_real_t* out,
    const stmap_size_t out_size) {

    STMAP_C_API_CHECK_NULL(matrix, "Matrix is null");

    STMAP_C_API_TRY
        const DenseMatrix dense = kernel::ingest::to_dense(matrix->matrix);
        copy_out(dense.view(), out, out_size);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
}

} // extern "C"
