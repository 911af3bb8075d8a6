// =============================================================================
// FILE: stmap/binding/c_api/io.cpp
// BRIEF: C API implementation for h5ad-style persistence
// =============================================================================

#include "stmap/binding/c_api/io.h"
#include "stmap/binding/c_api/core/internal.hpp"
#include "stmap/core/error.hpp"

#ifdef STMAP_HAS_HDF5
#include "stmap/io/h5ad.hpp"
#endif

using namespace stmap;
using namespace stmap::binding;

#ifndef STMAP_HAS_HDF5
namespace {

stmap_error_t hdf5_unavailable() noexcept {
    set_last_error(STMAP_ERROR_FEATURE_UNAVAILABLE, "stmap was built without HDF5 support");
    return STMAP_ERROR_FEATURE_UNAVAILABLE;
}

} // anonymous namespace
#endif

extern "C" {

STMAP_EXPORT stmap_error_t stmap_io_read_dataset(const char* path, stmap_dataset_t* out) {
    STMAP_C_API_CHECK_NULL(path, "Path is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

#ifdef STMAP_HAS_HDF5
    STMAP_C_API_TRY
        *out = new stmap_dataset(io::read_dataset(path));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
#else
    return hdf5_unavailable();
#endif
}

STMAP_EXPORT stmap_error_t stmap_io_write_dataset(const char* path, stmap_dataset_t dataset) {
    STMAP_C_API_CHECK_NULL(path, "Path is null");
    STMAP_C_API_CHECK_NULL(dataset, "Dataset is null");

#ifdef STMAP_HAS_HDF5
    STMAP_C_API_TRY
        io::write_dataset(path, dataset->dataset);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
#else
    return hdf5_unavailable();
#endif
}

STMAP_EXPORT stmap_error_t stmap_io_write_result(const char* path, stmap_result_t result) {
    STMAP_C_API_CHECK_NULL(path, "Path is null");
    STMAP_C_API_CHECK_NULL(result, "Result is null");

#ifdef STMAP_HAS_HDF5
    STMAP_C_API_TRY
        io::write_result(path, result->result);
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
#else
    return hdf5_unavailable();
#endif
}

STMAP_EXPORT stmap_error_t stmap_io_read_result(const char* path, stmap_result_t* out) {
    STMAP_C_API_CHECK_NULL(path, "Path is null");
    STMAP_C_API_CHECK_NULL(out, "Output pointer is null");

#ifdef STMAP_HAS_HDF5
    STMAP_C_API_TRY
        *out = new stmap_result(io::read_result(path));
        STMAP_C_API_RETURN_OK;
    STMAP_C_API_CATCH
#else
    return hdf5_unavailable();
#endif
}

} // extern "C"
