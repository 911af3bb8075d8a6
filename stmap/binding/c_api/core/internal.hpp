#pragma once

// =============================================================================
// FILE: stmap/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ wrapper structures for C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
//
// PURPOSE:
//   - Bridge C opaque handles to C++ objects
//   - Implement exception-to-error-code conversion
//   - Shared argument helpers for the binding translation units
// =============================================================================

#include "stmap/binding/c_api/core/core.h"
#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/memory.hpp"
#include "stmap/kernel/mapper.hpp"
#include "stmap/kernel/mapping.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

static_assert(std::is_same_v<stmap_real_t, stmap::Real>,
              "stmap_real_t must match stmap::Real (check STMAP_PRECISION)");
static_assert(std::is_same_v<stmap_index_t, stmap::Index>,
              "stmap_index_t must match stmap::Index (check STMAP_INDEX_PRECISION)");

namespace stmap::binding {

// =============================================================================
// Internal Wrappers
// =============================================================================

/// @brief Owned expression matrix in any supported representation
struct MatrixWrapper {
    ExpressionMatrix matrix;

    explicit MatrixWrapper(ExpressionMatrix&& m) noexcept
        : matrix(std::move(m)) {}

    MatrixWrapper(const MatrixWrapper&) = delete;
    MatrixWrapper& operator=(const MatrixWrapper&) = delete;
    MatrixWrapper(MatrixWrapper&&) noexcept = default;
    MatrixWrapper& operator=(MatrixWrapper&&) noexcept = default;
    ~MatrixWrapper() = default;
};

/// @brief Owned annotated dataset
struct DatasetWrapper {
    Dataset dataset;

    explicit DatasetWrapper(Dataset&& ds) noexcept
        : dataset(std::move(ds)) {}

    DatasetWrapper(const DatasetWrapper&) = delete;
    DatasetWrapper& operator=(const DatasetWrapper&) = delete;
    DatasetWrapper(DatasetWrapper&&) noexcept = default;
    DatasetWrapper& operator=(DatasetWrapper&&) noexcept = default;
    ~DatasetWrapper() = default;
};

/// @brief Optimizer session; Mapper itself is pinned, so it lives on the heap
struct MapperWrapper {
    std::unique_ptr<kernel::mapper::Mapper> mapper;

    explicit MapperWrapper(std::unique_ptr<kernel::mapper::Mapper> m) noexcept
        : mapper(std::move(m)) {}

    MapperWrapper(const MapperWrapper&) = delete;
    MapperWrapper& operator=(const MapperWrapper&) = delete;
    MapperWrapper(MapperWrapper&&) noexcept = default;
    MapperWrapper& operator=(MapperWrapper&&) noexcept = default;
    ~MapperWrapper() = default;
};

/// @brief Finished mapping with its annotations
struct ResultWrapper {
    kernel::mapping::MappingResult result;

    explicit ResultWrapper(kernel::mapping::MappingResult&& r) noexcept
        : result(std::move(r)) {}

    ResultWrapper(const ResultWrapper&) = delete;
    ResultWrapper& operator=(const ResultWrapper&) = delete;
    ResultWrapper(ResultWrapper&&) noexcept = default;
    ResultWrapper& operator=(ResultWrapper&&) noexcept = default;
    ~ResultWrapper() = default;
};

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(stmap_error_t code, const char* message) noexcept;
void set_last_error(stmap_error_t code, std::string_view message) noexcept;
void clear_last_error() noexcept;
[[nodiscard]] auto get_last_error_message() noexcept -> const char*;
[[nodiscard]] auto get_last_error_code() noexcept -> stmap_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert the active C++ exception to a C error code.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> stmap_error_t;

// =============================================================================
// Argument Helpers (throwing; used inside STMAP_C_API_TRY)
// =============================================================================

/// @brief Copy n C strings; NULL names yields an empty (unnamed) axis
inline std::vector<std::string> copy_names(const char* const* names, stmap_index_t n) {
    std::vector<std::string> out;
    if (names == nullptr) {
        return out;
    }
    STMAP_CHECK_ARG(n >= 0, "Name count must be non-negative");
    out.reserve(static_cast<Size>(n));
    for (stmap_index_t k = 0; k < n; ++k) {
        STMAP_CHECK_NULL(names[k], "Name entry " + std::to_string(k) + " is null");
        out.emplace_back(names[k]);
    }
    return out;
}

inline void check_position(stmap_index_t k, Size n, const char* what) {
    if (k < 0 || static_cast<Size>(k) >= n) {
        throw IndexOutOfBoundsError(std::string(what) + " index " + std::to_string(k) +
                                    " out of range [0, " + std::to_string(n) + ")");
    }
}

/// @brief Copy a dense matrix into a caller buffer of out_size elements
inline void copy_out(DenseArray<const Real> src, stmap_real_t* out, stmap_size_t out_size) {
    STMAP_CHECK_NULL(out, "Output buffer is null");
    STMAP_CHECK_DIM(out_size >= src.size(),
                    "Output buffer holds " + std::to_string(out_size) + " values, need " +
                    std::to_string(src.size()));
    memory::copy_fast(Array<const Real>(src.ptr, src.size()), Array<Real>(out, src.size()));
}

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// @brief Check pointer argument and return error if null
#define STMAP_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (STMAP_UNLIKELY((ptr) == nullptr)) { \
            stmap::binding::set_last_error(STMAP_ERROR_NULL_POINTER, (msg)); \
            return STMAP_ERROR_NULL_POINTER; \
        } \
    } while(0)

/// @brief Check condition and return error if false
#define STMAP_C_API_CHECK(cond, code, msg) \
    do { \
        if (STMAP_UNLIKELY(!(cond))) { \
            stmap::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define STMAP_C_API_TRY try {

#define STMAP_C_API_CATCH \
    } catch (...) { \
        return stmap::binding::handle_exception(); \
    }

/// @brief Clear error and return success
#define STMAP_C_API_RETURN_OK \
    do { \
        stmap::binding::clear_last_error(); \
        return STMAP_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace stmap::binding

// =============================================================================
// Opaque Handle Definitions (C ABI Compatibility)
// =============================================================================

// These complete the forward declarations in core.h. Handles are allocated
// as the derived type, so no downcasting is ever needed.

struct stmap_matrix : stmap::binding::MatrixWrapper {
    using MatrixWrapper::MatrixWrapper;
};

struct stmap_dataset : stmap::binding::DatasetWrapper {
    using DatasetWrapper::DatasetWrapper;
};

struct stmap_mapper : stmap::binding::MapperWrapper {
    using MapperWrapper::MapperWrapper;
};

struct stmap_result : stmap::binding::ResultWrapper {
    using ResultWrapper::ResultWrapper;
};

static_assert(std::is_base_of_v<stmap::binding::MatrixWrapper, stmap_matrix>,
              "stmap_matrix must inherit from MatrixWrapper");
static_assert(std::is_base_of_v<stmap::binding::DatasetWrapper, stmap_dataset>,
              "stmap_dataset must inherit from DatasetWrapper");
static_assert(std::is_base_of_v<stmap::binding::MapperWrapper, stmap_mapper>,
              "stmap_mapper must inherit from MapperWrapper");
static_assert(std::is_base_of_v<stmap::binding::ResultWrapper, stmap_result>,
              "stmap_result must inherit from ResultWrapper");

static_assert(!std::is_copy_constructible_v<stmap_matrix>,
              "stmap_matrix must not be copyable");
static_assert(!std::is_copy_constructible_v<stmap_dataset>,
              "stmap_dataset must not be copyable");
static_assert(!std::is_copy_constructible_v<stmap_mapper>,
              "stmap_mapper must not be copyable");
static_assert(!std::is_copy_constructible_v<stmap_result>,
              "stmap_result must not be copyable");
