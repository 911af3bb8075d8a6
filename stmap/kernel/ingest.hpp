#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/sparse.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// =============================================================================
// FILE: stmap/kernel/ingest.hpp
// BRIEF: Conversion of expression storage into dense row-major Real matrices
// =============================================================================
//
// Representation codes used across the C ABI and on disk:
//   0 / "array"       dense
//   1 / "csr_matrix"  compressed sparse rows
//   2 / "csc_matrix"  compressed sparse columns
// Anything else is rejected with UnsupportedMatrixTypeError.
// =============================================================================

namespace stmap::kernel::ingest {

enum class MatrixFormat : std::int32_t {
    Dense = 0,
    CSR = 1,
    CSC = 2
};

inline const char* format_name(MatrixFormat f) noexcept {
    switch (f) {
        case MatrixFormat::Dense: return "array";
        case MatrixFormat::CSR:   return "csr_matrix";
        case MatrixFormat::CSC:   return "csc_matrix";
    }
    return "unknown";
}

inline MatrixFormat parse_format(std::int32_t code) {
    switch (code) {
        case 0: return MatrixFormat::Dense;
        case 1: return MatrixFormat::CSR;
        case 2: return MatrixFormat::CSC;
        default: break;
    }
    STMAP_LOG_ERROR("Unsupported matrix representation code %d", static_cast<int>(code));
    throw UnsupportedMatrixTypeError(
        "Unsupported matrix representation code " + std::to_string(code) +
        " (expected 0 = dense, 1 = CSR, 2 = CSC)");
}

inline MatrixFormat format_from_encoding(std::string_view encoding) {
    if (encoding == "array") return MatrixFormat::Dense;
    if (encoding == "csr_matrix") return MatrixFormat::CSR;
    if (encoding == "csc_matrix") return MatrixFormat::CSC;

    const std::string name(encoding);
    STMAP_LOG_ERROR("Unsupported matrix encoding '%s'", name.c_str());
    throw UnsupportedMatrixTypeError("Unsupported matrix encoding '" + name +
                                     "' (expected array, csr_matrix or csc_matrix)");
}

inline MatrixFormat format_of(const ExpressionMatrix& x) noexcept {
    return static_cast<MatrixFormat>(x.index());
}

namespace detail {

template <typename>
inline constexpr bool always_false = false;

inline DenseMatrix densify(const CSR& m) {
    m.validate();
    DenseMatrix out(m.rows(), m.cols());
    auto dst = out.view();

    threading::parallel_for(Size(0), static_cast<Size>(m.rows()), [&](size_t i) {
        Real* STMAP_RESTRICT row = dst.row(static_cast<Index>(i)).ptr;
        for (Index p = m.indptr[i]; p < m.indptr[i + 1]; ++p) {
            row[m.indices[static_cast<Size>(p)]] += m.data[static_cast<Size>(p)];
        }
    });
    return out;
}

// Column-major scatter touches every row, so it stays serial
inline DenseMatrix densify(const CSC& m) {
    m.validate();
    DenseMatrix out(m.rows(), m.cols());

    for (Index j = 0; j < m.cols(); ++j) {
        const Size j_sz = static_cast<Size>(j);
        for (Index p = m.indptr[j_sz]; p < m.indptr[j_sz + 1]; ++p) {
            out(m.indices[static_cast<Size>(p)], j) += m.data[static_cast<Size>(p)];
        }
    }
    return out;
}

} // namespace detail

// Dense input is copied unchanged; sparse duplicates are summed
inline DenseMatrix to_dense(const ExpressionMatrix& x) {
    return std::visit([](const auto& m) -> DenseMatrix {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, DenseMatrix>) {
            return m.clone();
        } else if constexpr (std::is_same_v<M, CSR> || std::is_same_v<M, CSC>) {
            return detail::densify(m);
        } else {
            static_assert(detail::always_false<M>, "to_dense: unhandled expression representation");
        }
    }, x);
}

// Deep copy that keeps the representation
inline ExpressionMatrix clone(const ExpressionMatrix& x) {
    return std::visit([](const auto& m) -> ExpressionMatrix {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, DenseMatrix>) {
            return m.clone();
        } else {
            return M(m);
        }
    }, x);
}

// Build an ExpressionMatrix from raw buffers in the given format.
// Dense data is rows * cols row-major values; sparse buffers follow sparse.hpp.
inline ExpressionMatrix from_buffers(MatrixFormat format, Index rows, Index cols,
                                     const Real* data, const Index* indices,
                                     const Index* indptr, Index nnz) {
    STMAP_CHECK_ARG(rows >= 0 && cols >= 0, "from_buffers: negative shape");

    if (format == MatrixFormat::Dense) {
        const Size n = static_cast<Size>(rows) * static_cast<Size>(cols);
        if (n > 0) {
            STMAP_CHECK_NULL(data, "from_buffers: dense data is null");
        }
        return DenseMatrix::from(DenseArray<const Real>(data, rows, cols));
    }

    STMAP_CHECK_ARG(nnz >= 0, "from_buffers: negative nnz");
    STMAP_CHECK_NULL(indptr, "from_buffers: indptr is null");
    if (nnz > 0) {
        STMAP_CHECK_NULL(data, "from_buffers: sparse data is null");
        STMAP_CHECK_NULL(indices, "from_buffers: sparse indices is null");
    }

    const Index primary = (format == MatrixFormat::CSR) ? rows : cols;
    const Size n = static_cast<Size>(nnz);
    std::vector<Real> values(data, data + n);
    std::vector<Index> idx(indices, indices + n);
    std::vector<Index> ptr(indptr, indptr + primary + 1);

    if (format == MatrixFormat::CSR) {
        CSR m(rows, cols, std::move(values), std::move(idx), std::move(ptr));
        m.validate();
        return ExpressionMatrix(std::move(m));
    }
    CSC m(rows, cols, std::move(values), std::move(idx), std::move(ptr));
    m.validate();
    return ExpressionMatrix(std::move(m));
}

} // namespace stmap::kernel::ingest
