#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"

#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: stmap/core/sparse.hpp
// BRIEF: Owning compressed sparse matrices (CSR / CSC)
// =============================================================================
//
// Layout follows the scipy convention:
//   CSR: indptr has rows + 1 entries, indices are column ids
//   CSC: indptr has cols + 1 entries, indices are row ids
// Duplicate entries are allowed and sum on densification.
// =============================================================================

namespace stmap {

enum class SparseLayout : std::int32_t {
    CSR = 1,
    CSC = 2
};

template <SparseLayout L>
struct Compressed {
    static constexpr SparseLayout layout = L;
    static constexpr bool IS_CSR = (L == SparseLayout::CSR);

    Index n_rows = 0;
    Index n_cols = 0;
    std::vector<Real> data;
    std::vector<Index> indices;
    std::vector<Index> indptr;

    Compressed() = default;

    Compressed(Index rows, Index cols,
               std::vector<Real> values,
               std::vector<Index> idx,
               std::vector<Index> ptr)
        : n_rows(rows), n_cols(cols),
          data(std::move(values)), indices(std::move(idx)), indptr(std::move(ptr)) {}

    Compressed(Compressed&&) noexcept = default;
    Compressed& operator=(Compressed&&) noexcept = default;
    Compressed(const Compressed&) = default;
    Compressed& operator=(const Compressed&) = default;

    STMAP_NODISCARD Index rows() const noexcept { return n_rows; }
    STMAP_NODISCARD Index cols() const noexcept { return n_cols; }
    STMAP_NODISCARD Index nnz() const noexcept { return static_cast<Index>(data.size()); }

    // Length of the compressed axis (rows for CSR, cols for CSC)
    STMAP_NODISCARD Index primary_dim() const noexcept { return IS_CSR ? n_rows : n_cols; }
    STMAP_NODISCARD Index secondary_dim() const noexcept { return IS_CSR ? n_cols : n_rows; }

    // Structural validation; throws ValueError describing the first defect
    void validate() const {
        const char* name = IS_CSR ? "CSR" : "CSC";
        STMAP_CHECK_ARG(n_rows >= 0 && n_cols >= 0,
                        std::string(name) + ": negative shape");
        STMAP_CHECK_ARG(indptr.size() == static_cast<Size>(primary_dim()) + 1,
                        std::string(name) + ": indptr has " + std::to_string(indptr.size()) +
                        " entries, expected " + std::to_string(primary_dim() + 1));
        STMAP_CHECK_ARG(indices.size() == data.size(),
                        std::string(name) + ": indices and data lengths differ");
        STMAP_CHECK_ARG(indptr.front() == 0,
                        std::string(name) + ": indptr must start at 0");
        STMAP_CHECK_ARG(indptr.back() == nnz(),
                        std::string(name) + ": indptr must end at nnz (" +
                        std::to_string(nnz()) + ")");

        for (Size p = 0; p + 1 < indptr.size(); ++p) {
            STMAP_CHECK_ARG(indptr[p] <= indptr[p + 1],
                            std::string(name) + ": indptr is not monotone at " + std::to_string(p));
        }

        const Index bound = secondary_dim();
        for (Size k = 0; k < indices.size(); ++k) {
            STMAP_CHECK_ARG(indices[k] >= 0 && indices[k] < bound,
                            std::string(name) + ": index " + std::to_string(indices[k]) +
                            " out of range [0, " + std::to_string(bound) + ")");
        }
    }
};

using CSR = Compressed<SparseLayout::CSR>;
using CSC = Compressed<SparseLayout::CSC>;

} // namespace stmap
