#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/sparse.hpp"

#include <string>
#include <variant>
#include <vector>

// =============================================================================
// FILE: stmap/core/dataset.hpp
// BRIEF: Annotated expression dataset (observations x genes)
// =============================================================================

namespace stmap {

// Tagged expression storage; see kernel/ingest.hpp for conversions
using ExpressionMatrix = std::variant<DenseMatrix, CSR, CSC>;

inline Index expression_rows(const ExpressionMatrix& x) noexcept {
    return std::visit([](const auto& m) -> Index { return m.rows(); }, x);
}

inline Index expression_cols(const ExpressionMatrix& x) noexcept {
    return std::visit([](const auto& m) -> Index { return m.cols(); }, x);
}

// X is observations x variables; obs_names/var_names may be empty
// (unnamed axis) or carry exactly one identifier per row/column.
struct Dataset {
    ExpressionMatrix X;
    std::vector<std::string> obs_names;
    std::vector<std::string> var_names;

    STMAP_NODISCARD Index n_obs() const noexcept { return expression_rows(X); }
    STMAP_NODISCARD Index n_vars() const noexcept { return expression_cols(X); }

    void validate() const {
        STMAP_CHECK_DIM(obs_names.empty() || static_cast<Index>(obs_names.size()) == n_obs(),
                        "Dataset: " + std::to_string(obs_names.size()) +
                        " observation names for " + std::to_string(n_obs()) + " rows");
        STMAP_CHECK_DIM(var_names.empty() || static_cast<Index>(var_names.size()) == n_vars(),
                        "Dataset: " + std::to_string(var_names.size()) +
                        " variable names for " + std::to_string(n_vars()) + " columns");
    }
};

} // namespace stmap
