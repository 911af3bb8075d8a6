#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/threading/parallel_for.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// =============================================================================
// FILE: stmap/kernel/align.hpp
// BRIEF: Restrict two datasets to their shared genes in a common order
// =============================================================================

namespace stmap::kernel::align {

struct AlignedPair {
    Dataset cells;
    Dataset space;
    std::vector<std::string> genes;
};

namespace detail {

inline std::unordered_map<std::string, Index> index_genes(const Dataset& ds, const char* which) {
    STMAP_CHECK_ARG(!ds.var_names.empty() || ds.n_vars() == 0,
                    std::string("align_genes: ") + which + " dataset has no gene names");

    std::unordered_map<std::string, Index> pos;
    pos.reserve(ds.var_names.size());
    for (Size j = 0; j < ds.var_names.size(); ++j) {
        auto [it, inserted] = pos.emplace(ds.var_names[j], static_cast<Index>(j));
        STMAP_CHECK_ARG(inserted, std::string("align_genes: duplicate gene '") +
                        ds.var_names[j] + "' in " + which + " dataset");
    }
    return pos;
}

// out[:, k] = src[:, cols[k]]
inline DenseMatrix gather_columns(const DenseMatrix& src, const std::vector<Index>& cols) {
    const Index n_out = static_cast<Index>(cols.size());
    DenseMatrix out(src.rows(), n_out);
    auto dst = out.view();
    auto in = src.view();

    threading::parallel_for(Size(0), static_cast<Size>(src.rows()), [&](size_t i) {
        const Index r = static_cast<Index>(i);
        const Real* STMAP_RESTRICT s = in.row(r).ptr;
        Real* STMAP_RESTRICT d = dst.row(r).ptr;
        for (Index k = 0; k < n_out; ++k) {
            d[k] = s[cols[static_cast<Size>(k)]];
        }
    });
    return out;
}

} // namespace detail

// Genes are kept in the order they appear in cells. Without a candidate list
// every gene of cells is a candidate. Both outputs are dense.
inline AlignedPair align_genes(const Dataset& cells, const Dataset& space,
                               const std::optional<std::vector<std::string>>& candidates = std::nullopt) {
    cells.validate();
    space.validate();

    detail::index_genes(cells, "cells");
    const auto space_pos = detail::index_genes(space, "space");

    std::unordered_set<std::string> wanted;
    if (candidates) {
        wanted.insert(candidates->begin(), candidates->end());
    }

    std::vector<std::string> genes;
    std::vector<Index> cell_cols;
    std::vector<Index> space_cols;
    for (Size j = 0; j < cells.var_names.size(); ++j) {
        const std::string& g = cells.var_names[j];
        if (candidates && wanted.find(g) == wanted.end()) continue;
        auto it = space_pos.find(g);
        if (it == space_pos.end()) continue;
        genes.push_back(g);
        cell_cols.push_back(static_cast<Index>(j));
        space_cols.push_back(it->second);
    }

    STMAP_LOG_INFO("%zu marker genes shared by datasets.", genes.size());

    if (genes.empty()) {
        throw GeneAlignmentError("align_genes: datasets share no genes");
    }

    AlignedPair out;
    out.cells.X = detail::gather_columns(ingest::to_dense(cells.X), cell_cols);
    out.cells.obs_names = cells.obs_names;
    out.cells.var_names = genes;
    out.space.X = detail::gather_columns(ingest::to_dense(space.X), space_cols);
    out.space.obs_names = space.obs_names;
    out.space.var_names = genes;
    out.genes = std::move(genes);
    return out;
}

// Throws GeneAlignmentError unless both gene axes agree in length and,
// when both are named, in order
inline void check_aligned(const Dataset& cells, const Dataset& space) {
    if (cells.n_vars() != space.n_vars()) {
        throw GeneAlignmentError("Gene axes differ in length: " +
                                 std::to_string(cells.n_vars()) + " vs " +
                                 std::to_string(space.n_vars()));
    }
    if (cells.var_names.empty() || space.var_names.empty()) return;

    for (Size j = 0; j < cells.var_names.size(); ++j) {
        if (cells.var_names[j] != space.var_names[j]) {
            throw GeneAlignmentError("Gene axes differ at position " + std::to_string(j) +
                                     ": '" + cells.var_names[j] + "' vs '" +
                                     space.var_names[j] + "'");
        }
    }
}

} // namespace stmap::kernel::align
