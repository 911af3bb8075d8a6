#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/sparse.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/io/hdf5.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/kernel/mapping.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#ifdef STMAP_HAS_HDF5

// =============================================================================
// FILE: stmap/io/h5ad.hpp
// BRIEF: Annotated datasets and mapping results in h5ad-style HDF5 files
// =============================================================================
//
// Layout:
//   /X      2-D dataset (dense), or group with attrs encoding-type
//           ("csr_matrix" | "csc_matrix") and shape, holding data/indices/indptr
//   /obs    group, attr _index names a string dataset of row identifiers
//   /var    group, attr _index names a string dataset of column identifiers
//   /uns    results only: training_genes, train_genes_scores/{gene,score}
//           and optimizer/{logits,adam_m,adam_v} with attrs epoch, adam_step
// =============================================================================

namespace stmap::io {

namespace detail {

inline constexpr const char* ENCODING_ATTR = "encoding-type";
inline constexpr const char* INDEX_ATTR = "_index";

inline std::vector<std::string> read_axis(const h5::File& file, const char* group, Index expected) {
    if (!file.exists(group)) {
        return {};
    }
    h5::Group g = file.open_group(group);
    const std::string index_name = g.has_attr(INDEX_ATTR) ? g.read_attr_string(INDEX_ATTR)
                                                          : std::string(INDEX_ATTR);
    if (!g.exists(index_name)) {
        return {};
    }
    std::vector<std::string> names = g.read_strings(index_name);
    if (static_cast<Index>(names.size()) != expected) {
        throw DimensionMismatchError(std::string("h5ad: /") + group + " lists " +
                                     std::to_string(names.size()) + " names for " +
                                     std::to_string(expected) + " entries");
    }
    return names;
}

// Unnamed axes are written as "0", "1", ...
inline void write_axis(h5::File& file, const char* group,
                       const std::vector<std::string>& names, Index n) {
    h5::Group g = file.create_group(group);
    g.write_attr_string(ENCODING_ATTR, "dataframe");
    g.write_attr_string(INDEX_ATTR, INDEX_ATTR);

    if (!names.empty()) {
        g.write_strings(INDEX_ATTR, names);
        return;
    }
    std::vector<std::string> generated;
    generated.reserve(static_cast<Size>(n));
    for (Index k = 0; k < n; ++k) {
        generated.push_back(std::to_string(k));
    }
    g.write_strings(INDEX_ATTR, generated);
}

inline DenseMatrix read_dense(const h5::Dataset& dset) {
    const auto dims = dset.get_dims();
    if (dims.size() != 2) {
        throw UnsupportedMatrixTypeError("h5ad: dense X must be 2-D, got rank " +
                                         std::to_string(dims.size()));
    }
    DenseMatrix out(static_cast<Index>(dims[0]), static_cast<Index>(dims[1]));
    if (out.size() > 0) {
        dset.read(out.data());
    }
    return out;
}

template <SparseLayout L>
inline Compressed<L> read_compressed(const h5::Group& g, Index rows, Index cols) {
    Compressed<L> m(rows, cols,
                    g.read_dataset<Real>("data"),
                    g.read_dataset<Index>("indices"),
                    g.read_dataset<Index>("indptr"));
    m.validate();
    return m;
}

inline ExpressionMatrix read_matrix(const h5::File& file, const char* name) {
    switch (file.get_object_type(name)) {
        case h5::ObjectType::Dataset:
            return read_dense(file.open_dataset(name));
        case h5::ObjectType::Group:
            break;
        default:
            throw ReadError(std::string("h5ad: missing /") + name);
    }

    h5::Group g = file.open_group(name);
    const std::string encoding = g.has_attr(ENCODING_ATTR) ? g.read_attr_string(ENCODING_ATTR)
                                                           : std::string("unknown");
    const kernel::ingest::MatrixFormat format = kernel::ingest::format_from_encoding(encoding);

    const auto shape = g.read_attr_array<std::int64_t>("shape");
    if (shape.size() != 2) {
        throw ReadError(std::string("h5ad: /") + name + " shape must have 2 entries");
    }
    const Index rows = static_cast<Index>(shape[0]);
    const Index cols = static_cast<Index>(shape[1]);

    switch (format) {
        case kernel::ingest::MatrixFormat::CSR:
            return read_compressed<SparseLayout::CSR>(g, rows, cols);
        case kernel::ingest::MatrixFormat::CSC:
            return read_compressed<SparseLayout::CSC>(g, rows, cols);
        default:
            break;
    }
    STMAP_LOG_ERROR("h5ad: group-encoded /%s declares encoding '%s'", name, encoding.c_str());
    throw UnsupportedMatrixTypeError("h5ad: group-encoded matrix cannot use encoding '" +
                                     encoding + "'");
}

inline void write_dense(h5::Location& loc, const char* name, DenseArray<const Real> m) {
    loc.write_dataset<Real>(name, m.ptr,
                             {static_cast<hsize_t>(m.rows), static_cast<hsize_t>(m.cols)});
}

template <SparseLayout L>
inline void write_compressed(h5::File& file, const char* name, const Compressed<L>& m) {
    h5::Group g = file.create_group(name);
    g.write_attr_string(ENCODING_ATTR, Compressed<L>::IS_CSR ? "csr_matrix" : "csc_matrix");
    g.write_attr_string("encoding-version", "0.1.0");
    g.write_attr_array<std::int64_t>("shape", {static_cast<std::int64_t>(m.rows()),
                                              static_cast<std::int64_t>(m.cols())});
    g.write_dataset<Real>("data", m.data);
    g.write_dataset<Index>("indices", m.indices);
    g.write_dataset<Index>("indptr", m.indptr);
}

// Saved logits and Adam moments must match the mapping they came with
inline kernel::mapper::MapperState read_optimizer(const h5::Group& g, Index n_cells,
                                                  Index n_spots) {
    kernel::mapper::MapperState st;
    st.logits = read_dense(g.open_dataset("logits"));
    st.moments.m = read_dense(g.open_dataset("adam_m"));
    st.moments.v = read_dense(g.open_dataset("adam_v"));
    for (const DenseMatrix* part : {&st.logits, &st.moments.m, &st.moments.v}) {
        if (part->rows() != n_cells || part->cols() != n_spots) {
            throw ReadError("h5ad: optimizer state is " + std::to_string(part->rows()) + "x" +
                            std::to_string(part->cols()) + ", mapping is " +
                            std::to_string(n_cells) + "x" + std::to_string(n_spots));
        }
    }
    const auto epoch = g.read_attr_array<std::int64_t>("epoch");
    const auto step = g.read_attr_array<std::int64_t>("adam_step");
    if (epoch.size() != 1 || step.size() != 1 || epoch[0] < 0 || step[0] < 0) {
        throw ReadError("h5ad: optimizer epoch/adam_step must be single non-negative values");
    }
    st.epoch = static_cast<Index>(epoch[0]);
    st.moments.step = static_cast<Index>(step[0]);
    return st;
}

inline void write_matrix(h5::File& file, const char* name, const ExpressionMatrix& x) {
    std::visit([&](const auto& m) {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, DenseMatrix>) {
            write_dense(file, name, m.view());
        } else {
            write_compressed(file, name, m);
        }
    }, x);
}

} // namespace detail

// =============================================================================
// Datasets
// =============================================================================

inline Dataset read_dataset(const std::string& path) {
    h5::File file(path);

    Dataset ds;
    ds.X = detail::read_matrix(file, "X");
    ds.obs_names = detail::read_axis(file, "obs", ds.n_obs());
    ds.var_names = detail::read_axis(file, "var", ds.n_vars());

    STMAP_LOG_DEBUG("Read %lld x %lld dataset from %s",
                    static_cast<long long>(ds.n_obs()),
                    static_cast<long long>(ds.n_vars()), path.c_str());
    return ds;
}

inline void write_dataset(const std::string& path, const Dataset& ds) {
    ds.validate();

    h5::File file = h5::File::create(path);
    detail::write_matrix(file, "X", ds.X);
    detail::write_axis(file, "obs", ds.obs_names, ds.n_obs());
    detail::write_axis(file, "var", ds.var_names, ds.n_vars());
    file.flush();
}

// =============================================================================
// Mapping Results
// =============================================================================

inline void write_result(const std::string& path, const kernel::mapping::MappingResult& result) {
    h5::File file = h5::File::create(path);

    detail::write_dense(file, "X", result.mapping.view());
    detail::write_axis(file, "obs", result.cell_names, result.n_cells());
    detail::write_axis(file, "var", result.spot_names, result.n_spots());

    h5::Group uns = file.create_group("uns");
    uns.write_strings("training_genes", result.training_genes);

    std::vector<std::string> genes;
    std::vector<Real> scores;
    genes.reserve(result.gene_scores.size());
    scores.reserve(result.gene_scores.size());
    for (const auto& [gene, score] : result.gene_scores) {
        genes.push_back(gene);
        scores.push_back(score);
    }
    h5::Group table = uns.create_group("train_genes_scores");
    table.write_strings("gene", genes);
    table.write_dataset<Real>("score", scores);

    if (result.optimizer) {
        const kernel::mapper::MapperState& st = *result.optimizer;
        h5::Group opt = uns.create_group("optimizer");
        detail::write_dense(opt, "logits", st.logits.view());
        detail::write_dense(opt, "adam_m", st.moments.m.view());
        detail::write_dense(opt, "adam_v", st.moments.v.view());
        opt.write_attr_array<std::int64_t>("epoch", {static_cast<std::int64_t>(st.epoch)});
        opt.write_attr_array<std::int64_t>("adam_step",
                                          {static_cast<std::int64_t>(st.moments.step)});
    }

    file.flush();
}

inline kernel::mapping::MappingResult read_result(const std::string& path) {
    h5::File file(path);

    if (file.get_object_type("X") != h5::ObjectType::Dataset) {
        throw ReadError("h5ad: mapping result '" + path + "' has no dense /X");
    }

    kernel::mapping::MappingResult result;
    result.mapping = detail::read_dense(file.open_dataset("X"));
    result.cell_names = detail::read_axis(file, "obs", result.n_cells());
    result.spot_names = detail::read_axis(file, "var", result.n_spots());

    if (file.exists("uns")) {
        h5::Group uns = file.open_group("uns");
        if (uns.exists("training_genes")) {
            result.training_genes = uns.read_strings("training_genes");
        }
        if (uns.exists("train_genes_scores")) {
            h5::Group table = uns.open_group("train_genes_scores");
            auto genes = table.read_strings("gene");
            auto scores = table.read_dataset<Real>("score");
            if (genes.size() != scores.size()) {
                throw ReadError("h5ad: train_genes_scores columns differ in length");
            }
            result.gene_scores.reserve(genes.size());
            for (Size k = 0; k < genes.size(); ++k) {
                result.gene_scores.emplace_back(std::move(genes[k]), scores[k]);
            }
        }
        if (uns.exists("optimizer")) {
            result.optimizer = detail::read_optimizer(uns.open_group("optimizer"),
                                                      result.n_cells(), result.n_spots());
        }
    }
    return result;
}

} // namespace stmap::io

#endif // STMAP_HAS_HDF5
