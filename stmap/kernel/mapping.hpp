#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/dense.hpp"
#include "stmap/core/dataset.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/log.hpp"
#include "stmap/kernel/ingest.hpp"
#include "stmap/kernel/align.hpp"
#include "stmap/kernel/mapper.hpp"
#include "stmap/kernel/similarity.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: stmap/kernel/mapping.hpp
// BRIEF: End-to-end cell-to-space mapping of two gene-aligned datasets
// =============================================================================

namespace stmap::kernel::mapping {

namespace config {
    constexpr const char* DEFAULT_MODE = "simple";
    constexpr const char* DEFAULT_DEVICE = "cuda:0";
}

struct MappingOptions {
    std::string mode = config::DEFAULT_MODE;
    std::string device = config::DEFAULT_DEVICE;
    Real learning_rate = mapper::config::LEARNING_RATE;
    Index num_epochs = mapper::config::NUM_EPOCHS;
    std::uint64_t seed = mapper::config::SEED;
    size_t num_threads = 0;
    Index print_each = mapper::config::PRINT_EACH;
    mapper::EpochObserver observer;
};

// Cells x spots mapping plus per-gene fit, ranked by descending score
struct MappingResult {
    DenseMatrix mapping;
    std::vector<std::string> cell_names;
    std::vector<std::string> spot_names;
    std::vector<std::string> training_genes;
    std::vector<std::pair<std::string, Real>> gene_scores;
    // Logits and Adam moments at the end of training. Present on results of
    // map_cells_to_space; absent when only a mapping matrix is known.
    std::optional<mapper::MapperState> optimizer;

    STMAP_NODISCARD Index n_cells() const noexcept { return mapping.rows(); }
    STMAP_NODISCARD Index n_spots() const noexcept { return mapping.cols(); }
};

// Throws UnsupportedModeError for anything but "simple"
inline mapper::Hyperparameters hyperparameters_for(const std::string& mode) {
    if (mode == "simple") {
        mapper::Hyperparameters hp;
        hp.lambda_d = Real(0);
        hp.lambda_g1 = Real(1);
        hp.lambda_g2 = Real(0);
        hp.lambda_r = Real(0);
        return hp;
    }
    throw UnsupportedModeError("Unsupported mapping mode '" + mode + "' (supported: simple)");
}

// cos(predicted[:, g], observed[:, g]) per gene, with predicted = M^T S,
// stably sorted by descending score
inline std::vector<std::pair<std::string, Real>> score_genes(
    DenseArray<const Real> mapping_matrix,
    DenseArray<const Real> cells,
    DenseArray<const Real> space,
    const std::vector<std::string>& genes)
{
    STMAP_CHECK_DIM(static_cast<Index>(genes.size()) == cells.cols,
                    "score_genes: gene list does not match the expression columns");

    DenseMatrix predicted(space.rows, space.cols);
    mapper::detail::predict(mapping_matrix, cells, predicted.view());

    memory::AlignedBuffer<Real> cos(static_cast<Size>(cells.cols));
    similarity::cosine_columns(predicted.view(), space, cos.array());

    std::vector<std::pair<std::string, Real>> scores;
    scores.reserve(genes.size());
    for (Size g = 0; g < genes.size(); ++g) {
        scores.emplace_back(genes[g], cos[g]);
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return scores;
}

// cells and space must already share an identical gene axis (see
// align::align_genes). previous, when given, continues its training: from its
// optimizer state when it carries one, otherwise from log of its mapping.
inline MappingResult map_cells_to_space(const Dataset& cells,
                                        const Dataset& space,
                                        const MappingOptions& options = MappingOptions{},
                                        const MappingResult* previous = nullptr) {
    const mapper::Hyperparameters hp = hyperparameters_for(options.mode);

    STMAP_LOG_INFO("Allocate tensors for mapping.");

    cells.validate();
    space.validate();
    align::check_aligned(cells, space);

    DenseMatrix S = ingest::to_dense(cells.X);
    DenseMatrix G = ingest::to_dense(space.X);

    // The simple mode carries no density term
    memory::AlignedBuffer<Real> d(static_cast<Size>(G.rows()));

    std::optional<DenseArray<const Real>> resume;
    if (previous != nullptr) {
        resume = previous->mapping.view();
    }

    MappingResult result;
    {
        mapper::Mapper m(S.view(), G.view(), d.array(), hp, options.device, resume,
                         options.seed, options.num_threads);
        if (previous != nullptr && previous->optimizer) {
            m.restore(*previous->optimizer);
        }

        STMAP_LOG_INFO("Begin training...");
        m.train(options.num_epochs, options.learning_rate, options.observer, options.print_each);

        STMAP_LOG_INFO("Saving results..");
        result.mapping = m.mapping();
        result.optimizer = m.state().clone();
    }

    result.cell_names = cells.obs_names;
    result.spot_names = space.obs_names;
    if (!cells.var_names.empty()) {
        result.training_genes = cells.var_names;
    } else {
        result.training_genes.reserve(static_cast<Size>(S.cols()));
        for (Index g = 0; g < S.cols(); ++g) {
            result.training_genes.push_back(std::to_string(g));
        }
    }
    result.gene_scores = score_genes(result.mapping.view(), S.view(), G.view(),
                                     result.training_genes);
    return result;
}

} // namespace stmap::kernel::mapping
