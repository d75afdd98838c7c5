#pragma once
#include <mpi.h>
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "config/gsea_config.hpp"
#include "core/permutation.hpp"
#include "core/ranked_list.hpp"
#include "pipeline/enrichment_pipeline.hpp"

namespace kgsea {

    struct DistributedResult {
        // On rank 0: one report per input gene set, input order.
        // On other ranks: empty.
        std::vector<GeneSetReport> reports;
        // On rank 0 and only with cfg.write_null_h5: raw null ES per gene set
        // (empty for gene sets that were not scored).
        std::vector<NullDistribution> esnull;
    };

    // MPI counts and displacements are int: throws std::runtime_error when n
    // does not fit.
    int mpi_count(uint64_t n, const char* what);

    // Gene set i is scored on rank (i % world), permutations of one gene set
    // run on that rank's OpenMP threads. Per-gene-set results are gathered to
    // rank 0, which runs the batch FDR step. Every rank must pass the same
    // ranked list, gene sets and config.
    // A fatal error on any rank (config, cancellation) is raised on all
    // ranks before the gather, so no rank waits forever.
    DistributedResult run_enrichment_mpi(MPI_Comm comm,
        const RankedList& ranked,
        const std::vector<GeneSet>& gene_sets,
        const GseaConfig& cfg,
        const CancellationToken* cancel = nullptr);

} // namespace kgsea
