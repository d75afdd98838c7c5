#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/errors.hpp"
#include "common/types.hpp"
#include "config/gsea_config.hpp"
#include "core/normalization.hpp"
#include "core/permutation.hpp"
#include "core/random_source.hpp"
#include "core/ranked_list.hpp"

namespace kgsea {

    // Final per-gene-set record handed to the retrieval/explanation layer.
    struct GeneSetReport {
        std::string gene_set_id;
        ErrorKind   error = ErrorKind::None;   // gene-set scoped failure, if any
        bool        filtered = false;          // overlap outside [min_size, max_size]
        std::string message;                   // failure / filter context
        std::optional<EnrichmentResult> enrichment;
        std::optional<NormalizedResult> normalized;

        bool ok() const { return error == ErrorKind::None && !filtered; }
    };

    // Output of phase 1 for one gene set. norm/esnull are only meaningful
    // when report.ok().
    struct ScoredGeneSet {
        GeneSetReport report;
        GeneSetNormalization norm;
        NullDistribution esnull;
    };

    // Two-phase enrichment run over one ranked list.
    //
    // Phase 1 (score_gene_set / score_gene_sets) handles gene sets
    // independently: tag indicator, observed ES, permutation null, NES and
    // p-value. Gene-set scoped errors are caught and recorded in the report;
    // config errors and cancellation propagate.
    // Phase 2 (finalize_batch) is the batch barrier: FDR over every gene set
    // that made it through phase 1.
    class EnrichmentPipeline {
    public:
        // Validates cfg (throws ConfigError / PermutationCountInvalid).
        // rng_factory defaults to Mt19937SourceFactory.
        EnrichmentPipeline(const RankedList& ranked,
            const GseaConfig& cfg,
            const RandomSourceFactory* rng_factory = nullptr,
            const CancellationToken* cancel = nullptr);
        EnrichmentPipeline(const EnrichmentPipeline&) = delete;
        EnrichmentPipeline& operator=(const EnrichmentPipeline&) = delete;

        ScoredGeneSet score_gene_set(const GeneSet& gene_set) const;
        std::vector<ScoredGeneSet> score_gene_sets(const std::vector<GeneSet>& gene_sets) const;

        // Fills fdr_q of every ok report; failed and filtered ones are left
        // out of the pools.
        static std::vector<GeneSetReport> finalize_batch(const std::vector<ScoredGeneSet>& scored);

        // Both phases.
        std::vector<GeneSetReport> run(const std::vector<GeneSet>& gene_sets) const;

        void set_log_prefix(const std::string& prefix) { log_prefix_ = prefix; }

    private:
        const RankedList& ranked_;
        GseaConfig cfg_;
        Mt19937SourceFactory default_factory_;
        const RandomSourceFactory& rng_factory_;
        const CancellationToken* cancel_;
        PermutationEngine perm_;
        std::string log_prefix_;
    };

} // namespace kgsea
