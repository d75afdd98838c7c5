#include "pipeline/enrichment_pipeline.hpp"
#include "core/running_sum.hpp"
#include "core/tag_indicator.hpp"

#include <iostream>

namespace kgsea {

    static const GseaConfig& checked(const GseaConfig& cfg) {
        validate_config(cfg);
        return cfg;
    }

    static PermutationParams permutation_params(const GseaConfig& cfg) {
        PermutationParams P;
        P.n_permutations = cfg.n_permutations;
        P.seed = cfg.seed;
        P.weight_exponent = cfg.weight_exponent;
        P.max_resample_retries = cfg.max_resample_retries;
        P.n_threads = cfg.n_threads;
        return P;
    }

    EnrichmentPipeline::EnrichmentPipeline(const RankedList& ranked,
        const GseaConfig& cfg,
        const RandomSourceFactory* rng_factory,
        const CancellationToken* cancel)
        : ranked_(ranked),
        cfg_(checked(cfg)),
        rng_factory_(rng_factory ? *rng_factory : default_factory_),
        cancel_(cancel),
        perm_(ranked, permutation_params(cfg_), rng_factory_, cancel) {}

    ScoredGeneSet EnrichmentPipeline::score_gene_set(const GeneSet& gene_set) const {
        ScoredGeneSet S;
        S.report.gene_set_id = gene_set.id;

        try {
            TagIndicator T = build_tag_indicator(ranked_, gene_set);

            if (T.hit_count < cfg_.min_size || (cfg_.max_size > 0 && T.hit_count > cfg_.max_size)) {
                S.report.filtered = true;
                S.report.message = "overlap " + std::to_string(T.hit_count) + " outside ["
                    + std::to_string(cfg_.min_size) + ", "
                    + (cfg_.max_size > 0 ? std::to_string(cfg_.max_size) : std::string("inf")) + "]";
                return S;
            }

            S.report.enrichment = compute_enrichment(ranked_, gene_set, T, cfg_.weight_exponent);
            S.esnull = perm_.run(gene_set.id, T.hit_count);
            S.norm = normalize_gene_set(*S.report.enrichment, S.esnull);

            NormalizedResult N;
            N.gene_set_id = gene_set.id;
            N.nes = S.norm.nes;
            N.p_value = S.norm.p_value;
            N.fdr_q = 1.0;   // set by finalize_batch
            S.report.normalized = N;
        }
        catch (const GseaError& e) {
            if (!is_gene_set_scoped(e.kind())) throw;
            S.report.error = e.kind();
            S.report.message = e.what();
            S.report.normalized.reset();
            S.norm = GeneSetNormalization{};
            S.esnull.clear();
            if (cfg_.verbose) {
                std::cerr << log_prefix_ << "Warning: gene set '" << gene_set.id
                    << "' excluded: " << e.what() << "\n";
            }
        }
        return S;
    }

    std::vector<ScoredGeneSet> EnrichmentPipeline::score_gene_sets(const std::vector<GeneSet>& gene_sets) const {
        std::vector<ScoredGeneSet> out;
        out.reserve(gene_sets.size());
        for (const auto& gs : gene_sets) {
            if (cancel_ && cancel_->cancelled()) {
                throw RunCancelled("run cancelled after " + std::to_string(out.size()) + " gene sets");
            }
            out.push_back(score_gene_set(gs));
        }
        return out;
    }

    std::vector<GeneSetReport> EnrichmentPipeline::finalize_batch(const std::vector<ScoredGeneSet>& scored) {
        std::vector<size_t> ok_idx;
        std::vector<GeneSetNormalization> pool;
        for (size_t i = 0; i < scored.size(); ++i) {
            if (!scored[i].report.ok()) continue;
            ok_idx.push_back(i);
            pool.push_back(scored[i].norm);
        }

        const std::vector<double> q = compute_fdr(pool);

        std::vector<GeneSetReport> reports;
        reports.reserve(scored.size());
        for (const auto& s : scored) reports.push_back(s.report);
        for (size_t k = 0; k < ok_idx.size(); ++k) {
            reports[ok_idx[k]].normalized->fdr_q = q[k];
        }
        return reports;
    }

    std::vector<GeneSetReport> EnrichmentPipeline::run(const std::vector<GeneSet>& gene_sets) const {
        auto scored = score_gene_sets(gene_sets);
        auto reports = finalize_batch(scored);

        if (cfg_.verbose) {
            size_t n_ok = 0, n_filtered = 0;
            for (const auto& r : reports) {
                if (r.ok()) ++n_ok;
                else if (r.filtered) ++n_filtered;
            }
            std::cout << log_prefix_ << "Scored " << reports.size() << " gene sets: "
                << n_ok << " ok, " << n_filtered << " size-filtered, "
                << (reports.size() - n_ok - n_filtered) << " failed\n";
        }
        return reports;
    }

} // namespace kgsea
