#pragma once
#include <cstdint>
#include <vector>
#include "common/types.hpp"

namespace kgsea {

    // Sign-split means of a null distribution. mean_neg is a magnitude (> 0).
    // Values that are exactly 0 belong to neither side.
    struct NullSummary {
        double  mean_pos = 0.0;
        double  mean_neg = 0.0;
        int64_t n_pos = 0;
        int64_t n_neg = 0;
    };

    NullSummary summarize_null(const NullDistribution& esnull);

    // Per-gene-set normalization, before the batch FDR step.
    struct GeneSetNormalization {
        double nes = 0.0;
        double p_value = 1.0;
        std::vector<double> nes_null;   // every null ES scaled by the mean of its own sign
    };

    // NES = ES / mean_pos (ES > 0) or ES / mean_neg (ES < 0, stays negative).
    // p = share of same-signed NESnull values with |v| >= |NES|.
    // Throws DegenerateNull for ES == 0 or when the null has no value of the
    // sign of ES.
    GeneSetNormalization normalize_gene_set(const EnrichmentResult& E, const NullDistribution& esnull);

    // Batch FDR over all successfully normalized gene sets.
    //
    // For NES of sign s:
    //   q = (share of pooled NESnull of sign s with |v| >= |NES|)
    //     / (share of observed NES of sign s with |v| >= |NES|)
    // then, per sign, a running minimum from the smallest |NES| upwards makes
    // q non-decreasing along decreasing |NES|, and q is clipped to [0, 1].
    // Returns one q per entry of batch, same order.
    std::vector<double> compute_fdr(const std::vector<GeneSetNormalization>& batch);

} // namespace kgsea
