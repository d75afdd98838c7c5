#pragma once
#include <cmath>
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "core/ranked_list.hpp"
#include "core/tag_indicator.hpp"

namespace kgsea {

    struct EsPeak {
        double  es = 0.0;
        int64_t peak_position = 0;   // 1-based rank where |RES| is largest (earliest on ties)
    };

    // weight_i = |score_i|^p, and 1 for every hit when p == 0.
    inline double hit_weight(double score, double p) {
        if (p == 0.0) return 1.0;
        if (p == 1.0) return std::fabs(score);
        return std::pow(std::fabs(score), p);
    }

    // Sum of hit weights accumulated in rank order (hit_positions ascending).
    // Throws DegenerateWeight when the sum is 0.
    double hit_weight_sum(const std::vector<double>& scores,
        const std::vector<int32_t>& hit_positions,
        double p);

    // Running-sum statistic over all N ranks.
    //
    // RES(i) = P_hit(i) - P_miss(i), where P_hit is the hit weight seen so far
    // over the total hit weight and P_miss the misses seen so far over
    // miss_count. Evaluating the two fractions directly (instead of
    // accumulating +w/sum and -1/miss_count) keeps the last value at exactly
    // 0. If trace is non-null it receives the N RES values.
    EsPeak running_sum_trace(const std::vector<double>& scores,
        const TagIndicator& T,
        double p,
        std::vector<double>* trace = nullptr);

    // Same statistic from the sorted hit positions only, O(hit_count).
    // Inside a run of misses RES is monotone, so the extremum is either right
    // after a hit or right before the next one; those are the only points
    // evaluated. Results match running_sum_trace bit for bit.
    EsPeak running_sum_sparse(const std::vector<double>& scores,
        const std::vector<int32_t>& hit_positions,
        int64_t N,
        double p);

    // Observed enrichment for one gene set: ES, sign, peak and leading edge.
    EnrichmentResult compute_enrichment(const RankedList& ranked,
        const GeneSet& gene_set,
        const TagIndicator& T,
        double p,
        std::vector<double>* trace = nullptr);

} // namespace kgsea
