#include "core/running_sum.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace kgsea {

    double hit_weight_sum(const std::vector<double>& scores,
        const std::vector<int32_t>& hit_positions,
        double p) {
        double sum = 0.0;
        for (int32_t pos : hit_positions) sum += hit_weight(scores[(size_t)pos], p);
        if (!(sum > 0.0) || !std::isfinite(sum)) {
            throw DegenerateWeight("sum_hit_scores=" + std::to_string(sum)
                + " over hit_count=" + std::to_string(hit_positions.size())
                + " (weight_exponent=" + std::to_string(p) + ")");
        }
        return sum;
    }

    // Extremum update shared by both walks: strict '>' keeps the earliest rank.
    static inline void consider(double res, int64_t rank1, EsPeak& best) {
        if (std::fabs(res) > std::fabs(best.es)) {
            best.es = res;
            best.peak_position = rank1;
        }
    }

    EsPeak running_sum_trace(const std::vector<double>& scores,
        const TagIndicator& T,
        double p,
        std::vector<double>* trace) {
        const int64_t N = static_cast<int64_t>(T.tag.size());
        const double sum_w = hit_weight_sum(scores, T.hit_positions, p);
        const double n_miss = static_cast<double>(T.miss_count);

        if (trace) trace->assign((size_t)N, 0.0);

        EsPeak best;
        double  cum_w = 0.0;
        int64_t misses = 0;
        for (int64_t i = 0; i < N; ++i) {
            if (T.tag[(size_t)i]) cum_w += hit_weight(scores[(size_t)i], p);
            else                  ++misses;

            const double res = cum_w / sum_w - static_cast<double>(misses) / n_miss;
            if (trace) (*trace)[(size_t)i] = res;
            consider(res, i + 1, best);
        }
        return best;
    }

    EsPeak running_sum_sparse(const std::vector<double>& scores,
        const std::vector<int32_t>& hit_positions,
        int64_t N,
        double p) {
        const int64_t k = static_cast<int64_t>(hit_positions.size());
        const double sum_w = hit_weight_sum(scores, hit_positions, p);
        const double n_miss = static_cast<double>(N - k);

        EsPeak best;
        double cum_w = 0.0;
        for (int64_t h = 0; h < k; ++h) {
            const int64_t pos = hit_positions[(size_t)h];
            const int64_t misses = pos - h;   // misses strictly before this hit

            // Bottom of the miss run ending at pos-1.
            if (pos > 0) {
                const double res = cum_w / sum_w - static_cast<double>(misses) / n_miss;
                consider(res, pos, best);
            }

            cum_w += hit_weight(scores[(size_t)pos], p);
            const double res = cum_w / sum_w - static_cast<double>(misses) / n_miss;
            consider(res, pos + 1, best);
        }
        return best;
    }

    EnrichmentResult compute_enrichment(const RankedList& ranked,
        const GeneSet& gene_set,
        const TagIndicator& T,
        double p,
        std::vector<double>* trace) {
        EsPeak ep;
        try {
            ep = running_sum_trace(ranked.scores(), T, p, trace);
        }
        catch (const DegenerateWeight& e) {
            throw DegenerateWeight("gene set '" + gene_set.id + "': " + e.detail());
        }

        EnrichmentResult E;
        E.gene_set_id = gene_set.id;
        E.es = ep.es;
        E.sign = (ep.es < 0.0) ? EnrichmentSign::Negative : EnrichmentSign::Positive;
        E.peak_position = ep.peak_position;
        E.hit_count = T.hit_count;

        // Leading edge: hits in ranks [1, peak] for a positive ES, [peak, N] otherwise.
        for (int32_t pos : T.hit_positions) {
            const int64_t rank1 = static_cast<int64_t>(pos) + 1;
            const bool in_edge = (E.sign == EnrichmentSign::Positive)
                ? rank1 <= E.peak_position
                : rank1 >= E.peak_position;
            if (in_edge) E.leading_edge.push_back(ranked.gene(pos));
        }
        return E;
    }

} // namespace kgsea
