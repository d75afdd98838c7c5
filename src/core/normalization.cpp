#include "core/normalization.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace kgsea {

    NullSummary summarize_null(const NullDistribution& esnull) {
        NullSummary S;
        double sum_pos = 0.0, sum_neg = 0.0;
        for (double v : esnull) {
            if (v > 0.0)      { sum_pos += v;  ++S.n_pos; }
            else if (v < 0.0) { sum_neg += -v; ++S.n_neg; }
        }
        if (S.n_pos > 0) S.mean_pos = sum_pos / (double)S.n_pos;
        if (S.n_neg > 0) S.mean_neg = sum_neg / (double)S.n_neg;
        return S;
    }

    static inline double normalize_value(double v, const NullSummary& S) {
        if (v > 0.0) return v / S.mean_pos;
        if (v < 0.0) return v / S.mean_neg;
        return 0.0;
    }

    GeneSetNormalization normalize_gene_set(const EnrichmentResult& E, const NullDistribution& esnull) {
        const NullSummary S = summarize_null(esnull);
        const std::string ctx = "gene set '" + E.gene_set_id + "' (ES=" + std::to_string(E.es)
            + ", hit_count=" + std::to_string(E.hit_count)
            + ", null: " + std::to_string(S.n_pos) + " positive / " + std::to_string(S.n_neg) + " negative)";

        if (E.es == 0.0) throw DegenerateNull(ctx + ": NES undefined for ES == 0");
        const bool positive = E.es > 0.0;
        if (positive && S.n_pos == 0) throw DegenerateNull(ctx + ": no positive null ES drawn");
        if (!positive && S.n_neg == 0) throw DegenerateNull(ctx + ": no negative null ES drawn");

        GeneSetNormalization G;
        G.nes = normalize_value(E.es, S);

        G.nes_null.resize(esnull.size());
        for (size_t b = 0; b < esnull.size(); ++b) G.nes_null[b] = normalize_value(esnull[b], S);

        const double mag = std::fabs(G.nes);
        int64_t n_same = 0, n_extreme = 0;
        for (double v : G.nes_null) {
            if (positive ? (v > 0.0) : (v < 0.0)) {
                ++n_same;
                if (std::fabs(v) >= mag) ++n_extreme;
            }
        }
        G.p_value = (double)n_extreme / (double)n_same;
        return G;
    }

    // Number of entries >= x in an ascending vector.
    static inline int64_t count_ge(const std::vector<double>& asc, double x) {
        return (int64_t)(asc.end() - std::lower_bound(asc.begin(), asc.end(), x));
    }

    std::vector<double> compute_fdr(const std::vector<GeneSetNormalization>& batch) {
        const size_t n = batch.size();
        std::vector<double> q(n, 1.0);
        if (n == 0) return q;

        // Pooled null and observed magnitudes, split by sign, ascending.
        std::vector<double> null_pos, null_neg, obs_pos, obs_neg;
        for (const auto& G : batch) {
            for (double v : G.nes_null) {
                if (v > 0.0)      null_pos.push_back(v);
                else if (v < 0.0) null_neg.push_back(-v);
            }
            if (G.nes > 0.0)      obs_pos.push_back(G.nes);
            else if (G.nes < 0.0) obs_neg.push_back(-G.nes);
        }
        std::sort(null_pos.begin(), null_pos.end());
        std::sort(null_neg.begin(), null_neg.end());
        std::sort(obs_pos.begin(), obs_pos.end());
        std::sort(obs_neg.begin(), obs_neg.end());

        for (size_t i = 0; i < n; ++i) {
            const double nes = batch[i].nes;
            if (nes == 0.0) continue;
            const bool pos = nes > 0.0;
            const auto& pool = pos ? null_pos : null_neg;
            const auto& obs = pos ? obs_pos : obs_neg;
            const double mag = std::fabs(nes);
            if (pool.empty()) continue;   // q stays 1

            const double frac_null = (double)count_ge(pool, mag) / (double)pool.size();
            const double frac_obs = (double)count_ge(obs, mag) / (double)obs.size();  // >= 1/|obs|, itself included
            q[i] = frac_null / frac_obs;
        }

        // Step-down per sign: walk from the smallest |NES| upwards keeping the running min.
        for (int sgn : { 1, -1 }) {
            std::vector<size_t> idx;
            for (size_t i = 0; i < n; ++i) {
                if ((sgn > 0 && batch[i].nes > 0.0) || (sgn < 0 && batch[i].nes < 0.0)) idx.push_back(i);
            }
            std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
                return std::fabs(batch[a].nes) < std::fabs(batch[b].nes);
                });
            double running = 1.0;
            for (size_t i : idx) {
                running = std::min(running, std::min(1.0, std::max(0.0, q[i])));
                q[i] = running;
            }
        }
        return q;
    }

} // namespace kgsea
