#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "core/random_source.hpp"
#include "core/ranked_list.hpp"

namespace kgsea {

    struct PermutationParams {
        int      n_permutations = 1000;   // B
        uint64_t seed = 42;
        double   weight_exponent = 1.0;
        int      max_resample_retries = 10;
        int      n_threads = 0;           // 0 = OpenMP default
    };

    // Set from any thread to abort a run; permutation workers poll it.
    class CancellationToken {
    public:
        void cancel() { flag_.store(true, std::memory_order_relaxed); }
        bool cancelled() const { return flag_.load(std::memory_order_relaxed); }

    private:
        std::atomic<bool> flag_{ false };
    };

    // Null distribution of ES for a gene set of a given overlap size.
    //
    // Permutation b draws hit_count distinct ranks uniformly (Floyd's
    // sampling) from its own RandomSource created for (seed, b), scores them
    // with running_sum_sparse and writes the signed ES to slot b. Slots are
    // independent, so the output is identical for any thread count.
    // A draw whose hit weights sum to 0 is redrawn from the same stream at
    // most max_resample_retries times before DegenerateNull is thrown.
    class PermutationEngine {
    public:
        // Throws PermutationCountInvalid when params.n_permutations < 1.
        PermutationEngine(const RankedList& ranked,
            const PermutationParams& params,
            const RandomSourceFactory& rng_factory,
            const CancellationToken* cancel = nullptr);

        // Throws InsufficientOverlap for hit_count outside (0, N),
        // DegenerateNull when a permutation stays degenerate and RunCancelled
        // if the token fired; no partial distribution is returned in any of
        // these cases.
        NullDistribution run(const std::string& gene_set_id, int64_t hit_count) const;

        const PermutationParams& params() const { return params_; }

    private:
        const RankedList& ranked_;
        PermutationParams params_;
        const RandomSourceFactory& rng_factory_;
        const CancellationToken* cancel_;

        // One permutation. mark (size N, all zero) and picks are per-thread scratch.
        bool draw_one(uint64_t b, int64_t hit_count,
            std::vector<uint8_t>& mark,
            std::vector<int32_t>& picks,
            double& es_out) const;
    };

} // namespace kgsea
