#include "core/permutation.hpp"
#include "core/running_sum.hpp"
#include "common/errors.hpp"

#include <omp.h>
#include <algorithm>
#include <exception>

namespace kgsea {

    namespace {
        // Per-slot outcome, resolved after the parallel loop.
        enum SlotStatus : uint8_t { kOk = 0, kDegenerate = 1, kCancelled = 2, kFailed = 3 };
    }

    PermutationEngine::PermutationEngine(const RankedList& ranked,
        const PermutationParams& params,
        const RandomSourceFactory& rng_factory,
        const CancellationToken* cancel)
        : ranked_(ranked), params_(params), rng_factory_(rng_factory), cancel_(cancel) {
        if (params_.n_permutations < 1) {
            throw PermutationCountInvalid("n_permutations must be >= 1; got "
                + std::to_string(params_.n_permutations));
        }
        if (params_.max_resample_retries < 0) params_.max_resample_retries = 0;
    }

    bool PermutationEngine::draw_one(uint64_t b, int64_t hit_count,
        std::vector<uint8_t>& mark,
        std::vector<int32_t>& picks,
        double& es_out) const {
        const int64_t N = ranked_.size();
        const auto& scores = ranked_.scores();
        auto src = rng_factory_.create(params_.seed, b);

        for (int attempt = 0; attempt <= params_.max_resample_retries; ++attempt) {
            // Floyd: k distinct values from [0, N) with exactly k draws.
            picks.clear();
            for (int64_t j = N - hit_count; j < N; ++j) {
                int64_t t = static_cast<int64_t>(src->uniform_below(static_cast<uint64_t>(j) + 1));
                if (mark[(size_t)t]) t = j;
                mark[(size_t)t] = 1;
                picks.push_back(static_cast<int32_t>(t));
            }
            for (int32_t t : picks) mark[(size_t)t] = 0;
            std::sort(picks.begin(), picks.end());

            try {
                es_out = running_sum_sparse(scores, picks, N, params_.weight_exponent).es;
                return true;
            }
            catch (const DegenerateWeight&) {
                // all sampled hits weigh 0; redraw from the same stream
            }
        }
        return false;
    }

    NullDistribution PermutationEngine::run(const std::string& gene_set_id, int64_t hit_count) const {
        const int64_t N = ranked_.size();
        if (hit_count <= 0 || hit_count >= N) {
            throw InsufficientOverlap("gene set '" + gene_set_id + "': cannot permute hit_count="
                + std::to_string(hit_count) + " over N=" + std::to_string(N));
        }

        const int64_t B = params_.n_permutations;
        const int n_threads = params_.n_threads > 0 ? params_.n_threads : omp_get_max_threads();

        NullDistribution esnull((size_t)B, 0.0);
        std::vector<uint8_t> status((size_t)B, kOk);
        std::vector<std::string> failure((size_t)B);

#pragma omp parallel num_threads(n_threads)
        {
            std::vector<uint8_t> mark((size_t)N, 0);
            std::vector<int32_t> picks;
            picks.reserve((size_t)hit_count);

#pragma omp for schedule(static)
            for (int64_t b = 0; b < B; ++b) {
                if (cancel_ && cancel_->cancelled()) {
                    status[(size_t)b] = kCancelled;
                    continue;
                }
                try {
                    double es = 0.0;
                    if (draw_one(static_cast<uint64_t>(b), hit_count, mark, picks, es)) {
                        esnull[(size_t)b] = es;
                    }
                    else {
                        status[(size_t)b] = kDegenerate;
                    }
                }
                catch (const std::exception& e) {
                    status[(size_t)b] = kFailed;
                    failure[(size_t)b] = e.what();
                    std::fill(mark.begin(), mark.end(), (uint8_t)0);
                }
            }
        }

        // Reduction barrier passed: resolve slot outcomes in index order.
        if (cancel_ && cancel_->cancelled()) {
            throw RunCancelled("gene set '" + gene_set_id + "': permutation run cancelled, null discarded");
        }
        for (int64_t b = 0; b < B; ++b) {
            switch (status[(size_t)b]) {
            case kOk:
                break;
            case kDegenerate:
                throw DegenerateNull("gene set '" + gene_set_id + "': permutation " + std::to_string(b)
                    + " drew zero total hit weight in " + std::to_string(params_.max_resample_retries + 1)
                    + " attempts (hit_count=" + std::to_string(hit_count) + ")");
            case kCancelled:
                throw RunCancelled("gene set '" + gene_set_id + "': permutation run cancelled, null discarded");
            default:
                throw std::runtime_error("gene set '" + gene_set_id + "': permutation "
                    + std::to_string(b) + " failed: " + failure[(size_t)b]);
            }
        }
        return esnull;
    }

} // namespace kgsea
