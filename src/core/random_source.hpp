#pragma once
#include <cstdint>
#include <memory>
#include <random>

namespace kgsea {

    // Uniform integer stream used by the permutation sampler.
    // One instance serves one permutation and is never shared across threads.
    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        // Uniform integer in [0, n_exclusive). n_exclusive must be > 0.
        virtual uint64_t uniform_below(uint64_t n_exclusive) = 0;
    };

    // Creates the stream for permutation `index` of a run seeded with
    // `base_seed`. Implementations must be deterministic and injective in
    // (base_seed, index) so results do not depend on which worker runs which
    // permutation, or in what order.
    class RandomSourceFactory {
    public:
        virtual ~RandomSourceFactory() = default;
        virtual std::unique_ptr<RandomSource> create(uint64_t base_seed, uint64_t index) const = 0;
    };

    // splitmix64 finalizer (a bijection on 64-bit words).
    uint64_t splitmix64(uint64_t x);

    // Seed of stream `index`: splitmix64(splitmix64(base_seed) + index).
    // Injective in index for a fixed base seed; streams of two base seeds
    // overlap only if their mixed seeds lie within B of each other.
    uint64_t derive_stream_seed(uint64_t base_seed, uint64_t index);

    // std::mt19937_64 backed stream.
    class Mt19937Source : public RandomSource {
    public:
        explicit Mt19937Source(uint64_t seed) : rng_(seed) {}
        uint64_t uniform_below(uint64_t n_exclusive) override;

    private:
        std::mt19937_64 rng_;
    };

    class Mt19937SourceFactory : public RandomSourceFactory {
    public:
        std::unique_ptr<RandomSource> create(uint64_t base_seed, uint64_t index) const override;
    };

} // namespace kgsea
