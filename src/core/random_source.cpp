#include "core/random_source.hpp"

#include <stdexcept>

namespace kgsea {

    uint64_t splitmix64(uint64_t x) {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

    uint64_t derive_stream_seed(uint64_t base_seed, uint64_t index) {
        return splitmix64(splitmix64(base_seed) + index);
    }

    uint64_t Mt19937Source::uniform_below(uint64_t n_exclusive) {
        if (n_exclusive == 0) throw std::invalid_argument("uniform_below: empty range");
        std::uniform_int_distribution<uint64_t> dist(0, n_exclusive - 1);
        return dist(rng_);
    }

    std::unique_ptr<RandomSource> Mt19937SourceFactory::create(uint64_t base_seed, uint64_t index) const {
        return std::make_unique<Mt19937Source>(derive_stream_seed(base_seed, index));
    }

} // namespace kgsea
