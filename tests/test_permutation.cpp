#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>
#include "common/errors.hpp"
#include "core/permutation.hpp"
#include "core/random_source.hpp"
#include "test_util.hpp"

using namespace kgsea;
using namespace kgsea::testing;

namespace {

    // Replays a fixed sequence for every permutation (value % range).
    class ScriptedSource : public RandomSource {
    public:
        explicit ScriptedSource(std::vector<uint64_t> seq) : seq_(std::move(seq)) {}
        uint64_t uniform_below(uint64_t n) override {
            uint64_t v = seq_[pos_ % seq_.size()];
            ++pos_;
            return v % n;
        }
    private:
        std::vector<uint64_t> seq_;
        size_t pos_ = 0;
    };

    class ScriptedFactory : public RandomSourceFactory {
    public:
        explicit ScriptedFactory(std::vector<uint64_t> seq) : seq_(std::move(seq)) {}
        std::unique_ptr<RandomSource> create(uint64_t, uint64_t) const override {
            return std::make_unique<ScriptedSource>(seq_);
        }
    private:
        std::vector<uint64_t> seq_;
    };

    PermutationParams params(int B, uint64_t seed, int threads) {
        PermutationParams P;
        P.n_permutations = B;
        P.seed = seed;
        P.n_threads = threads;
        return P;
    }

} // namespace

TEST(Permutation, SameSeedSameNull) {
    RankedList r(linear_scores(400));
    Mt19937SourceFactory f;
    PermutationEngine a(r, params(500, 2024, 1), f);
    PermutationEngine b(r, params(500, 2024, 1), f);

    NullDistribution n1 = a.run("S", 25);
    NullDistribution n2 = b.run("S", 25);
    ASSERT_EQ(n1.size(), 500u);
    EXPECT_EQ(n1, n2);
    for (double v : n1) EXPECT_TRUE(std::isfinite(v));
}

TEST(Permutation, IndependentOfThreadCount) {
    RankedList r(linear_scores(400));
    Mt19937SourceFactory f;
    NullDistribution ref = PermutationEngine(r, params(300, 99, 1), f).run("S", 40);
    for (int threads : { 2, 3, 8 }) {
        NullDistribution other = PermutationEngine(r, params(300, 99, threads), f).run("S", 40);
        EXPECT_EQ(ref, other) << threads << " threads";
    }
}

TEST(Permutation, PrefixStableWhenBGrows) {
    // Slot b depends only on (seed, b).
    RankedList r(linear_scores(200));
    Mt19937SourceFactory f;
    NullDistribution small = PermutationEngine(r, params(50, 5, 2), f).run("S", 10);
    NullDistribution large = PermutationEngine(r, params(120, 5, 4), f).run("S", 10);
    ASSERT_EQ(large.size(), 120u);
    for (size_t b = 0; b < small.size(); ++b) EXPECT_EQ(small[b], large[b]) << "slot " << b;
}

TEST(Permutation, NeighbouringSeedsGiveDifferentNulls) {
    // Compared as sorted multisets: a relabelling of slots must not pass.
    RankedList r(linear_scores(400));
    Mt19937SourceFactory f;
    for (uint64_t s : { 1ULL, 42ULL }) {
        NullDistribution a = PermutationEngine(r, params(1000, s, 2), f).run("S", 25);
        NullDistribution b = PermutationEngine(r, params(1000, s + 1, 2), f).run("S", 25);
        std::sort(a.begin(), a.end());
        std::sort(b.begin(), b.end());
        EXPECT_NE(a, b) << "seeds " << s << " and " << (s + 1);
    }
}

TEST(Permutation, NullHasBothSigns) {
    RankedList r(linear_scores(300));
    Mt19937SourceFactory f;
    NullDistribution n = PermutationEngine(r, params(1000, 42, 0), f).run("S", 15);
    size_t pos = 0, neg = 0;
    for (double v : n) {
        if (v > 0) ++pos;
        else if (v < 0) ++neg;
    }
    EXPECT_GT(pos, 100u);
    EXPECT_GT(neg, 100u);
}

TEST(Permutation, InvalidCountRejected) {
    RankedList r = ten_gene_list();
    Mt19937SourceFactory f;
    EXPECT_THROW(PermutationEngine(r, params(0, 1, 1), f), PermutationCountInvalid);
    EXPECT_THROW(PermutationEngine(r, params(-5, 1, 1), f), PermutationCountInvalid);
    // Also a ConfigError for callers that only handle the base class.
    EXPECT_THROW(PermutationEngine(r, params(0, 1, 1), f), ConfigError);
}

TEST(Permutation, HitCountOutOfRange) {
    RankedList r = ten_gene_list();
    Mt19937SourceFactory f;
    PermutationEngine e(r, params(10, 1, 1), f);
    EXPECT_THROW(e.run("S", 0), InsufficientOverlap);
    EXPECT_THROW(e.run("S", 10), InsufficientOverlap);
    EXPECT_NO_THROW(e.run("S", 9));
}

TEST(Permutation, DegenerateDrawIsRedrawn) {
    // Only G1 has a non-zero score; a single-hit draw landing elsewhere has zero weight.
    RankedList r(named_scores({ 5, 0, 0, 0, 0, 0, 0, 0, 0, 0 }));
    ScriptedFactory f({ 3, 0 });   // first draw: rank 4 (zero), redraw: rank 1

    PermutationParams P = params(4, 0, 1);
    P.max_resample_retries = 1;
    NullDistribution n = PermutationEngine(r, P, f).run("S", 1);
    for (double v : n) EXPECT_DOUBLE_EQ(v, 1.0);

    P.max_resample_retries = 0;
    EXPECT_THROW(PermutationEngine(r, P, f).run("S", 1), DegenerateNull);
}

TEST(Permutation, CancelledRunPublishesNothing) {
    RankedList r(linear_scores(100));
    Mt19937SourceFactory f;
    CancellationToken token;
    token.cancel();
    PermutationEngine e(r, params(100, 1, 2), f, &token);
    EXPECT_THROW(e.run("S", 10), RunCancelled);
}

TEST(RandomSource, StreamSeedsAreDistinct) {
    std::set<uint64_t> seeds;
    for (uint64_t b = 0; b < 5000; ++b) seeds.insert(derive_stream_seed(42, b));
    EXPECT_EQ(seeds.size(), 5000u);
}

TEST(RandomSource, SeedsDoNotShareStreams) {
    EXPECT_NE(derive_stream_seed(1, 0), derive_stream_seed(0, 1));
    // No stream of seed s reappears under seeds s+1 .. s+3.
    std::set<uint64_t> seeds;
    for (uint64_t s = 40; s < 44; ++s) {
        for (uint64_t b = 0; b < 2000; ++b) seeds.insert(derive_stream_seed(s, b));
    }
    EXPECT_EQ(seeds.size(), 4u * 2000u);
}

TEST(RandomSource, UniformBelowStaysInRange) {
    Mt19937Source s(7);
    for (int i = 0; i < 1000; ++i) EXPECT_LT(s.uniform_below(13), 13u);
    EXPECT_EQ(s.uniform_below(1), 0u);
    EXPECT_THROW(s.uniform_below(0), std::invalid_argument);
}
