#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "core/normalization.hpp"

using namespace kgsea;

namespace {

    EnrichmentResult observed(const std::string& id, double es) {
        EnrichmentResult E;
        E.gene_set_id = id;
        E.es = es;
        E.sign = es < 0 ? EnrichmentSign::Negative : EnrichmentSign::Positive;
        E.hit_count = 3;
        return E;
    }

    GeneSetNormalization normalized(double nes, std::vector<double> nes_null) {
        GeneSetNormalization G;
        G.nes = nes;
        G.nes_null = std::move(nes_null);
        return G;
    }

} // namespace

TEST(Normalization, SummarySplitsBySign) {
    NullSummary S = summarize_null({ 0.5, -0.2, 0.3, -0.4, 0.0 });
    EXPECT_DOUBLE_EQ(S.mean_pos, 0.4);
    EXPECT_DOUBLE_EQ(S.mean_neg, 0.3);
    EXPECT_EQ(S.n_pos, 2);
    EXPECT_EQ(S.n_neg, 2);
}

TEST(Normalization, PositiveEnrichment) {
    NullDistribution esnull = { 0.2, 0.4, 0.6, 0.8, -0.5, -0.3 };
    GeneSetNormalization G = normalize_gene_set(observed("S", 0.6), esnull);
    EXPECT_NEAR(G.nes, 1.2, 1e-12);
    EXPECT_DOUBLE_EQ(G.p_value, 0.5);
    ASSERT_EQ(G.nes_null.size(), esnull.size());
    EXPECT_NEAR(G.nes_null[4], -1.25, 1e-12);
}

TEST(Normalization, NegativeEnrichmentKeepsSign) {
    NullDistribution esnull = { 0.2, 0.4, 0.6, 0.8, -0.5, -0.3 };
    GeneSetNormalization G = normalize_gene_set(observed("S", -0.45), esnull);
    EXPECT_NEAR(G.nes, -1.125, 1e-12);
    EXPECT_DOUBLE_EQ(G.p_value, 0.5);
}

TEST(Normalization, PValueCountsTiesAsExtreme) {
    GeneSetNormalization G = normalize_gene_set(observed("S", 1.0), { 1.0, 1.0, -1.0 });
    EXPECT_DOUBLE_EQ(G.nes, 1.0);
    EXPECT_DOUBLE_EQ(G.p_value, 1.0);
}

TEST(Normalization, DegenerateCases) {
    EXPECT_THROW(normalize_gene_set(observed("S", 0.0), { 0.1, -0.1 }), DegenerateNull);
    EXPECT_THROW(normalize_gene_set(observed("S", 0.5), { -0.1, -0.2, 0.0 }), DegenerateNull);
    EXPECT_THROW(normalize_gene_set(observed("S", -0.5), { 0.1, 0.2 }), DegenerateNull);
}

TEST(Fdr, StepUpOverPositiveSets) {
    const std::vector<double> null = { 0.5, 1.0, 1.2, 1.6, -1.0 };
    std::vector<GeneSetNormalization> batch = {
        normalized(2.0, null), normalized(1.5, null), normalized(1.0, null)
    };
    std::vector<double> q = compute_fdr(batch);
    ASSERT_EQ(q.size(), 3u);
    EXPECT_DOUBLE_EQ(q[0], 0.0);
    EXPECT_DOUBLE_EQ(q[1], 0.375);
    EXPECT_DOUBLE_EQ(q[2], 0.75);
}

TEST(Fdr, RunningMinimumKeepsOrder) {
    // Raw q for 1.9 is 0.375, above the 0.25 of the weaker set.
    const std::vector<double> null = { 2.5, 0.5, 0.5, 0.5 };
    std::vector<GeneSetNormalization> batch = {
        normalized(2.0, null), normalized(1.9, null), normalized(1.0, null)
    };
    std::vector<double> q = compute_fdr(batch);
    for (double v : q) EXPECT_DOUBLE_EQ(v, 0.25);
}

TEST(Fdr, ClippedToOne) {
    const std::vector<double> null = { 4.0, 4.0, 4.0, 0.1 };
    std::vector<double> q = compute_fdr({ normalized(3.0, null), normalized(0.5, null) });
    EXPECT_DOUBLE_EQ(q[0], 0.75);
    EXPECT_DOUBLE_EQ(q[1], 0.75);
    for (double v : q) {
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
    }
}

TEST(Fdr, SignsArePooledSeparately) {
    std::vector<GeneSetNormalization> batch = {
        normalized(2.0, { 0.5, 1.0, 1.2, 1.6, -1.0 }),
        normalized(-1.0, { -2.0, -0.5, 1.0 })
    };
    std::vector<double> q = compute_fdr(batch);
    EXPECT_DOUBLE_EQ(q[0], 0.0);
    EXPECT_NEAR(q[1], 2.0 / 3.0, 1e-12);
}

TEST(Fdr, EmptyBatch) {
    EXPECT_TRUE(compute_fdr({}).empty());
}
