#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <map>
#include "pipeline/enrichment_pipeline.hpp"
#include "test_util.hpp"

using namespace kgsea;
using namespace kgsea::testing;

namespace {

    GseaConfig small_config() {
        GseaConfig cfg;
        cfg.n_permutations = 200;
        cfg.seed = 7;
        cfg.n_threads = 2;
        cfg.verbose = false;
        return cfg;
    }

    std::vector<GeneSet> standard_sets() {
        return {
            make_set("TOP", gene_range(1, 15)),
            make_set("BOTTOM", gene_range(186, 200)),
            make_set("MIXED", gene_range(1, 200, 13)),
            make_set("NO_OVERLAP", { "X1", "X2" }),
            make_set("EMPTY", {}),
            make_set("ALL", gene_range(1, 200)),
        };
    }

    std::map<std::string, GeneSetReport> by_id(const std::vector<GeneSetReport>& reports) {
        std::map<std::string, GeneSetReport> m;
        for (const auto& r : reports) m[r.gene_set_id] = r;
        return m;
    }

    std::vector<GeneScore> scaled(std::vector<GeneScore> v, double f) {
        for (auto& g : v) g.second *= f;
        return v;
    }

} // namespace

TEST(Pipeline, StatusPerGeneSet) {
    RankedList r(linear_scores(200));
    EnrichmentPipeline pipe(r, small_config());
    auto reports = pipe.run(standard_sets());
    ASSERT_EQ(reports.size(), 6u);
    EXPECT_EQ(reports[0].gene_set_id, "TOP");   // input order kept

    auto m = by_id(reports);
    for (const char* id : { "TOP", "BOTTOM", "MIXED" }) {
        EXPECT_TRUE(m[id].ok()) << id << ": " << m[id].message;
        ASSERT_TRUE(m[id].normalized.has_value()) << id;
        EXPECT_GE(m[id].normalized->fdr_q, 0.0);
        EXPECT_LE(m[id].normalized->fdr_q, 1.0);
    }
    EXPECT_EQ(m["NO_OVERLAP"].error, ErrorKind::InsufficientOverlap);
    EXPECT_EQ(m["EMPTY"].error, ErrorKind::InputError);
    EXPECT_EQ(m["ALL"].error, ErrorKind::InsufficientOverlap);
    EXPECT_FALSE(m["ALL"].normalized.has_value());
    EXPECT_NE(m["NO_OVERLAP"].message.find("NO_OVERLAP"), std::string::npos);
}

TEST(Pipeline, ExtremeSetsAreSignificant) {
    RankedList r(linear_scores(200));
    auto m = by_id(EnrichmentPipeline(r, small_config()).run(standard_sets()));

    const auto& top = m["TOP"];
    EXPECT_DOUBLE_EQ(top.enrichment->es, 1.0);
    EXPECT_EQ(top.enrichment->peak_position, 15);
    EXPECT_EQ(top.enrichment->leading_edge.size(), 15u);
    EXPECT_GT(top.normalized->nes, 1.0);
    EXPECT_LE(top.normalized->p_value, 0.05);

    const auto& bottom = m["BOTTOM"];
    EXPECT_DOUBLE_EQ(bottom.enrichment->es, -1.0);
    EXPECT_EQ(bottom.enrichment->sign, EnrichmentSign::Negative);
    EXPECT_EQ(bottom.enrichment->peak_position, 185);
    EXPECT_LT(bottom.normalized->nes, -1.0);
    EXPECT_LE(bottom.normalized->p_value, 0.05);
}

TEST(Pipeline, FailedSetsDoNotEnterFdrPool) {
    RankedList r(linear_scores(200));
    EnrichmentPipeline pipe(r, small_config());
    auto full = by_id(pipe.run(standard_sets()));
    auto clean = by_id(pipe.run({
        make_set("TOP", gene_range(1, 15)),
        make_set("BOTTOM", gene_range(186, 200)),
        make_set("MIXED", gene_range(1, 200, 13)),
    }));
    for (const char* id : { "TOP", "BOTTOM", "MIXED" }) {
        EXPECT_EQ(full[id].normalized->fdr_q, clean[id].normalized->fdr_q) << id;
        EXPECT_EQ(full[id].normalized->nes, clean[id].normalized->nes) << id;
    }
}

TEST(Pipeline, SizeFilter) {
    RankedList r(linear_scores(200));
    GseaConfig cfg = small_config();
    cfg.min_size = 16;
    cfg.max_size = 20;
    auto m = by_id(EnrichmentPipeline(r, cfg).run(standard_sets()));

    EXPECT_TRUE(m["TOP"].filtered);                       // 15 hits
    EXPECT_FALSE(m["TOP"].enrichment.has_value());
    EXPECT_TRUE(m["MIXED"].ok()) << m["MIXED"].message;    // 16 hits
    // Overlap errors are reported as errors, not as filtered.
    EXPECT_FALSE(m["ALL"].filtered);
    EXPECT_EQ(m["ALL"].error, ErrorKind::InsufficientOverlap);
}

TEST(Pipeline, ReproducibleAcrossThreadCounts) {
    RankedList r(linear_scores(200));
    GseaConfig one = small_config();
    one.n_threads = 1;
    GseaConfig many = small_config();
    many.n_threads = 4;

    auto a = EnrichmentPipeline(r, one).run(standard_sets());
    auto b = EnrichmentPipeline(r, many).run(standard_sets());
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        ASSERT_EQ(a[i].normalized.has_value(), b[i].normalized.has_value());
        if (!a[i].normalized) continue;
        EXPECT_EQ(a[i].normalized->nes, b[i].normalized->nes);
        EXPECT_EQ(a[i].normalized->p_value, b[i].normalized->p_value);
        EXPECT_EQ(a[i].normalized->fdr_q, b[i].normalized->fdr_q);
    }
}

TEST(Pipeline, FdrFollowsNesOrderWithinSign) {
    RankedList r(linear_scores(200));
    std::vector<GeneSet> sets;
    for (int j = 0; j < 12; ++j) {
        sets.push_back(make_set("S" + std::to_string(j), gene_range(1 + j * 3, 200, 5 + j)));
    }
    sets.push_back(make_set("TOP", gene_range(1, 15)));
    sets.push_back(make_set("BOTTOM", gene_range(186, 200)));

    auto reports = EnrichmentPipeline(r, small_config()).run(sets);
    for (int sgn : { 1, -1 }) {
        std::vector<std::pair<double, double>> v;   // (|NES|, q)
        for (const auto& rep : reports) {
            if (!rep.ok()) continue;
            const double nes = rep.normalized->nes;
            if ((sgn > 0) == (nes > 0)) v.emplace_back(std::fabs(nes), rep.normalized->fdr_q);
        }
        std::sort(v.begin(), v.end());
        for (size_t i = 1; i < v.size(); ++i) {
            EXPECT_LE(v[i].second, v[i - 1].second) << "sign " << sgn;
        }
    }
}

TEST(Pipeline, PowerOfTwoScalingIsExact) {
    RankedList r1(linear_scores(200));
    RankedList r4(scaled(linear_scores(200), 4.0));
    auto a = EnrichmentPipeline(r1, small_config()).run(standard_sets());
    auto b = EnrichmentPipeline(r4, small_config()).run(standard_sets());
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a[i].normalized) continue;
        EXPECT_EQ(a[i].enrichment->es, b[i].enrichment->es);
        EXPECT_EQ(a[i].normalized->nes, b[i].normalized->nes);
        EXPECT_EQ(a[i].normalized->p_value, b[i].normalized->p_value);
    }
}

TEST(Pipeline, ScalingKeepsNes) {
    RankedList r1(linear_scores(200));
    RankedList r2(scaled(linear_scores(200), 3.7));
    auto a = by_id(EnrichmentPipeline(r1, small_config()).run(standard_sets()));
    auto b = by_id(EnrichmentPipeline(r2, small_config()).run(standard_sets()));
    for (const char* id : { "TOP", "BOTTOM", "MIXED" }) {
        EXPECT_NEAR(a[id].enrichment->es, b[id].enrichment->es, 1e-9) << id;
        EXPECT_NEAR(a[id].normalized->nes, b[id].normalized->nes, 1e-9) << id;
    }
}

TEST(Pipeline, CancellationStopsTheRun) {
    RankedList r(linear_scores(200));
    CancellationToken token;
    EnrichmentPipeline pipe(r, small_config(), nullptr, &token);
    token.cancel();
    EXPECT_THROW(pipe.run(standard_sets()), RunCancelled);
}

TEST(Pipeline, InvalidConfigRejectedUpFront) {
    RankedList r(linear_scores(50));
    GseaConfig cfg = small_config();
    cfg.n_permutations = 0;
    EXPECT_THROW(EnrichmentPipeline(r, cfg), PermutationCountInvalid);

    cfg = small_config();
    cfg.weight_exponent = -1.0;
    EXPECT_THROW(EnrichmentPipeline(r, cfg), ConfigError);
}
