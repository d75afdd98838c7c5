#include "core/tag_indicator.hpp"
#include "common/errors.hpp"

namespace kgsea {

    TagIndicator build_tag_indicator(const RankedList& ranked, const GeneSet& gene_set) {
        if (gene_set.genes.empty()) {
            throw InputError("gene set '" + gene_set.id + "' is empty");
        }

        const int64_t N = ranked.size();
        TagIndicator T;
        T.tag.assign((size_t)N, 0);

        for (const auto& g : gene_set.genes) {
            int64_t p = ranked.position_of(g);
            if (p < 0) continue;               // outside the gene universe
            if (T.tag[(size_t)p]) continue;    // duplicate member
            T.tag[(size_t)p] = 1;
            ++T.hit_count;
        }

        if (T.hit_count == 0 || T.hit_count == N) {
            throw InsufficientOverlap("gene set '" + gene_set.id + "': hit_count="
                + std::to_string(T.hit_count) + " of N=" + std::to_string(N)
                + " ranked genes (" + std::to_string(gene_set.genes.size()) + " members)");
        }

        T.miss_count = N - T.hit_count;
        T.hit_positions.reserve((size_t)T.hit_count);
        for (int64_t i = 0; i < N; ++i) {
            if (T.tag[(size_t)i]) T.hit_positions.push_back((int32_t)i);
        }
        return T;
    }

} // namespace kgsea
