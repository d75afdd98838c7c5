#pragma once
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "core/ranked_list.hpp"

namespace kgsea {

    // Hit/miss mask of one gene set over a ranked list.
    struct TagIndicator {
        std::vector<uint8_t> tag;            // length N, 1 = gene at this rank is in the set
        std::vector<int32_t> hit_positions;  // 0-based ranks of the hits, ascending
        int64_t hit_count = 0;
        int64_t miss_count = 0;
    };

    // Intersect gene_set with the ranking. Members missing from the ranking
    // are ignored, repeated members count once.
    // Throws InputError for an empty gene set and InsufficientOverlap when
    // the overlap is 0 or covers the whole ranking.
    TagIndicator build_tag_indicator(const RankedList& ranked, const GeneSet& gene_set);

} // namespace kgsea
