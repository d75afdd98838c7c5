#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kgsea {

	// One ranked-list entry as supplied by the caller (any order).
	using GeneScore = std::pair<std::string, double>;

	// Named gene collection (a knowledge-graph term, pathway, GO term...).
	struct GeneSet {
		std::string id;
		std::string description;          // optional, GMT column 2
		std::vector<std::string> genes;   // may contain genes absent from the ranking
	};

	enum class EnrichmentSign : int8_t { Negative = -1, Positive = 1 };

	struct EnrichmentResult {
		std::string gene_set_id;
		double  es = 0.0;
		EnrichmentSign sign = EnrichmentSign::Positive;
		int64_t peak_position = 0;       // 1-based rank of the extremum
		int64_t hit_count = 0;
		std::vector<std::string> leading_edge;  // set members between list boundary and peak, rank order
	};

	// Signed ES values of B permutations, slot b = permutation b.
	using NullDistribution = std::vector<double>;

	struct NormalizedResult {
		std::string gene_set_id;
		double nes = 0.0;
		double p_value = 1.0;
		double fdr_q = 1.0;
	};

} // namespace kgsea
