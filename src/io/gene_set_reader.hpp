#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

namespace kgsea {

	// GMT: "name<TAB>description<TAB>gene1<TAB>gene2...", one set per line.
	std::vector<GeneSet> read_gmt(const std::string& path);

	// Compact knowledge-graph JSON:
	//   { "genes": [{"label": ...}], "terms": [{"label": ...}],
	//     "triples": [{"source_label": ..., "relation": ..., "target_label": ...}] }
	// Every term becomes a gene set of the genes it shares a triple with (either
	// direction), genes in triple order without repeats, sets in terms[] order.
	// Terms linked to no gene are dropped. description holds the relation names.
	std::vector<GeneSet> read_kg_gene_sets(const std::string& path);

	// Dispatch on format ("gmt", "kg_json", or "auto" = by file extension).
	std::vector<GeneSet> read_gene_sets(const std::string& path, const std::string& format);

} // namespace kgsea
