#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

namespace kgsea {

	// Read a pre-ranked list: one "GENE<TAB>SCORE" pair per line, no header.
	// Blank lines and '#' comments are skipped. A first line whose score does
	// not parse is taken as a header and skipped; any later malformed line
	// throws InputError naming the line. Entries come back in file order;
	// RankedList does the validation and sorting.
	std::vector<GeneScore> read_ranked_list(const std::string& path);

} // namespace kgsea
