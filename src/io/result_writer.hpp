#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"
#include "pipeline/enrichment_pipeline.hpp"

namespace kgsea {

	// One row per gene set:
	// gene_set_id,status,es,nes,p_value,fdr_q,peak_position,hit_count,leading_edge,message
	// Missing values are left empty; leading edge genes are ';'-joined.
	// Throws if the file cannot be opened.
	void write_results_csv(const std::string& path, const std::vector<GeneSetReport>& reports);

	// HDF5 dump of a batch:
	//   /results/gene_set_id  (vlen strings, one per report)
	//   /results/status       (int32, ErrorKind; -1 = size-filtered)
	//   /results/es, nes, p_value, fdr_q     (float64, NaN when missing)
	//   /results/peak_position, hit_count    (int64, -1 when missing)
	//   /null/es              (float64, n_scored x B)
	//   /null/report_index    (int64, row -> index into /results)
	// esnull may be empty (no /null group) or hold one entry per report, where
	// entries of unscored gene sets are empty.
	void write_results_h5(const std::string& path,
		const std::vector<GeneSetReport>& reports,
		const std::vector<NullDistribution>& esnull);

	// Human-readable status of a report ("ok", "filtered" or the error kind).
	std::string report_status(const GeneSetReport& r);

} // namespace kgsea
