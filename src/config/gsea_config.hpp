#pragma once
#include <cstdint>
#include <string>

namespace kgsea {

	struct GseaConfig {
		// Statistic
		double   weight_exponent = 1.0;     // p in |score|^p; 0 = unweighted (classic KS)
		int      n_permutations = 1000;     // B
		uint64_t seed = 42;                 // base seed for permutation streams
		int      max_resample_retries = 10; // redraws allowed for a degenerate permutation

		// Parallelism
		int n_threads = 0;                  // OpenMP threads per rank for permutations (0 = runtime default)

		// Gene set size filter (applied to the overlap with the ranking)
		int min_size = 1;
		int max_size = 0;                   // 0 = no upper bound

		// I/O
		std::string output_folder = ".";
		bool write_null_h5 = false;         // dump null distributions to HDF5
		std::string gene_set_format = "auto"; // "gmt", "kg_json" or "auto"

		bool verbose = true;
	};

	// Load from a JSON file on disk. Throws on unreadable / invalid JSON and
	// runs validate_config() on the result.
	GseaConfig load_gsea_config(const std::string& json_path);

	// Throws PermutationCountInvalid for B < 1 and ConfigError for any other
	// out-of-range parameter.
	void validate_config(const GseaConfig& cfg);

} // namespace kgsea
