#include <mpi.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include "config/gsea_config.hpp"
#include "core/ranked_list.hpp"
#include "io/gene_set_reader.hpp"
#include "io/ranked_list_reader.hpp"
#include "io/result_writer.hpp"
#include "pipeline/distributed.hpp"

using kgsea::GseaConfig;
using kgsea::RankedList;

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank = 0, world = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world);

    if (argc < 4) {
        if (rank == 0) {
            std::cerr << "Usage: kgsea_run <ranked.rnk> <gene_sets.gmt|kg.json> <config.json>\n";
        }
        MPI_Finalize();
        return 1;
    }

    try {
        const std::string rnk_path = argv[1];
        const std::string sets_path = argv[2];
        const std::string cfg_path = argv[3];

        // Load config (fatal on bad B / exponent)
        GseaConfig cfg = kgsea::load_gsea_config(cfg_path);
        if (rank == 0) {
            std::cout << "Output folder: " << cfg.output_folder
                << " | p=" << cfg.weight_exponent
                << " | B=" << cfg.n_permutations
                << " | seed=" << cfg.seed
                << " | ranks=" << world << "\n";
        }

        // Read inputs (every rank holds the same read-only copy)
        RankedList ranked(kgsea::read_ranked_list(rnk_path));
        auto gene_sets = kgsea::read_gene_sets(sets_path, cfg.gene_set_format);
        if (rank == 0) {
            std::cout << "Ranked list: " << ranked.size() << " genes | gene sets: "
                << gene_sets.size() << "\n";
        }

        // Score (per gene set on its owner rank) + FDR on rank 0
        auto run = kgsea::run_enrichment_mpi(MPI_COMM_WORLD, ranked, gene_sets, cfg);

        if (rank == 0) {
            const auto& reports = run.reports;

            // ---- Top 10 by |NES| ----
            std::vector<size_t> idx;
            for (size_t i = 0; i < reports.size(); ++i) {
                if (reports[i].ok()) idx.push_back(i);
            }
            const size_t top = std::min<size_t>(10, idx.size());
            std::partial_sort(idx.begin(), idx.begin() + top, idx.end(),
                [&](size_t a, size_t b) {
                    const double na = std::fabs(reports[a].normalized->nes);
                    const double nb = std::fabs(reports[b].normalized->nes);
                    if (na != nb) return na > nb;
                    return a < b;
                });

            std::cout << "\nTop " << top << " gene sets by |NES|:\n";
            std::cout << std::left << std::setw(6) << "Rank"
                << std::setw(40) << "Gene set"
                << std::setw(12) << "NES"
                << std::setw(12) << "p"
                << "FDR\n";
            for (size_t k = 0; k < top; ++k) {
                const auto& r = reports[idx[k]];
                std::cout << std::left << std::setw(6) << (k + 1)
                    << std::setw(40) << r.gene_set_id
                    << std::fixed << std::setprecision(4)
                    << std::setw(12) << r.normalized->nes
                    << std::setw(12) << r.normalized->p_value
                    << r.normalized->fdr_q << "\n";
                std::cout.unsetf(std::ios::fixed);
            }

            // ---- Write outputs ----
            namespace fs = std::filesystem;
            fs::path outdir = cfg.output_folder.empty() ? fs::path(".") : fs::path(cfg.output_folder);
            std::error_code ec; fs::create_directories(outdir, ec);
            if (ec) {
                std::cerr << "[rank 0] Warning: cannot create " << outdir.string() << ": " << ec.message() << "\n";
            }

            const fs::path csv_path = outdir / "enrichment_results.csv";
            kgsea::write_results_csv(csv_path.string(), reports);
            std::cout << "\nWrote " << csv_path.string() << "\n";

            if (cfg.write_null_h5) {
                const fs::path h5_path = outdir / "enrichment_null.h5";
                kgsea::write_results_h5(h5_path.string(), reports, run.esnull);
                std::cout << "Wrote " << h5_path.string() << "\n";
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 2);
    }

    MPI_Finalize();
    return 0;
}
