#include "pipeline/distributed.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace kgsea {

    using nlohmann::json;

    // ---------------- per-gene-set record <-> JSON (shipped as CBOR) ----------------

    static json encode_scored(size_t index, const ScoredGeneSet& S) {
        json j;
        j["i"] = index;
        j["id"] = S.report.gene_set_id;
        j["error"] = static_cast<int>(S.report.error);
        j["filtered"] = S.report.filtered;
        j["msg"] = S.report.message;
        if (S.report.enrichment) {
            const auto& E = *S.report.enrichment;
            j["es"] = E.es;
            j["peak"] = E.peak_position;
            j["hits"] = E.hit_count;
            j["edge"] = E.leading_edge;
        }
        if (S.report.ok()) j["null"] = S.esnull;
        return j;
    }

    static size_t decode_scored(const json& j, ScoredGeneSet& S) {
        const size_t index = j.at("i").get<size_t>();
        S.report.gene_set_id = j.at("id").get<std::string>();
        S.report.error = static_cast<ErrorKind>(j.at("error").get<int>());
        S.report.filtered = j.at("filtered").get<bool>();
        S.report.message = j.at("msg").get<std::string>();

        if (j.contains("es")) {
            EnrichmentResult E;
            E.gene_set_id = S.report.gene_set_id;
            E.es = j.at("es").get<double>();
            E.sign = E.es < 0.0 ? EnrichmentSign::Negative : EnrichmentSign::Positive;
            E.peak_position = j.at("peak").get<int64_t>();
            E.hit_count = j.at("hits").get<int64_t>();
            E.leading_edge = j.at("edge").get<std::vector<std::string>>();
            S.report.enrichment = std::move(E);
        }
        if (S.report.ok()) {
            S.esnull = j.at("null").get<NullDistribution>();
            // Deterministic; already succeeded on the scoring rank.
            S.norm = normalize_gene_set(*S.report.enrichment, S.esnull);
            NormalizedResult N;
            N.gene_set_id = S.report.gene_set_id;
            N.nes = S.norm.nes;
            N.p_value = S.norm.p_value;
            S.report.normalized = N;
        }
        return index;
    }

    int mpi_count(uint64_t n, const char* what) {
        if (n > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(std::string(what) + " of " + std::to_string(n)
                + " bytes exceeds the MPI int count limit; use more ranks or fewer permutations");
        }
        return static_cast<int>(n);
    }

    DistributedResult run_enrichment_mpi(MPI_Comm comm,
        const RankedList& ranked,
        const std::vector<GeneSet>& gene_sets,
        const GseaConfig& cfg,
        const CancellationToken* cancel) {
        DistributedResult res;
        int rank = 0, world = 1;
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &world);

        // 1) Phase 1 on the gene sets this rank owns.
        json local = json::array();
        std::exception_ptr local_error;
        size_t n_local = 0;
        try {
            EnrichmentPipeline pipe(ranked, cfg, nullptr, cancel);
            pipe.set_log_prefix("[rank " + std::to_string(rank) + "] ");
            for (size_t i = (size_t)rank; i < gene_sets.size(); i += (size_t)world) {
                if (cancel && cancel->cancelled()) {
                    throw RunCancelled("run cancelled on rank " + std::to_string(rank));
                }
                local.push_back(encode_scored(i, pipe.score_gene_set(gene_sets[i])));
                ++n_local;
            }
        }
        catch (const std::exception&) {
            local_error = std::current_exception();
        }

        // 2) Agree on failure before any collective that could block.
        int failed_local = local_error ? 1 : 0;
        int failed_any = 0;
        MPI_Allreduce(&failed_local, &failed_any, 1, MPI_INT, MPI_MAX, comm);
        if (failed_any) {
            if (failed_local) std::rethrow_exception(local_error);
            throw std::runtime_error("enrichment run aborted by another rank");
        }

        if (cfg.verbose) {
            std::cout << "[rank " << rank << "/" << world << "] scored "
                << n_local << " gene sets\n";
        }

        // 3) Gather CBOR blobs to rank 0.
        std::vector<std::uint8_t> blob = json::to_cbor(local);
        // Every rank checks the gathered total, so all of them throw or none does.
        uint64_t my_bytes = blob.size(), total_bytes = 0;
        MPI_Allreduce(&my_bytes, &total_bytes, 1, MPI_UINT64_T, MPI_SUM, comm);
        mpi_count(total_bytes, "gathered result buffer");
        const int my_len = mpi_count(my_bytes, "rank result buffer");
        std::vector<int> lens;
        if (rank == 0) lens.resize((size_t)world, 0);
        MPI_Gather(&my_len, 1, MPI_INT, rank == 0 ? lens.data() : nullptr, 1, MPI_INT, 0, comm);

        std::vector<int> displs;
        std::vector<std::uint8_t> all;
        if (rank == 0) {
            displs.resize((size_t)world, 0);
            uint64_t total = 0;
            for (int r = 0; r < world; ++r) {
                displs[(size_t)r] = mpi_count(total, "gather displacement");
                total += (uint64_t)lens[(size_t)r];
            }
            all.resize((size_t)total);
        }
        MPI_Gatherv(blob.data(), my_len, MPI_BYTE,
            rank == 0 ? all.data() : nullptr,
            rank == 0 ? lens.data() : nullptr,
            rank == 0 ? displs.data() : nullptr,
            MPI_BYTE, 0, comm);

        if (rank != 0) return res;

        // 4) Rank 0: reassemble in input order, then the batch FDR barrier.
        std::vector<ScoredGeneSet> scored(gene_sets.size());
        std::vector<uint8_t> seen(gene_sets.size(), 0);
        for (int r = 0; r < world; ++r) {
            const auto* p = all.data() + displs[(size_t)r];
            json part = json::from_cbor(p, p + lens[(size_t)r]);
            for (const auto& j : part) {
                ScoredGeneSet S;
                const size_t idx = decode_scored(j, S);
                if (idx >= scored.size()) throw std::runtime_error("gathered gene set index out of range");
                scored[idx] = std::move(S);
                seen[idx] = 1;
            }
        }
        for (size_t i = 0; i < seen.size(); ++i) {
            if (!seen[i]) throw std::runtime_error("gene set #" + std::to_string(i) + " missing after gather");
        }

        res.reports = EnrichmentPipeline::finalize_batch(scored);
        if (cfg.write_null_h5) {
            res.esnull.reserve(scored.size());
            for (auto& s : scored) res.esnull.push_back(std::move(s.esnull));
        }
        return res;
    }

} // namespace kgsea
