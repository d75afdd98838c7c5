#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"

namespace kgsea {

    // Immutable gene ranking, sorted by score descending.
    //
    // Equal scores keep their input order (stable sort), so the same input
    // always yields the same ranking. Construction throws InputError on an
    // empty list, an empty or duplicate gene id, or a non-finite score.
    // After construction the object is only read, so one instance can be
    // shared by every gene set and every permutation thread.
    class RankedList {
    public:
        explicit RankedList(const std::vector<GeneScore>& entries);

        int64_t size() const { return static_cast<int64_t>(genes_.size()); }

        const std::string& gene(int64_t rank0) const { return genes_[(size_t)rank0]; }
        double score(int64_t rank0) const { return scores_[(size_t)rank0]; }

        const std::vector<std::string>& genes() const { return genes_; }
        const std::vector<double>& scores() const { return scores_; }

        // 0-based position of gene_id, or -1 when it is not ranked.
        int64_t position_of(const std::string& gene_id) const;
        bool contains(const std::string& gene_id) const { return position_of(gene_id) >= 0; }

    private:
        std::vector<std::string> genes_;
        std::vector<double>      scores_;
        std::unordered_map<std::string, int64_t> pos_;
    };

} // namespace kgsea
