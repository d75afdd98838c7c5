#include "core/ranked_list.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace kgsea {

    RankedList::RankedList(const std::vector<GeneScore>& entries) {
        const size_t n = entries.size();
        if (n == 0) throw InputError("ranked list is empty");

        // Validate in input order so the message names the first offender.
        std::unordered_map<std::string, size_t> seen;
        seen.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            const auto& g = entries[i].first;
            const double s = entries[i].second;
            if (g.empty()) {
                throw InputError("ranked list entry #" + std::to_string(i) + " has an empty gene id");
            }
            if (!std::isfinite(s)) {
                throw InputError("ranked list gene '" + g + "' has a non-finite score");
            }
            auto ins = seen.emplace(g, i);
            if (!ins.second) {
                throw InputError("duplicate gene id '" + g + "' in ranked list (entries #"
                    + std::to_string(ins.first->second) + " and #" + std::to_string(i) + ")");
            }
        }

        // Descending by score; ties keep input order.
        std::vector<size_t> idx(n);
        std::iota(idx.begin(), idx.end(), 0);
        std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
            return entries[a].second > entries[b].second;
            });

        genes_.reserve(n);
        scores_.reserve(n);
        pos_.reserve(n);
        for (size_t r = 0; r < n; ++r) {
            const auto& e = entries[idx[r]];
            genes_.push_back(e.first);
            scores_.push_back(e.second);
            pos_.emplace(e.first, static_cast<int64_t>(r));
        }
    }

    int64_t RankedList::position_of(const std::string& gene_id) const {
        auto it = pos_.find(gene_id);
        return it == pos_.end() ? -1 : it->second;
    }

} // namespace kgsea
