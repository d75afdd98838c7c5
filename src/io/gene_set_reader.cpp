#include "io/gene_set_reader.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace kgsea {

    using nlohmann::json;

    std::vector<GeneSet> read_gmt(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Could not open GMT file: " + path);

        std::vector<GeneSet> out;
        std::string line;
        size_t lineno = 0;
        while (std::getline(in, line)) {
            ++lineno;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;

            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string f;
            while (std::getline(ss, f, '\t')) fields.push_back(f);
            if (fields.size() < 2 || fields[0].empty()) {
                throw InputError(path + ":" + std::to_string(lineno) + ": expected name<TAB>description<TAB>genes...");
            }

            GeneSet gs;
            gs.id = fields[0];
            gs.description = fields[1];
            for (size_t k = 2; k < fields.size(); ++k) {
                if (!fields[k].empty()) gs.genes.push_back(fields[k]);
            }
            // Empty sets are kept: they fail per gene set with InputError.
            out.push_back(std::move(gs));
        }
        return out;
    }

    static std::string label_of(const json& node) {
        auto it = node.find("label");
        if (it == node.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    std::vector<GeneSet> read_kg_gene_sets(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Could not open knowledge-graph file: " + path);

        json j;
        try {
            in >> j;
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("Invalid JSON in knowledge-graph file: ") + e.what());
        }
        if (!j.is_object() || !j.contains("terms") || !j.contains("triples")) {
            throw InputError(path + ": expected an object with \"terms\" and \"triples\"");
        }

        std::unordered_set<std::string> genes;
        if (j.contains("genes")) {
            for (const auto& g : j["genes"]) {
                std::string l = label_of(g);
                if (!l.empty()) genes.insert(l);
            }
        }

        // Term order follows terms[]; duplicate term labels collapse.
        std::vector<GeneSet> sets;
        std::unordered_map<std::string, size_t> term_idx;
        for (const auto& t : j["terms"]) {
            std::string l = label_of(t);
            if (l.empty() || term_idx.count(l)) continue;
            term_idx.emplace(l, sets.size());
            GeneSet gs;
            gs.id = l;
            sets.push_back(std::move(gs));
        }

        std::vector<std::unordered_set<std::string>> members(sets.size());
        std::vector<std::vector<std::string>> relations(sets.size());
        size_t skipped = 0;

        for (const auto& tr : j["triples"]) {
            auto str = [&](const char* k) -> std::string {
                auto it = tr.find(k);
                return (it != tr.end() && it->is_string()) ? it->get<std::string>() : std::string();
            };
            const std::string src = str("source_label");
            const std::string rel = str("relation");
            const std::string dst = str("target_label");
            if (src.empty() || rel.empty() || dst.empty()) { ++skipped; continue; }

            // The term end is source when possible, else target.
            size_t ti = 0;
            std::string gene;
            auto ts = term_idx.find(src);
            auto td = term_idx.find(dst);
            if (ts != term_idx.end() && genes.count(dst)) { ti = ts->second; gene = dst; }
            else if (td != term_idx.end() && genes.count(src)) { ti = td->second; gene = src; }
            else { ++skipped; continue; }

            if (members[ti].insert(gene).second) sets[ti].genes.push_back(gene);
            auto& rv = relations[ti];
            if (std::find(rv.begin(), rv.end(), rel) == rv.end()) rv.push_back(rel);
        }

        if (skipped > 0) {
            std::cerr << "Warning: skipped " << skipped << " triples of " << path
                << " that do not link a known term to a known gene\n";
        }

        std::vector<GeneSet> out;
        out.reserve(sets.size());
        for (size_t i = 0; i < sets.size(); ++i) {
            if (sets[i].genes.empty()) continue;
            std::string desc;
            for (size_t r = 0; r < relations[i].size(); ++r) {
                if (r) desc += ",";
                desc += relations[i][r];
            }
            sets[i].description = desc;
            out.push_back(std::move(sets[i]));
        }
        return out;
    }

    static bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<GeneSet> read_gene_sets(const std::string& path, const std::string& format) {
        if (format == "gmt") return read_gmt(path);
        if (format == "kg_json") return read_kg_gene_sets(path);
        if (format != "auto") throw ConfigError("unknown gene set format: " + format);

        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ends_with(lower, ".json")) return read_kg_gene_sets(path);
        return read_gmt(path);
    }

} // namespace kgsea
