#include "io/ranked_list_reader.hpp"
#include "common/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace kgsea {

    static inline std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
        return s.substr(b, e - b);
    }

    // Whole-token strtod; false if anything but whitespace follows the number.
    static bool parse_double(const std::string& tok, double& out) {
        if (tok.empty()) return false;
        errno = 0;
        char* end = nullptr;
        out = std::strtod(tok.c_str(), &end);
        if (end == tok.c_str() || errno == ERANGE) return false;
        return trim(std::string(end)).empty();
    }

    std::vector<GeneScore> read_ranked_list(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Could not open ranked list file: " + path);

        std::vector<GeneScore> out;
        std::string line;
        size_t lineno = 0;
        bool first_content = true;
        while (std::getline(in, line)) {
            ++lineno;
            std::string t = trim(line);
            if (t.empty() || t[0] == '#') continue;

            size_t tab = t.find('\t');
            if (tab == std::string::npos) tab = t.find_first_of(" ,");
            if (tab == std::string::npos) {
                throw InputError(path + ":" + std::to_string(lineno) + ": expected GENE<TAB>SCORE");
            }
            std::string gene = trim(t.substr(0, tab));
            std::string score_tok = trim(t.substr(tab + 1));

            double score = 0.0;
            if (!parse_double(score_tok, score)) {
                if (first_content) { first_content = false; continue; }  // header
                throw InputError(path + ":" + std::to_string(lineno) + ": cannot parse score '" + score_tok + "'");
            }
            first_content = false;
            out.emplace_back(std::move(gene), score);
        }
        return out;
    }

} // namespace kgsea
