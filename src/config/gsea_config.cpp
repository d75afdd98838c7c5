#include "config/gsea_config.hpp"
#include "common/errors.hpp"
#include <algorithm> // std::transform, std::tolower
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace kgsea {

    using nlohmann::json;

    // Generic helper: if key exists and is non-null, assign to target (strongly typed).
    template <typename T>
    static void set_if(const json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            it->get_to(target);
        }
    }

    // Accept integer/unsigned/float JSON numbers for a double.
    static void set_if_number(const json& j, const char* key, double& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            if (it->is_number_float())         target = it->get<double>();
            else if (it->is_number_integer())  target = static_cast<double>(it->get<long long>());
            else if (it->is_number_unsigned()) target = static_cast<double>(it->get<unsigned long long>());
            else                               it->get_to(target); // let it throw if truly incompatible
        }
    }

    [[noreturn]] static void int_out_of_range(const char* key, const json& v) {
        throw ConfigError(std::string(key) + " is out of range for an int; got " + v.dump());
    }

    // Overload for int to accept numeric JSON of any kind; values outside
    // int (or non-integral floats) throw ConfigError.
    static void set_if_number(const json& j, const char* key, int& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            constexpr long long lo = std::numeric_limits<int>::min();
            constexpr long long hi = std::numeric_limits<int>::max();
            if (it->is_number_unsigned()) {
                unsigned long long v = it->get<unsigned long long>();
                if (v > static_cast<unsigned long long>(hi)) int_out_of_range(key, *it);
                target = static_cast<int>(v);
            }
            else if (it->is_number_integer()) {
                long long v = it->get<long long>();
                if (v < lo || v > hi) int_out_of_range(key, *it);
                target = static_cast<int>(v);
            }
            else if (it->is_number_float()) {
                double v = it->get<double>();
                if (!std::isfinite(v) || v < (double)lo || v > (double)hi || std::trunc(v) != v) {
                    int_out_of_range(key, *it);
                }
                target = static_cast<int>(v);
            }
            else it->get_to(target);
        }
    }

    static void set_if_number(const json& j, const char* key, uint64_t& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            if (it->is_number_unsigned())     target = it->get<unsigned long long>();
            else if (it->is_number_integer()) {
                long long v = it->get<long long>();
                if (v < 0) throw ConfigError(std::string(key) + " must be non-negative; got " + std::to_string(v));
                target = static_cast<uint64_t>(v);
            }
            else if (it->is_number_float()) {
                double v = it->get<double>();
                if (!std::isfinite(v) || v < 0.0 || v >= 18446744073709551616.0 || std::trunc(v) != v) {
                    throw ConfigError(std::string(key) + " must be a non-negative integer; got " + it->dump());
                }
                target = static_cast<uint64_t>(v);
            }
            else                              it->get_to(target);
        }
    }

    void validate_config(const GseaConfig& cfg) {
        if (cfg.n_permutations < 1) {
            throw PermutationCountInvalid("n_permutations must be >= 1; got " + std::to_string(cfg.n_permutations));
        }
        if (!std::isfinite(cfg.weight_exponent) || cfg.weight_exponent < 0.0) {
            throw ConfigError("weight_exponent must be finite and >= 0; got " + std::to_string(cfg.weight_exponent));
        }
        if (cfg.max_resample_retries < 0) {
            throw ConfigError("max_resample_retries must be >= 0; got " + std::to_string(cfg.max_resample_retries));
        }
        if (cfg.n_threads < 0) {
            throw ConfigError("n_threads must be >= 0; got " + std::to_string(cfg.n_threads));
        }
        if (cfg.min_size < 1) {
            throw ConfigError("min_size must be >= 1; got " + std::to_string(cfg.min_size));
        }
        if (cfg.max_size != 0 && cfg.max_size < cfg.min_size) {
            throw ConfigError("max_size must be 0 or >= min_size; got " + std::to_string(cfg.max_size));
        }
        if (cfg.gene_set_format != "auto" && cfg.gene_set_format != "gmt" && cfg.gene_set_format != "kg_json") {
            throw ConfigError("gene_set_format must be \"auto\", \"gmt\" or \"kg_json\"; got: " + cfg.gene_set_format);
        }
    }

    GseaConfig load_gsea_config(const std::string& json_path) {
        std::ifstream in(json_path);
        if (!in) throw std::runtime_error("Could not open config file: " + json_path);

        json j;
        try {
            in >> j;
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("Invalid JSON in config file: ") + e.what());
        }

        GseaConfig cfg;

        // Scalars (numbers)
        set_if_number(j, "weight_exponent", cfg.weight_exponent);
        set_if_number(j, "n_permutations", cfg.n_permutations);
        set_if_number(j, "seed", cfg.seed);
        set_if_number(j, "max_resample_retries", cfg.max_resample_retries);
        set_if_number(j, "n_threads", cfg.n_threads);
        set_if_number(j, "min_size", cfg.min_size);
        set_if_number(j, "max_size", cfg.max_size);

        // Strings
        set_if(j, "output_folder", cfg.output_folder);
        set_if(j, "gene_set_format", cfg.gene_set_format);

        // Booleans
        set_if(j, "write_null_h5", cfg.write_null_h5);
        set_if(j, "verbose", cfg.verbose);

        std::transform(cfg.gene_set_format.begin(), cfg.gene_set_format.end(),
            cfg.gene_set_format.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        validate_config(cfg);
        return cfg;
    }

} // namespace kgsea
