#include "io/result_writer.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

extern "C" {
#include <hdf5.h>
}

namespace kgsea {

    std::string report_status(const GeneSetReport& r) {
        if (r.filtered) return "filtered";
        return error_kind_name(r.error);
    }

    // Quote a CSV field when it holds a separator, quote or newline.
    static std::string csv_field(const std::string& s) {
        if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
        std::string q = "\"";
        for (char c : s) {
            if (c == '"') q += "\"\"";
            else          q += c;
        }
        q += "\"";
        return q;
    }

    void write_results_csv(const std::string& path, const std::vector<GeneSetReport>& reports) {
        std::ofstream csv(path, std::ios::out | std::ios::trunc);
        if (!csv) throw std::runtime_error("Cannot open " + path + " for writing");

        csv << "gene_set_id,status,es,nes,p_value,fdr_q,peak_position,hit_count,leading_edge,message\n";
        csv << std::setprecision(10);
        for (const auto& r : reports) {
            csv << csv_field(r.gene_set_id) << "," << report_status(r) << ",";
            if (r.enrichment) csv << r.enrichment->es;
            csv << ",";
            if (r.normalized) csv << r.normalized->nes << "," << r.normalized->p_value << "," << r.normalized->fdr_q;
            else              csv << ",,";
            csv << ",";
            if (r.enrichment) {
                csv << r.enrichment->peak_position << "," << r.enrichment->hit_count << ",";
                std::string edge;
                for (size_t i = 0; i < r.enrichment->leading_edge.size(); ++i) {
                    if (i) edge += ";";
                    edge += r.enrichment->leading_edge[i];
                }
                csv << csv_field(edge);
            }
            else {
                csv << ",,";
            }
            csv << "," << csv_field(r.message) << "\n";
        }
        if (!csv) throw std::runtime_error("Write failed: " + path);
    }

    // ============================ HDF5 helpers ============================

    static inline void h5_check(herr_t status, const char* msg) {
        if (status < 0) throw std::runtime_error(std::string("HDF5 error: ") + msg);
    }

    static void write_1d(hid_t loc, const char* name, hid_t mtype, hsize_t n, const void* data) {
        hsize_t dims[1] = { n };
        hid_t space = H5Screate_simple(1, dims, nullptr);
        if (space < 0) throw std::runtime_error(std::string("HDF5 error: cannot create dataspace for ") + name);
        hid_t dset = H5Dcreate2(loc, name, mtype, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if (dset < 0) {
            H5Sclose(space);
            throw std::runtime_error(std::string("HDF5 error: cannot create dataset ") + name);
        }
        herr_t st = (n > 0) ? H5Dwrite(dset, mtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, data) : 0;
        H5Dclose(dset);
        H5Sclose(space);
        h5_check(st, name);
    }

    static void write_strings(hid_t loc, const char* name, const std::vector<std::string>& v) {
        std::vector<const char*> ptrs(v.size());
        for (size_t i = 0; i < v.size(); ++i) ptrs[i] = v[i].c_str();

        hid_t stype = H5Tcopy(H5T_C_S1);
        if (stype < 0) throw std::runtime_error(std::string("HDF5 error: cannot create string type for ") + name);
        try {
            h5_check(H5Tset_size(stype, H5T_VARIABLE), "H5Tset_size");
            h5_check(H5Tset_cset(stype, H5T_CSET_UTF8), "H5Tset_cset");
            write_1d(loc, name, stype, (hsize_t)v.size(), ptrs.data());
        }
        catch (...) {
            H5Tclose(stype);
            throw;
        }
        H5Tclose(stype);
    }

    static hid_t create_group(hid_t file, const char* path) {
        hid_t g = H5Gcreate2(file, path, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if (g < 0) throw std::runtime_error(std::string("HDF5 error: cannot create group ") + path);
        return g;
    }

    static void write_results_group(hid_t file, const std::vector<GeneSetReport>& reports) {
        const size_t n = reports.size();
        const double nan = std::numeric_limits<double>::quiet_NaN();

        std::vector<std::string> ids(n);
        std::vector<int32_t> status(n);
        std::vector<double> es(n, nan), nes(n, nan), pv(n, nan), fdr(n, nan);
        std::vector<int64_t> peak(n, -1), hits(n, -1);
        for (size_t i = 0; i < n; ++i) {
            const auto& r = reports[i];
            ids[i] = r.gene_set_id;
            status[i] = r.filtered ? -1 : static_cast<int32_t>(r.error);
            if (r.enrichment) {
                es[i] = r.enrichment->es;
                peak[i] = r.enrichment->peak_position;
                hits[i] = r.enrichment->hit_count;
            }
            if (r.normalized) {
                nes[i] = r.normalized->nes;
                pv[i] = r.normalized->p_value;
                fdr[i] = r.normalized->fdr_q;
            }
        }

        hid_t g = create_group(file, "/results");
        try {
            write_strings(g, "gene_set_id", ids);
            write_1d(g, "status", H5T_NATIVE_INT32, n, status.data());
            write_1d(g, "es", H5T_NATIVE_DOUBLE, n, es.data());
            write_1d(g, "nes", H5T_NATIVE_DOUBLE, n, nes.data());
            write_1d(g, "p_value", H5T_NATIVE_DOUBLE, n, pv.data());
            write_1d(g, "fdr_q", H5T_NATIVE_DOUBLE, n, fdr.data());
            write_1d(g, "peak_position", H5T_NATIVE_INT64, n, peak.data());
            write_1d(g, "hit_count", H5T_NATIVE_INT64, n, hits.data());
        }
        catch (...) {
            H5Gclose(g);
            throw;
        }
        H5Gclose(g);
    }

    static void write_null_group(hid_t file, const std::vector<GeneSetReport>& reports,
        const std::vector<NullDistribution>& esnull) {
        if (esnull.size() != reports.size()) {
            throw std::runtime_error("null distributions (" + std::to_string(esnull.size())
                + ") do not match reports (" + std::to_string(reports.size()) + ")");
        }

        // Row-major n_scored x B; every scored gene set has the same B.
        std::vector<int64_t> row_index;
        std::vector<double> flat;
        size_t B = 0;
        for (size_t i = 0; i < esnull.size(); ++i) {
            if (esnull[i].empty()) continue;
            if (B == 0) B = esnull[i].size();
            if (esnull[i].size() != B) {
                throw std::runtime_error("null distribution of '" + reports[i].gene_set_id
                    + "' has " + std::to_string(esnull[i].size()) + " values, expected " + std::to_string(B));
            }
            row_index.push_back((int64_t)i);
            flat.insert(flat.end(), esnull[i].begin(), esnull[i].end());
        }

        hid_t g = create_group(file, "/null");
        try {
            hsize_t dims[2] = { (hsize_t)row_index.size(), (hsize_t)B };
            hid_t space = H5Screate_simple(2, dims, nullptr);
            if (space < 0) throw std::runtime_error("HDF5 error: cannot create dataspace for /null/es");
            hid_t dset = H5Dcreate2(g, "es", H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
            if (dset < 0) {
                H5Sclose(space);
                throw std::runtime_error("HDF5 error: cannot create dataset /null/es");
            }
            herr_t st = flat.empty() ? 0 : H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, flat.data());
            H5Dclose(dset);
            H5Sclose(space);
            h5_check(st, "write /null/es");

            write_1d(g, "report_index", H5T_NATIVE_INT64, row_index.size(), row_index.data());
        }
        catch (...) {
            H5Gclose(g);
            throw;
        }
        H5Gclose(g);
    }

    void write_results_h5(const std::string& path,
        const std::vector<GeneSetReport>& reports,
        const std::vector<NullDistribution>& esnull) {
        hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (file < 0) throw std::runtime_error("Failed to create HDF5 file: " + path);

        try {
            write_results_group(file, reports);
            if (!esnull.empty()) write_null_group(file, reports, esnull);
        }
        catch (...) {
            H5Fclose(file);
            throw;
        }
        h5_check(H5Fclose(file), "H5Fclose");
    }

} // namespace kgsea
