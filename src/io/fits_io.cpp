#include "pfs_redact/io/fits_io.hpp"
#include "pfs_redact/core/errors.hpp"

#include <fitsio.h>
#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>

namespace pfs_redact::io {

namespace {

const char* kDesignExt = "DESIGN";
const char* kPhotometryExt = "PHOTOMETRY";

std::string status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

// Closes the file when the reader or writer leaves scope, including on throw.
struct FitsHandle {
    fitsfile* fptr = nullptr;
    std::string path;

    explicit FitsHandle(std::string p) : path(std::move(p)) {}
    ~FitsHandle() {
        if (fptr) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
        }
    }
    FitsHandle(const FitsHandle&) = delete;
    FitsHandle& operator=(const FitsHandle&) = delete;

    void check(int status, const std::string& what) const {
        if (status) {
            throw FitsError(what + " (" + status_text(status) + "): " + path);
        }
    }

    void close() {
        int status = 0;
        fits_close_file(fptr, &status);
        fptr = nullptr;
        check(status, "Cannot close FITS file");
    }
};

std::string trim_right(const char* s) {
    std::string out(s);
    out.erase(out.find_last_not_of(' ') + 1);
    return out;
}

std::string string_form(const std::vector<std::string>& values) {
    size_t width = 1;
    for (const auto& v : values) width = std::max(width, v.size());
    return std::to_string(width) + "A";
}

void create_table(FitsHandle& fh, long nrows, const std::vector<std::string>& names,
                  const std::vector<std::string>& forms, const char* extname) {
    std::vector<std::string> ttype = names;
    std::vector<std::string> tform = forms;
    std::vector<char*> ttype_ptrs;
    std::vector<char*> tform_ptrs;
    for (auto& s : ttype) ttype_ptrs.push_back(s.data());
    for (auto& s : tform) tform_ptrs.push_back(s.data());

    int status = 0;
    fits_create_tbl(fh.fptr, BINARY_TBL, nrows, static_cast<int>(ttype.size()),
                    ttype_ptrs.data(), tform_ptrs.data(), nullptr, extname, &status);
    fh.check(status, std::string("Cannot create ") + extname + " table");
}

template <typename T>
void write_column(FitsHandle& fh, int datatype, int col, long nelem, const T* data) {
    if (nelem == 0) return;
    int status = 0;
    fits_write_col(fh.fptr, datatype, col, 1, 1, nelem, const_cast<T*>(data), &status);
    fh.check(status, "Cannot write column " + std::to_string(col));
}

void write_string_column(FitsHandle& fh, int col, const std::vector<std::string>& values) {
    if (values.empty()) return;
    std::vector<char*> ptrs;
    ptrs.reserve(values.size());
    for (const auto& v : values) ptrs.push_back(const_cast<char*>(v.c_str()));
    int status = 0;
    fits_write_col(fh.fptr, TSTRING, col, 1, 1, static_cast<LONGLONG>(values.size()),
                   ptrs.data(), &status);
    fh.check(status, "Cannot write string column " + std::to_string(col));
}

int column_number(FitsHandle& fh, const char* name, bool required) {
    int col = 0;
    int status = 0;
    fits_get_colnum(fh.fptr, CASEINSEN, const_cast<char*>(name), &col, &status);
    if (status == COL_NOT_FOUND && !required) {
        fits_clear_errmsg();
        return 0;
    }
    fh.check(status, std::string("Missing column ") + name);
    return col;
}

template <typename T>
void read_column(FitsHandle& fh, int datatype, int col, long nelem, T* out) {
    if (nelem == 0) return;
    int status = 0;
    int anynul = 0;
    fits_read_col(fh.fptr, datatype, col, 1, 1, nelem, nullptr, out, &anynul, &status);
    fh.check(status, "Cannot read column " + std::to_string(col));
}

std::vector<std::string> read_string_column(FitsHandle& fh, int col, long nrows) {
    std::vector<std::string> out(static_cast<size_t>(nrows));
    if (nrows == 0) return out;

    int status = 0;
    int typecode = 0;
    long repeat = 0;
    long width = 0;
    fits_get_coltype(fh.fptr, col, &typecode, &repeat, &width, &status);
    fh.check(status, "Cannot read type of column " + std::to_string(col));

    std::vector<std::vector<char>> buffers(static_cast<size_t>(nrows),
                                           std::vector<char>(static_cast<size_t>(repeat) + 1, '\0'));
    std::vector<char*> ptrs;
    ptrs.reserve(buffers.size());
    for (auto& b : buffers) ptrs.push_back(b.data());

    char nullstr[] = "";
    int anynul = 0;
    fits_read_col(fh.fptr, TSTRING, col, 1, 1, nrows, nullstr, ptrs.data(), &anynul, &status);
    fh.check(status, "Cannot read string column " + std::to_string(col));

    for (size_t i = 0; i < buffers.size(); ++i) {
        out[i] = trim_right(buffers[i].data());
    }
    return out;
}

std::optional<std::string> read_optional_string_key(FitsHandle& fh, const char* key) {
    char value[FLEN_VALUE];
    int status = 0;
    fits_read_key(fh.fptr, TSTRING, key, value, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        return std::nullopt;
    }
    fh.check(status, std::string("Cannot read keyword ") + key);
    return std::string(value);
}

void read_header(FitsHandle& fh, ConfigurationHeader& header) {
    int status = 0;
    unsigned long long design_id = 0;
    fits_read_key(fh.fptr, TULONGLONG, "W_PFDSGN", &design_id, nullptr, &status);
    fh.check(status, "Cannot read W_PFDSGN");
    header.design_id = static_cast<uint64_t>(design_id);

    int visit = 0;
    fits_read_key(fh.fptr, TINT, "W_VISIT", &visit, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        status = 0;
    } else {
        fh.check(status, "Cannot read W_VISIT");
        header.visit = visit;
    }

    header.frame_id = read_optional_string_key(fh, "FRAMEID").value_or("");
    header.design_name = read_optional_string_key(fh, "DSGN_NAM").value_or("");
    header.proposal_id = read_optional_string_key(fh, "PROP-ID").value_or("");
}

void write_header(FitsHandle& fh, const ConfigurationHeader& header) {
    int status = 0;
    fits_create_img(fh.fptr, BYTE_IMG, 0, nullptr, &status);
    fh.check(status, "Cannot create primary HDU");

    unsigned long long design_id = header.design_id;
    fits_update_key(fh.fptr, TULONGLONG, "W_PFDSGN", &design_id, "pfsDesignId", &status);
    if (header.visit) {
        int visit = *header.visit;
        fits_update_key(fh.fptr, TINT, "W_VISIT", &visit, "Visit number", &status);
    }
    fits_update_key(fh.fptr, TSTRING, "FRAMEID", const_cast<char*>(header.frame_id.c_str()),
                    "Frame identifier", &status);
    fits_update_key(fh.fptr, TSTRING, "DSGN_NAM", const_cast<char*>(header.design_name.c_str()),
                    "Design name", &status);
    fits_update_key(fh.fptr, TSTRING, "PROP-ID", const_cast<char*>(header.proposal_id.c_str()),
                    "Proposal identifier", &status);
    fh.check(status, "Cannot write primary header");
}

} // namespace

ConfigurationSet read_configuration_set(const fs::path& path) {
    FitsHandle fh(path.string());
    int status = 0;

    if (fits_open_file(&fh.fptr, path.string().c_str(), READONLY, &status)) {
        fh.fptr = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    ConfigurationSet set;
    read_header(fh, set.header);

    fits_movnam_hdu(fh.fptr, BINARY_TBL, const_cast<char*>(kDesignExt), 0, &status);
    fh.check(status, "Missing DESIGN table");

    long nrows = 0;
    fits_get_num_rows(fh.fptr, &nrows, &status);
    fh.check(status, "Cannot read DESIGN row count");

    set.resize(static_cast<size_t>(nrows));

    read_column(fh, TINT, column_number(fh, "fiberId", true), nrows, set.fiber_id.data());
    read_column(fh, TINT, column_number(fh, "catId", true), nrows, set.cat_id.data());
    read_column(fh, TINT, column_number(fh, "tract", true), nrows, set.tract.data());
    set.patch = read_string_column(fh, column_number(fh, "patch", true), nrows);

    std::vector<LONGLONG> obj_id(static_cast<size_t>(nrows));
    read_column(fh, TLONGLONG, column_number(fh, "objId", true), nrows, obj_id.data());
    std::copy(obj_id.begin(), obj_id.end(), set.obj_id.begin());

    read_column(fh, TDOUBLE, column_number(fh, "ra", true), nrows, set.ra.data());
    read_column(fh, TDOUBLE, column_number(fh, "dec", true), nrows, set.dec.data());

    std::vector<int> target_type(static_cast<size_t>(nrows));
    read_column(fh, TINT, column_number(fh, "targetType", true), nrows, target_type.data());
    for (size_t i = 0; i < target_type.size(); ++i) {
        auto type = int_to_target_type(target_type[i]);
        if (!type) {
            throw FitsError("Unknown targetType " + std::to_string(target_type[i]) + " in " +
                            path.string());
        }
        set.target_type[i] = *type;
    }

    read_column(fh, TDOUBLE, column_number(fh, "pfiNominal", true), 2 * nrows,
                set.pfi_nominal.data());
    int center_col = column_number(fh, "pfiCenter", false);
    if (center_col > 0) {
        read_column(fh, TDOUBLE, center_col, 2 * nrows, set.pfi_center.data());
    } else {
        set.pfi_center.setConstant(std::numeric_limits<double>::quiet_NaN());
    }

    read_column(fh, TDOUBLE, column_number(fh, "pmRa", true), nrows, set.pm_ra.data());
    read_column(fh, TDOUBLE, column_number(fh, "pmDec", true), nrows, set.pm_dec.data());
    read_column(fh, TDOUBLE, column_number(fh, "parallax", true), nrows, set.parallax.data());
    set.proposal_id = read_string_column(fh, column_number(fh, "proposalId", true), nrows);
    set.ob_code = read_string_column(fh, column_number(fh, "obCode", true), nrows);

    fits_movnam_hdu(fh.fptr, BINARY_TBL, const_cast<char*>(kPhotometryExt), 0, &status);
    if (status == BAD_HDU_NUM) {
        fits_clear_errmsg();
        fh.close();
        return set;
    }
    fh.check(status, "Cannot open PHOTOMETRY table");

    long nphot = 0;
    fits_get_num_rows(fh.fptr, &nphot, &status);
    fh.check(status, "Cannot read PHOTOMETRY row count");

    std::vector<int> phot_fiber(static_cast<size_t>(nphot));
    read_column(fh, TINT, column_number(fh, "fiberId", true), nphot, phot_fiber.data());

    std::array<std::vector<double>, kNumFluxFields> phot_flux;
    for (FluxField field : all_flux_fields()) {
        auto& values = phot_flux[flux_index(field)];
        values.resize(static_cast<size_t>(nphot));
        const std::string name = flux_field_to_string(field);
        read_column(fh, TDOUBLE, column_number(fh, name.c_str(), true), nphot, values.data());
    }
    auto phot_filter = read_string_column(fh, column_number(fh, "filterName", true), nphot);

    fh.close();

    std::unordered_map<int, size_t> row_of;
    for (size_t i = 0; i < set.size(); ++i) {
        row_of[set.fiber_id[i]] = i;
    }

    std::vector<std::array<std::vector<double>, kNumFluxFields>> per_row(set.size());
    for (size_t p = 0; p < phot_fiber.size(); ++p) {
        auto it = row_of.find(phot_fiber[p]);
        if (it == row_of.end()) {
            throw FitsError("PHOTOMETRY row references unknown fiberId " +
                            std::to_string(phot_fiber[p]) + " in " + path.string());
        }
        for (size_t k = 0; k < kNumFluxFields; ++k) {
            per_row[it->second][k].push_back(phot_flux[k][p]);
        }
        set.filter_names[it->second].push_back(phot_filter[p]);
    }

    for (size_t i = 0; i < set.size(); ++i) {
        for (size_t k = 0; k < kNumFluxFields; ++k) {
            const auto& values = per_row[i][k];
            set.flux[k][i] = Eigen::Map<const VectorXd>(values.data(),
                                                        static_cast<Eigen::Index>(values.size()));
        }
    }

    return set;
}

void write_configuration_set(const fs::path& path, const ConfigurationSet& set) {
    set.validate();

    FitsHandle fh(path.string());
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fh.fptr, filepath.c_str(), &status)) {
        fh.fptr = nullptr;
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    write_header(fh, set.header);

    const long n = static_cast<long>(set.size());
    create_table(fh, n,
                 {"fiberId", "catId", "tract", "patch", "objId", "ra", "dec", "targetType",
                  "pfiNominal", "pfiCenter", "pmRa", "pmDec", "parallax", "proposalId",
                  "obCode"},
                 {"J", "J", "J", string_form(set.patch), "K", "D", "D", "J", "2E", "2E", "E",
                  "E", "E", string_form(set.proposal_id), string_form(set.ob_code)},
                 kDesignExt);

    std::vector<LONGLONG> obj_id(set.obj_id.begin(), set.obj_id.end());
    std::vector<int> target_type;
    target_type.reserve(set.size());
    for (TargetType t : set.target_type) target_type.push_back(target_type_to_int(t));

    write_column(fh, TINT, 1, n, set.fiber_id.data());
    write_column(fh, TINT, 2, n, set.cat_id.data());
    write_column(fh, TINT, 3, n, set.tract.data());
    write_string_column(fh, 4, set.patch);
    write_column(fh, TLONGLONG, 5, n, obj_id.data());
    write_column(fh, TDOUBLE, 6, n, set.ra.data());
    write_column(fh, TDOUBLE, 7, n, set.dec.data());
    write_column(fh, TINT, 8, n, target_type.data());
    write_column(fh, TDOUBLE, 9, 2 * n, set.pfi_nominal.data());
    write_column(fh, TDOUBLE, 10, 2 * n, set.pfi_center.data());
    write_column(fh, TDOUBLE, 11, n, set.pm_ra.data());
    write_column(fh, TDOUBLE, 12, n, set.pm_dec.data());
    write_column(fh, TDOUBLE, 13, n, set.parallax.data());
    write_string_column(fh, 14, set.proposal_id);
    write_string_column(fh, 15, set.ob_code);

    std::vector<int> phot_fiber;
    std::array<std::vector<double>, kNumFluxFields> phot_flux;
    std::vector<std::string> phot_filter;
    for (size_t i = 0; i < set.size(); ++i) {
        for (size_t b = 0; b < set.filter_names[i].size(); ++b) {
            phot_fiber.push_back(set.fiber_id[i]);
            for (size_t k = 0; k < kNumFluxFields; ++k) {
                phot_flux[k].push_back(set.flux[k][i](static_cast<Eigen::Index>(b)));
            }
            phot_filter.push_back(set.filter_names[i][b]);
        }
    }

    std::vector<std::string> phot_names = {"fiberId"};
    std::vector<std::string> phot_forms = {"J"};
    for (FluxField field : all_flux_fields()) {
        phot_names.push_back(flux_field_to_string(field));
        phot_forms.push_back("E");
    }
    phot_names.push_back("filterName");
    phot_forms.push_back(string_form(phot_filter));

    const long nphot = static_cast<long>(phot_fiber.size());
    create_table(fh, nphot, phot_names, phot_forms, kPhotometryExt);

    write_column(fh, TINT, 1, nphot, phot_fiber.data());
    for (size_t k = 0; k < kNumFluxFields; ++k) {
        write_column(fh, TDOUBLE, static_cast<int>(k) + 2, nphot, phot_flux[k].data());
    }
    write_string_column(fh, static_cast<int>(kNumFluxFields) + 2, phot_filter);

    fh.close();
}

} // namespace pfs_redact::io
