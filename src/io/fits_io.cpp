#include "gwskynet/io/fits_io.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/utils.hpp"

#include <fitsio.h>

#include <cstring>
#include <memory>

namespace gwskynet::io {

namespace {

template <typename T>
std::optional<T> lookup(const std::map<std::string, T>& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

struct FitsCloser {
    void operator()(fitsfile* fptr) const {
        int status = 0;
        fits_close_file(fptr, &status);
    }
};

using FitsHandle = std::unique_ptr<fitsfile, FitsCloser>;

// Throws FitsError carrying cfitsio's own message when status is set.
void check(int status, const std::string& what, const fs::path& path) {
    if (status == 0) return;
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    throw FitsError(what + " (" + text + "): " + path.string());
}

FitsHandle create_file(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    // leading '!' overwrites an existing file
    const std::string target = "!" + path.string();
    fits_create_file(&fptr, target.c_str(), &status);
    check(status, "Cannot create FITS file", path);
    return FitsHandle(fptr);
}

// Closes a file opened for writing; flush errors surface here.
void close_checked(FitsHandle& fptr, const fs::path& path) {
    int status = 0;
    fits_close_file(fptr.release(), &status);
    check(status, "Cannot close FITS file", path);
}

FitsHeader read_current_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        char card[FLEN_CARD];
        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;
        char dtype = 'C';

        status = 0;
        if (fits_read_record(fptr, i, card, &status)) continue;
        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        const std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") continue;

        if (fits_parse_value(card, value, comment, &status)) continue;
        if (value[0] == '\0') continue;
        if (fits_get_keytype(value, &dtype, &status)) continue;

        const std::string text = core::trim(value);
        try {
            switch (dtype) {
                case 'L': header.set(key, text == "T"); break;
                case 'I': header.set(key, std::stoi(text)); break;
                case 'F': header.set(key, std::stod(text)); break;
                default: header.set(key, text); break;
            }
        } catch (const std::exception&) {
            // out-of-range integers and the like stay available as text
            header.set(key, text);
        }
    }
    return header;
}

void write_header_keys(fitsfile* fptr, const FitsHeader& header, const fs::path& path) {
    int status = 0;
    auto fits_key = [](const std::string& key) { return key.size() <= 8; };

    for (const auto& kv : header.string_values) {
        if (!fits_key(kv.first)) continue;
        fits_update_key(fptr, TSTRING, kv.first.c_str(),
                        const_cast<char*>(kv.second.c_str()), nullptr, &status);
    }
    for (const auto& kv : header.numeric_values) {
        if (!fits_key(kv.first)) continue;
        double v = kv.second;
        fits_update_key(fptr, TDOUBLE, kv.first.c_str(), &v, nullptr, &status);
    }
    for (const auto& kv : header.int_values) {
        if (!fits_key(kv.first)) continue;
        int v = kv.second;
        fits_update_key(fptr, TINT, kv.first.c_str(), &v, nullptr, &status);
    }
    for (const auto& kv : header.bool_values) {
        if (!fits_key(kv.first)) continue;
        int v = kv.second ? 1 : 0;
        fits_update_key(fptr, TLOGICAL, kv.first.c_str(), &v, nullptr, &status);
    }
    check(status, "Cannot write FITS header", path);
}

bool is_integer_type(int typecode) {
    return typecode == TLONGLONG || typecode == TLONG || typecode == TINT ||
           typecode == TSHORT || typecode == TBYTE;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    return lookup(string_values, key);
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    return lookup(numeric_values, key);
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    return lookup(int_values, key);
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) return d;
    if (auto i = get_int(key)) return static_cast<double>(*i);
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) { string_values[key] = value; }
void FitsHeader::set(const std::string& key, const char* value) { string_values[key] = value; }
void FitsHeader::set(const std::string& key, double value) { numeric_values[key] = value; }
void FitsHeader::set(const std::string& key, int value) { int_values[key] = value; }
void FitsHeader::set(const std::string& key, bool value) { bool_values[key] = value; }

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* raw = nullptr;
    int status = 0;
    fits_open_image(&raw, path.string().c_str(), READONLY, &status);
    check(status, "Cannot open FITS image", path);
    FitsHandle fptr(raw);

    int naxis = 0;
    int bitpix = 0;
    long naxes[3] = {0, 0, 0};
    fits_get_img_param(fptr.get(), 3, &bitpix, &naxis, naxes, &status);
    check(status, "Cannot read FITS image parameters", path);
    if (naxis < 2) {
        throw FitsError("FITS image has fewer than 2 axes: " + path.string());
    }

    // Row-major storage matches FITS axis order (NAXIS1 fastest).
    Matrix2Df data(naxes[1], naxes[0]);
    long fpixel[3] = {1, 1, 1};
    fits_read_pix(fptr.get(), TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), nullptr,
                  data.data(), nullptr, &status);
    check(status, "Cannot read FITS pixel data", path);

    return {data, read_current_header(fptr.get())};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    FitsHandle fptr = create_file(path);
    int status = 0;

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr.get(), FLOAT_IMG, 2, naxes, &status);
    check(status, "Cannot create FITS image", path);

    write_header_keys(fptr.get(), header, path);

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr.get(), TFLOAT, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<float*>(data.data()), &status);
    check(status, "Cannot write FITS pixel data", path);
    close_checked(fptr, path);
}

FitsTable read_fits_table(const fs::path& path) {
    fitsfile* raw = nullptr;
    int status = 0;
    fits_open_table(&raw, path.string().c_str(), READONLY, &status);
    check(status, "Cannot open FITS table", path);
    FitsHandle fptr(raw);

    int hdutype = 0;
    fits_get_hdu_type(fptr.get(), &hdutype, &status);
    check(status, "Cannot read HDU type", path);
    if (hdutype != BINARY_TBL) {
        throw FitsError("First table HDU is not a binary table: " + path.string());
    }

    FitsTable table;
    table.header = read_current_header(fptr.get());

    int ncols = 0;
    LONGLONG nrows = 0;
    fits_get_num_cols(fptr.get(), &ncols, &status);
    fits_get_num_rowsll(fptr.get(), &nrows, &status);
    check(status, "Cannot read table dimensions", path);

    for (int col = 1; col <= ncols; ++col) {
        auto ttype = table.header.get_string("TTYPE" + std::to_string(col));
        if (!ttype) continue;
        const std::string name = core::to_upper(core::trim(*ttype));

        int typecode = 0;
        long repeat = 0;
        long width = 0;
        fits_get_coltype(fptr.get(), col, &typecode, &repeat, &width, &status);
        check(status, "Cannot read type of column " + name, path);

        const LONGLONG nelem = nrows * static_cast<LONGLONG>(repeat);
        int anynul = 0;

        if (is_integer_type(typecode)) {
            std::vector<LONGLONG> buf(static_cast<std::size_t>(nelem));
            fits_read_col(fptr.get(), TLONGLONG, col, 1, 1, nelem, nullptr, buf.data(),
                          &anynul, &status);
            check(status, "Cannot read column " + name, path);
            table.int_columns[name].assign(buf.begin(), buf.end());
        } else if (typecode == TDOUBLE || typecode == TFLOAT) {
            std::vector<double> buf(static_cast<std::size_t>(nelem));
            fits_read_col(fptr.get(), TDOUBLE, col, 1, 1, nelem, nullptr, buf.data(),
                          &anynul, &status);
            check(status, "Cannot read column " + name, path);
            table.double_columns[name] = std::move(buf);
        }
    }
    return table;
}

void write_fits_table(const fs::path& path, const FitsTable& table,
                      const std::string& extname) {
    std::vector<std::string> names;
    std::vector<std::string> forms;
    LONGLONG nrows = -1;
    auto add_column = [&](const std::string& name, std::size_t rows, const char* form) {
        if (nrows < 0) nrows = static_cast<LONGLONG>(rows);
        if (nrows != static_cast<LONGLONG>(rows)) {
            throw FitsError("Column length mismatch for " + name + ": " + path.string());
        }
        names.push_back(name);
        forms.push_back(form);
    };
    for (const auto& kv : table.int_columns) add_column(kv.first, kv.second.size(), "1K");
    for (const auto& kv : table.double_columns) add_column(kv.first, kv.second.size(), "1D");
    if (nrows < 0) nrows = 0;

    std::vector<char*> ttype;
    std::vector<char*> tform;
    for (std::size_t i = 0; i < names.size(); ++i) {
        ttype.push_back(const_cast<char*>(names[i].c_str()));
        tform.push_back(const_cast<char*>(forms[i].c_str()));
    }

    FitsHandle fptr = create_file(path);
    int status = 0;
    fits_create_tbl(fptr.get(), BINARY_TBL, nrows, static_cast<int>(names.size()),
                    ttype.data(), tform.data(), nullptr,
                    const_cast<char*>(extname.c_str()), &status);
    check(status, "Cannot create FITS table", path);

    int col = 1;
    for (const auto& kv : table.int_columns) {
        std::vector<LONGLONG> buf(kv.second.begin(), kv.second.end());
        fits_write_col(fptr.get(), TLONGLONG, col++, 1, 1, nrows, buf.data(), &status);
    }
    for (const auto& kv : table.double_columns) {
        fits_write_col(fptr.get(), TDOUBLE, col++, 1, 1, nrows,
                       const_cast<double*>(kv.second.data()), &status);
    }
    check(status, "Cannot write FITS table data", path);

    write_header_keys(fptr.get(), table.header, path);
    close_checked(fptr, path);
}

} // namespace gwskynet::io
