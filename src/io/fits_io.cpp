#include "outlier_detect/io/fits_io.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <limits>
#include <vector>

namespace outlier_detect::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) return d;
    if (auto i = get_int(key)) return static_cast<double>(*i);
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

void FitsHeader::merge(const FitsHeader& other) {
    for (const auto& [k, v] : other.string_values) string_values[k] = v;
    for (const auto& [k, v] : other.numeric_values) numeric_values[k] = v;
    for (const auto& [k, v] : other.int_values) int_values[k] = v;
    for (const auto& [k, v] : other.bool_values) bool_values[k] = v;
}

namespace {

// Closes the file on scope exit.
struct FitsFile {
    fitsfile* ptr = nullptr;
    ~FitsFile() {
        if (ptr) {
            int status = 0;
            fits_close_file(ptr, &status);
        }
    }
};

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

// Keywords of the current HDU.
FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

void write_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

// Moves to the named image extension. Returns false when it does not exist.
bool move_to_extension(fitsfile* fptr, const char* extname) {
    int status = 0;
    fits_movnam_hdu(fptr, IMAGE_HDU, const_cast<char*>(extname), 0, &status);
    return status == 0;
}

void image_shape(fitsfile* fptr, const std::string& what, long& width, long& height) {
    int status = 0;
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read image parameters of " + what + ": " +
                        fits_status_text(status));
    }
    if (naxis < 2) {
        throw FitsError(what + " has less than 2 dimensions");
    }
    width = naxes[0];
    height = naxes[1];
}

Matrix2Df read_float_image(fitsfile* fptr, const std::string& what) {
    long width = 0;
    long height = 0;
    image_shape(fptr, what, width, height);

    Matrix2Df data(height, width);
    long fpixel[3] = {1, 1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int status = 0;
    fits_read_pix(fptr, TFLOAT, fpixel, width * height, &nulval, data.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read pixel data of " + what + ": " + fits_status_text(status));
    }
    return data;
}

DQMatrix read_dq_image(fitsfile* fptr, const std::string& what) {
    long width = 0;
    long height = 0;
    image_shape(fptr, what, width, height);

    DQMatrix dq(height, width);
    long fpixel[3] = {1, 1, 1};
    int status = 0;
    fits_read_pix(fptr, TUINT, fpixel, width * height, nullptr, dq.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read DQ data of " + what + ": " + fits_status_text(status));
    }
    return dq;
}

void append_float_image(fitsfile* fptr, const char* extname, const Matrix2Df& data,
                        const FitsHeader& extra, const std::string& path) {
    int status = 0;
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (extname) {
        fits_update_key(fptr, TSTRING, "EXTNAME", const_cast<char*>(extname), nullptr, &status);
    }
    write_header(fptr, extra, status);
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<float*>(data.data()), &status);
    if (status) {
        throw FitsError("Cannot write " + std::string(extname ? extname : "image") + " to " +
                        path + ": " + fits_status_text(status));
    }
}

void append_dq_image(fitsfile* fptr, const DQMatrix& dq, const std::string& path) {
    int status = 0;
    long naxes[2] = {static_cast<long>(dq.cols()), static_cast<long>(dq.rows())};
    fits_create_img(fptr, ULONG_IMG, 2, naxes, &status);
    fits_update_key(fptr, TSTRING, "EXTNAME", const_cast<char*>("DQ"), nullptr, &status);
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TUINT, fpixel, static_cast<LONGLONG>(dq.size()),
                   const_cast<uint32_t*>(dq.data()), &status);
    if (status) {
        throw FitsError("Cannot write DQ to " + path + ": " + fits_status_text(status));
    }
}

void create_file(FitsFile& file, const fs::path& path) {
    int status = 0;
    const std::string filepath = "!" + path.string();
    if (fits_create_file(&file.ptr, filepath.c_str(), &status)) {
        file.ptr = nullptr;
        throw FitsError("Cannot create FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }
}

void close_file(FitsFile& file, const fs::path& path) {
    int status = 0;
    fits_close_file(file.ptr, &status);
    file.ptr = nullptr;
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }
}

} // namespace

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    FitsFile file;
    int status = 0;
    if (fits_open_file(&file.ptr, path.string().c_str(), READONLY, &status)) {
        file.ptr = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    Matrix2Df data = read_float_image(file.ptr, path.string());
    FitsHeader header = read_header(file.ptr);
    return {std::move(data), std::move(header)};
}

FitsHeader wcs_header(const astrometry::WCS& wcs) {
    FitsHeader h;
    h.set("CTYPE1", std::string("RA---TAN"));
    h.set("CTYPE2", std::string("DEC--TAN"));
    for (const auto& [key, value] : astrometry::wcs_to_keywords(wcs)) {
        h.set(key, value);
    }
    return h;
}

astrometry::WCS wcs_from_header(const FitsHeader& header, int naxis1, int naxis2) {
    std::map<std::string, double> keys;
    for (const auto& [k, v] : header.numeric_values) keys[k] = v;
    for (const auto& [k, v] : header.int_values) keys[k] = static_cast<double>(v);
    keys["NAXIS1"] = naxis1;
    keys["NAXIS2"] = naxis2;
    return astrometry::wcs_from_keywords(keys);
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header,
                      const astrometry::WCS* wcs) {
    FitsFile file;
    create_file(file, path);

    FitsHeader h = header;
    if (wcs && wcs->valid()) {
        h.merge(wcs_header(*wcs));
    }
    append_float_image(file.ptr, nullptr, data, h, path.string());
    close_file(file, path);
}

Exposure read_exposure(const fs::path& path) {
    FitsFile file;
    int status = 0;
    if (fits_open_file(&file.ptr, path.string().c_str(), READONLY, &status)) {
        file.ptr = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }

    FitsHeader header = read_header(file.ptr);

    Exposure e;
    e.filename = path.string();
    e.name = path.stem().string();

    if (move_to_extension(file.ptr, "SCI")) {
        header.merge(read_header(file.ptr));
    } else {
        status = 0;
        fits_movabs_hdu(file.ptr, 1, nullptr, &status);
    }
    e.data = read_float_image(file.ptr, path.string() + "[SCI]");

    if (move_to_extension(file.ptr, "ERR")) {
        e.err = read_float_image(file.ptr, path.string() + "[ERR]");
    }
    if (move_to_extension(file.ptr, "VAR_RNOISE")) {
        e.var_rnoise = read_float_image(file.ptr, path.string() + "[VAR_RNOISE]");
    }
    if (move_to_extension(file.ptr, "DQ")) {
        e.dq = read_dq_image(file.ptr, path.string() + "[DQ]");
    } else {
        e.dq = DQMatrix::Zero(e.data.rows(), e.data.cols());
    }

    if ((e.err.size() > 0 && !e.has_err()) ||
        (e.var_rnoise.size() > 0 && !e.has_var_rnoise()) ||
        e.dq.rows() != e.data.rows() || e.dq.cols() != e.data.cols()) {
        throw ValidationError("extensions of " + path.string() + " differ in shape");
    }

    if (auto t = header.get_number("EXPTIME")) {
        e.exposure_time = *t;
    } else if (auto t2 = header.get_number("EFFEXPTM")) {
        e.exposure_time = *t2;
    }
    if (auto g = header.get_string("GROUPID")) {
        e.group_id = *g;
    } else if (auto gi = header.get_int("GROUPID")) {
        e.group_id = std::to_string(*gi);
    }
    if (auto n = header.get_string("OBJNAME")) {
        e.name = *n;
    }

    e.wcs = wcs_from_header(header, e.cols(), e.rows());
    return e;
}

void write_exposure(const fs::path& path, const Exposure& exposure) {
    FitsFile file;
    create_file(file, path);

    int status = 0;
    fits_create_img(file.ptr, FLOAT_IMG, 0, nullptr, &status);
    FitsHeader primary;
    primary.set("EXPTIME", exposure.exposure_time);
    if (!exposure.group_id.empty()) {
        primary.set("GROUPID", exposure.group_id);
    }
    primary.set("OBJNAME", exposure.name);
    write_header(file.ptr, primary, status);
    if (status) {
        throw FitsError("Cannot write primary header to " + path.string() + ": " +
                        fits_status_text(status));
    }

    append_float_image(file.ptr, "SCI", exposure.data, wcs_header(exposure.wcs), path.string());
    if (exposure.has_err()) {
        append_float_image(file.ptr, "ERR", exposure.err, FitsHeader{}, path.string());
    }
    append_dq_image(file.ptr, exposure.dq, path.string());
    if (exposure.has_var_rnoise()) {
        append_float_image(file.ptr, "VAR_RNOISE", exposure.var_rnoise, FitsHeader{},
                           path.string());
    }
    close_file(file, path);
}

void FitsProductSink::save_mosaic(const std::string& path, const Matrix2Df& data,
                                  const Matrix2Df& weight, const astrometry::WCS& grid) {
    try {
        FitsFile file;
        create_file(file, path);
        int status = 0;
        fits_create_img(file.ptr, FLOAT_IMG, 0, nullptr, &status);
        if (status) {
            throw FitsError("Cannot write primary HDU to " + path + ": " +
                            fits_status_text(status));
        }
        append_float_image(file.ptr, "SCI", data, wcs_header(grid), path);
        append_float_image(file.ptr, "WHT", weight, wcs_header(grid), path);
        close_file(file, path);
    } catch (const IOError& ex) {
        throw PersistenceError(ex.what());
    }
}

void FitsProductSink::save_reference(const std::string& path, const Matrix2Df& data,
                                     const astrometry::WCS& grid) {
    try {
        write_fits_float(path, data, FitsHeader{}, &grid);
    } catch (const IOError& ex) {
        throw PersistenceError(ex.what());
    }
}

} // namespace outlier_detect::io
