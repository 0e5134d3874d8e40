#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/core/exposure.hpp"
#include "outlier_detect/core/types.hpp"
#include "outlier_detect/detection/products.hpp"

#include <map>
#include <optional>
#include <string>

namespace outlier_detect::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Integer or floating keyword as double.
    std::optional<double> get_number(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    void merge(const FitsHeader& other);
};

bool is_fits_image_path(const fs::path& path);

// Primary HDU image as float.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Single-HDU float image. WCS keywords are written when `wcs` is valid.
void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header,
                      const astrometry::WCS* wcs = nullptr);

FitsHeader wcs_header(const astrometry::WCS& wcs);
astrometry::WCS wcs_from_header(const FitsHeader& header, int naxis1, int naxis2);

// Exposure with SCI, ERR, DQ and VAR_RNOISE image extensions. SCI falls back
// to the primary HDU; ERR and VAR_RNOISE are optional; a missing DQ reads as
// all good. EXPTIME and GROUPID come from the primary header.
Exposure read_exposure(const fs::path& path);
void write_exposure(const fs::path& path, const Exposure& exposure);

// Writes products as FITS; failures raise PersistenceError.
class FitsProductSink : public detection::ProductSink {
public:
    void save_mosaic(const std::string& path, const Matrix2Df& data, const Matrix2Df& weight,
                     const astrometry::WCS& grid) override;
    void save_reference(const std::string& path, const Matrix2Df& data,
                        const astrometry::WCS& grid) override;
};

} // namespace outlier_detect::io
