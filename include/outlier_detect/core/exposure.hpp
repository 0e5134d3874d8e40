#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "types.hpp"

#include <string>

namespace outlier_detect {

// One calibrated exposure. Arrays are row-major (rows = NAXIS2).
// err and var_rnoise are empty when the product does not carry them.
struct Exposure {
    std::string name;
    std::string filename;   // output path hint
    std::string group_id;   // observation group used by the resampler
    double exposure_time = 0.0;
    astrometry::WCS wcs;

    Matrix2Df data;
    Matrix2Df err;
    Matrix2Df var_rnoise;
    DQMatrix dq;

    int rows() const { return static_cast<int>(data.rows()); }
    int cols() const { return static_cast<int>(data.cols()); }

    bool has_err() const {
        return err.rows() == data.rows() && err.cols() == data.cols() && err.size() > 0;
    }
    bool has_var_rnoise() const {
        return var_rnoise.rows() == data.rows() && var_rnoise.cols() == data.cols() &&
               var_rnoise.size() > 0;
    }
};

} // namespace outlier_detect
