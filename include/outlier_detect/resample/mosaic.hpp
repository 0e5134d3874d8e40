#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/core/types.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace outlier_detect::resample {

// Group of exposures drizzled onto the shared output grid.
struct ResampledMosaic {
    std::string name;
    std::string filename;
    astrometry::WCS grid;
    Matrix2Df data;
    Matrix2Df weight;
    std::vector<size_t> members;  // exposure indices
};

// Exposure used as is on its native grid, weight attached.
struct PassthroughMosaic {
    std::string name;
    std::string filename;
    astrometry::WCS grid;
    Matrix2Df data;
    Matrix2Df weight;
    size_t exposure_index = 0;
};

using Mosaic = std::variant<ResampledMosaic, PassthroughMosaic>;

inline const Matrix2Df& mosaic_data(const Mosaic& m) {
    return std::visit([](const auto& v) -> const Matrix2Df& { return v.data; }, m);
}

inline const Matrix2Df& mosaic_weight(const Mosaic& m) {
    return std::visit([](const auto& v) -> const Matrix2Df& { return v.weight; }, m);
}

inline const astrometry::WCS& mosaic_grid(const Mosaic& m) {
    return std::visit([](const auto& v) -> const astrometry::WCS& { return v.grid; }, m);
}

inline const std::string& mosaic_name(const Mosaic& m) {
    return std::visit([](const auto& v) -> const std::string& { return v.name; }, m);
}

inline const std::string& mosaic_filename(const Mosaic& m) {
    return std::visit([](const auto& v) -> const std::string& { return v.filename; }, m);
}

inline bool is_resampled(const Mosaic& m) {
    return std::holds_alternative<ResampledMosaic>(m);
}

} // namespace outlier_detect::resample
