#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/core/types.hpp"

#include <functional>
#include <string>

namespace outlier_detect::detection {

// (basepath, suffix) -> product path
using OutputPathFn = std::function<std::string(const std::string&, const std::string&)>;

// Strips the extension and a known product suffix (_cal, _s2d, _median, ...)
// from basepath, then appends `suffix` (a leading '_' is added if missing)
// and ".fits". The directory of basepath is kept.
std::string make_output_path(const std::string& basepath, const std::string& suffix);

// Destination for optional intermediate products.
class ProductSink {
public:
    virtual ~ProductSink() = default;

    virtual void save_mosaic(const std::string& path, const Matrix2Df& data,
                             const Matrix2Df& weight, const astrometry::WCS& grid) = 0;
    virtual void save_reference(const std::string& path, const Matrix2Df& data,
                                const astrometry::WCS& grid) = 0;
};

} // namespace outlier_detect::detection
