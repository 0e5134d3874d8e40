#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/core/exposure.hpp"
#include "outlier_detect/core/types.hpp"
#include "outlier_detect/resample/mosaic.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace outlier_detect::resample {

/**
 * Mosaic resampler. Groups exposures into observation groups and drizzles
 * each group onto one shared output grid. Implementations throw
 * ResampleError when a geometric transform or the grid cannot be built.
 */
class Resampler {
public:
    virtual ~Resampler() = default;

    // Shared output grid covering every exposure.
    virtual astrometry::WCS output_grid(const std::vector<Exposure>& exposures) = 0;

    // Exposure indices per observation group, in first-appearance order.
    virtual std::vector<std::vector<size_t>> group(const std::vector<Exposure>& exposures) const;

    virtual ResampledMosaic resample_group(const std::vector<Exposure>& exposures,
                                           const std::vector<size_t>& members,
                                           const astrometry::WCS& grid) = 0;

    // One mosaic per group.
    std::vector<Mosaic> resample(const std::vector<Exposure>& exposures);
};

/**
 * Blot: maps an image on the output grid back onto an exposure's native
 * pixel grid. Pixels that fall outside the grid come back as NaN.
 */
class BackProjector {
public:
    virtual ~BackProjector() = default;

    virtual Matrix2Df project(const Matrix2Df& reference, const astrometry::WCS& grid,
                              const Exposure& target) = 0;
};

// Bilinear TAN-WCS resampler (OpenCV remap).
class WcsResampler : public Resampler {
public:
    WcsResampler(WeightType weight_type, std::optional<uint32_t> good_bits,
                 long long max_grid_pixels);

    astrometry::WCS output_grid(const std::vector<Exposure>& exposures) override;

    ResampledMosaic resample_group(const std::vector<Exposure>& exposures,
                                   const std::vector<size_t>& members,
                                   const astrometry::WCS& grid) override;

private:
    WeightType weight_type_;
    std::optional<uint32_t> good_bits_;
    long long max_grid_pixels_;
};

class WcsBackProjector : public BackProjector {
public:
    Matrix2Df project(const Matrix2Df& reference, const astrometry::WCS& grid,
                      const Exposure& target) override;
};

} // namespace outlier_detect::resample
