#pragma once

#include "outlier_detect/core/exposure.hpp"
#include "outlier_detect/core/types.hpp"
#include "outlier_detect/resample/mosaic.hpp"

#include <cstdint>
#include <optional>

namespace outlier_detect::resample {

// Per-pixel drizzle weight for an exposure on its native grid:
//   ivm     -> 1 / var_rnoise (non-finite -> 1, missing array -> 1)
//   exptime -> exposure time
//   none    -> 1
// multiplied by the good-pixel mask from good_bits. Pixels with non-finite
// data always get weight 0.
Matrix2Df build_weight(const Exposure& exposure, WeightType type,
                       const std::optional<uint32_t>& good_bits);

// Exposure passed through unchanged with its weight attached.
PassthroughMosaic make_passthrough(const Exposure& exposure, size_t index,
                                   WeightType type,
                                   const std::optional<uint32_t>& good_bits);

} // namespace outlier_detect::resample
