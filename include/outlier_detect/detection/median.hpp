#pragma once

#include "outlier_detect/core/types.hpp"

#include <vector>

namespace outlier_detect::detection {

struct CombineOptions {
    float maskpt = 0.7f;
    WeightRule rule = WeightRule::PIXEL_MEDIAN;
    // IMAGE_MEAN only: absolute inclusion threshold per stack member,
    // see compute_weight_threshold().
    std::vector<float> weight_thresholds;
    int workers = 1;
};

// maskpt times the 3-sigma clipped mean of the non-zero, finite weights of
// one mosaic. 0 when the mosaic has no usable weight.
float compute_weight_threshold(const Matrix2Df& weight, float maskpt);

// Robust per-pixel median of a mosaic stack.
//
// At each pixel a member is included when its weight is positive and at or
// above the inclusion threshold: maskpt x (median of the non-zero weights at
// that pixel) for PIXEL_MEDIAN, the member's precomputed threshold for
// IMAGE_MEAN. The output is the median of the included values (mean of the
// two central values for even counts) or NaN when nothing is included.
//
// Throws CombineError on an empty stack or inconsistent shapes.
Matrix2Df combine(const std::vector<Matrix2Df>& data,
                  const std::vector<Matrix2Df>& weights,
                  const CombineOptions& opts);

} // namespace outlier_detect::detection
