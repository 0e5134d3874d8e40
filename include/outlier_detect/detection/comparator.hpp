#pragma once

#include "outlier_detect/core/types.hpp"

#include <array>

namespace outlier_detect::detection {

struct CompareParams {
    std::array<float, 2> snr{5.0f, 4.0f};
    std::array<float, 2> scale{1.2f, 0.7f};
    float backg = 0.0f;
    // Adds the (s1 * D)^2 derivative term. Without resampling the reference is
    // built on the native grid and no interpolation error is modelled. The test is
    // then more sensitive per pixel but has less statistical power: with few
    // exposures the median itself is noisy and nothing absorbs that noise.
    bool resample_was_used = true;
};

// Per pixel the largest absolute difference to the four direct neighbours.
// Non-finite neighbours are ignored; a non-finite centre yields 0.
Matrix2Df abs_deriv(const Matrix2Df& ref);

/**
 * Per-pixel noise estimate:
 *
 *   sigma^2 = err^2 + s1^2 * |ref| + (s1 * D)^2 + s2^2
 *
 * s1 scales the signal-dependent terms: a Poisson-like term taken from the
 * reference level and the interpolation term from the reference derivative D.
 * s2 is a constant floor. `err` and `deriv` may be empty (treated as 0);
 * non-finite err or ref values count as 0. The output has the shape of `ref`.
 */
Matrix2Df noise_sigma(const Matrix2Df& err, const Matrix2Df& ref, const Matrix2Df& deriv,
                      const std::array<float, 2>& scale);

/**
 * Two-tier outlier test on one exposure.
 *
 * r = data - ref - backg and z = |r| / sigma (z is infinite when sigma is 0
 * and r is not). The primary test is z > snr[0]. The secondary test scores
 * each pixel by its corroborated significance
 *
 *   c = (z + min(z, max z over the finite 3x3 neighbours)) / 2
 *
 * and requires c > snr[1]. An isolated hit is counted at half weight, a hit
 * inside a cluster of comparable residuals at full weight. c never exceeds z
 * and never decreases when a neighbour's residual grows, so the combined test
 * is a subset of the primary test and strictly stricter when snr[1] >= snr[0].
 *
 * With resample_was_used false the derivative term is dropped from sigma; see
 * CompareParams. Pixels where data or ref is not finite are never flagged.
 *
 * Throws ValidationError on shape mismatch.
 */
BoolMatrix compare(const Matrix2Df& data, const Matrix2Df& err, const Matrix2Df& native_ref,
                   const CompareParams& params);

} // namespace outlier_detect::detection
