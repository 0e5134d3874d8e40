#include "outlier_detect/detection/comparator.hpp"
#include "outlier_detect/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace outlier_detect::detection {

Matrix2Df abs_deriv(const Matrix2Df& ref) {
    const Eigen::Index rows = ref.rows();
    const Eigen::Index cols = ref.cols();
    Matrix2Df out = Matrix2Df::Zero(rows, cols);

    for (Eigen::Index y = 0; y < rows; ++y) {
        for (Eigen::Index x = 0; x < cols; ++x) {
            const float c = ref(y, x);
            if (!std::isfinite(c)) continue;
            float d = 0.0f;
            auto take = [&](Eigen::Index yy, Eigen::Index xx) {
                const float v = ref(yy, xx);
                if (std::isfinite(v)) d = std::max(d, std::abs(c - v));
            };
            if (y > 0) take(y - 1, x);
            if (y + 1 < rows) take(y + 1, x);
            if (x > 0) take(y, x - 1);
            if (x + 1 < cols) take(y, x + 1);
            out(y, x) = d;
        }
    }
    return out;
}

Matrix2Df noise_sigma(const Matrix2Df& err, const Matrix2Df& ref, const Matrix2Df& deriv,
                      const std::array<float, 2>& scale) {
    const Eigen::Index rows = ref.rows();
    const Eigen::Index cols = ref.cols();
    const bool has_err = err.size() > 0;
    const bool has_deriv = deriv.size() > 0;
    if ((has_err && (err.rows() != rows || err.cols() != cols)) ||
        (has_deriv && (deriv.rows() != rows || deriv.cols() != cols))) {
        throw ValidationError("noise inputs do not match the exposure shape");
    }

    const double s1 = scale[0];
    const double s2 = scale[1];
    Matrix2Df sigma(rows, cols);
    for (Eigen::Index i = 0; i < sigma.size(); ++i) {
        double e = has_err ? static_cast<double>(err.data()[i]) : 0.0;
        if (!std::isfinite(e)) e = 0.0;
        double level = std::abs(static_cast<double>(ref.data()[i]));
        if (!std::isfinite(level)) level = 0.0;
        const double d = has_deriv ? s1 * static_cast<double>(deriv.data()[i]) : 0.0;
        sigma.data()[i] =
            static_cast<float>(std::sqrt(e * e + s1 * s1 * level + d * d + s2 * s2));
    }
    return sigma;
}

BoolMatrix compare(const Matrix2Df& data, const Matrix2Df& err, const Matrix2Df& native_ref,
                   const CompareParams& params) {
    const Eigen::Index rows = data.rows();
    const Eigen::Index cols = data.cols();
    if (native_ref.rows() != rows || native_ref.cols() != cols) {
        throw ValidationError("reference shape " + std::to_string(native_ref.rows()) + "x" +
                              std::to_string(native_ref.cols()) + " does not match exposure " +
                              std::to_string(rows) + "x" + std::to_string(cols));
    }

    Matrix2Df deriv;
    if (params.resample_was_used) {
        deriv = abs_deriv(native_ref);
    }
    const Matrix2Df sigma = noise_sigma(err, native_ref, deriv, params.scale);

    // Normalised residual; NaN marks pixels that take no part in the test.
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    Matrix2Df z(rows, cols);
    for (Eigen::Index i = 0; i < z.size(); ++i) {
        const float d = data.data()[i];
        const float r = native_ref.data()[i];
        if (!std::isfinite(d) || !std::isfinite(r)) {
            z.data()[i] = nan;
            continue;
        }
        const float resid = std::abs(d - r - params.backg);
        const float s = sigma.data()[i];
        if (s > 0.0f) {
            z.data()[i] = resid / s;
        } else {
            z.data()[i] = resid > 0.0f ? inf : 0.0f;
        }
    }

    const float t1 = params.snr[0];
    const float t2 = params.snr[1];
    BoolMatrix mask = BoolMatrix::Constant(rows, cols, false);

    for (Eigen::Index y = 0; y < rows; ++y) {
        for (Eigen::Index x = 0; x < cols; ++x) {
            const float zc = z(y, x);
            if (!(zc > t1)) continue;

            float neighbour = 0.0f;
            for (Eigen::Index yy = std::max<Eigen::Index>(y - 1, 0);
                 yy <= std::min<Eigen::Index>(y + 1, rows - 1); ++yy) {
                for (Eigen::Index xx = std::max<Eigen::Index>(x - 1, 0);
                     xx <= std::min<Eigen::Index>(x + 1, cols - 1); ++xx) {
                    if (yy == y && xx == x) continue;
                    const float v = z(yy, xx);
                    if (!std::isnan(v)) neighbour = std::max(neighbour, v);
                }
            }
            const float corroborated = 0.5f * (zc + std::min(zc, neighbour));
            if (corroborated > t2) {
                mask(y, x) = true;
            }
        }
    }
    return mask;
}

} // namespace outlier_detect::detection
