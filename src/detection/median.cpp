#include "outlier_detect/detection/median.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/parallel.hpp"
#include "outlier_detect/core/utils.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace outlier_detect::detection {

float compute_weight_threshold(const Matrix2Df& weight, float maskpt) {
    std::vector<float> vals;
    vals.reserve(static_cast<size_t>(weight.size()));
    for (Eigen::Index i = 0; i < weight.size(); ++i) {
        const float w = weight.data()[i];
        if (std::isfinite(w) && w > 0.0f) vals.push_back(w);
    }
    if (vals.empty()) return 0.0f;
    return maskpt * core::sigma_clipped_mean(std::move(vals), 3.0f, 5);
}

Matrix2Df combine(const std::vector<Matrix2Df>& data,
                  const std::vector<Matrix2Df>& weights,
                  const CombineOptions& opts) {
    if (data.empty()) {
        throw CombineError("empty mosaic stack");
    }
    if (weights.size() != data.size()) {
        throw CombineError("stack has " + std::to_string(data.size()) + " images but " +
                           std::to_string(weights.size()) + " weight maps");
    }
    if (!(opts.maskpt > 0.0f) || opts.maskpt > 1.0f) {
        throw CombineError("maskpt must be in (0, 1]");
    }
    if (opts.rule == WeightRule::IMAGE_MEAN && opts.weight_thresholds.size() != data.size()) {
        throw CombineError("image_mean rule requires one weight threshold per mosaic");
    }

    const Eigen::Index rows = data.front().rows();
    const Eigen::Index cols = data.front().cols();
    for (size_t k = 0; k < data.size(); ++k) {
        if (data[k].rows() != rows || data[k].cols() != cols ||
            weights[k].rows() != rows || weights[k].cols() != cols) {
            throw CombineError("mosaic " + std::to_string(k) + " is not on the common grid");
        }
    }

    const size_t n = data.size();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const double maskpt = static_cast<double>(opts.maskpt);
    Matrix2Df out(rows, cols);

    core::parallel_for(static_cast<size_t>(rows), opts.workers, [&](size_t r) {
        const Eigen::Index y = static_cast<Eigen::Index>(r);
        std::vector<float> stack_weights;
        std::vector<float> included;
        stack_weights.reserve(n);
        included.reserve(n);

        for (Eigen::Index x = 0; x < cols; ++x) {
            included.clear();

            if (opts.rule == WeightRule::PIXEL_MEDIAN) {
                stack_weights.clear();
                for (size_t k = 0; k < n; ++k) {
                    const float w = weights[k](y, x);
                    if (std::isfinite(w) && w > 0.0f) stack_weights.push_back(w);
                }
                if (stack_weights.empty()) {
                    out(y, x) = nan;
                    continue;
                }
                const double threshold =
                    maskpt * static_cast<double>(core::median_of(stack_weights));
                for (size_t k = 0; k < n; ++k) {
                    const float w = weights[k](y, x);
                    const float v = data[k](y, x);
                    if (std::isfinite(w) && w > 0.0f && static_cast<double>(w) >= threshold &&
                        std::isfinite(v)) {
                        included.push_back(v);
                    }
                }
            } else {
                for (size_t k = 0; k < n; ++k) {
                    const float w = weights[k](y, x);
                    const float v = data[k](y, x);
                    if (std::isfinite(w) && w > 0.0f && w >= opts.weight_thresholds[k] &&
                        std::isfinite(v)) {
                        included.push_back(v);
                    }
                }
            }

            out(y, x) = included.empty() ? nan : core::median_of(included);
        }
    });

    return out;
}

} // namespace outlier_detect::detection
