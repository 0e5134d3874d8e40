#include "outlier_detect/resample/weights.hpp"
#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"

#include <cmath>

namespace outlier_detect::resample {

Matrix2Df build_weight(const Exposure& exposure, WeightType type,
                       const std::optional<uint32_t>& good_bits) {
    const Eigen::Index rows = exposure.data.rows();
    const Eigen::Index cols = exposure.data.cols();
    if (exposure.dq.rows() != rows || exposure.dq.cols() != cols) {
        throw ValidationError("DQ shape does not match data for " + exposure.name);
    }

    Matrix2Df weight = dq::build_good_mask(exposure.dq, good_bits);

    switch (type) {
        case WeightType::IVM:
            if (exposure.has_var_rnoise()) {
                for (Eigen::Index i = 0; i < weight.size(); ++i) {
                    const float v = exposure.var_rnoise.data()[i];
                    float ivm = 1.0f / v;
                    if (!std::isfinite(ivm)) ivm = 1.0f;
                    weight.data()[i] *= ivm;
                }
            }
            break;
        case WeightType::EXPTIME:
            weight *= static_cast<float>(exposure.exposure_time);
            break;
        case WeightType::NONE:
            break;
    }

    for (Eigen::Index i = 0; i < weight.size(); ++i) {
        if (!std::isfinite(exposure.data.data()[i]) || !(weight.data()[i] > 0.0f)) {
            weight.data()[i] = 0.0f;
        }
    }
    return weight;
}

PassthroughMosaic make_passthrough(const Exposure& exposure, size_t index,
                                   WeightType type,
                                   const std::optional<uint32_t>& good_bits) {
    PassthroughMosaic m;
    m.name = exposure.name;
    m.filename = exposure.filename;
    m.grid = exposure.wcs;
    m.grid.naxis1 = exposure.cols();
    m.grid.naxis2 = exposure.rows();
    m.data = exposure.data;
    m.weight = build_weight(exposure, type, good_bits);
    m.exposure_index = index;
    return m;
}

} // namespace outlier_detect::resample
