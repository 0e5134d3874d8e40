#include "outlier_detect/detection/mask_writer.hpp"
#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"

#include <string>

namespace outlier_detect::detection {

uint32_t outlier_flags(bool mark_do_not_use) {
    return mark_do_not_use ? (dq::OUTLIER | dq::DO_NOT_USE) : dq::OUTLIER;
}

int apply_outlier_mask(DQMatrix& dq, const BoolMatrix& mask, uint32_t flags) {
    if (dq.rows() != mask.rows() || dq.cols() != mask.cols()) {
        throw ValidationError("outlier mask " + std::to_string(mask.rows()) + "x" +
                              std::to_string(mask.cols()) + " does not match DQ " +
                              std::to_string(dq.rows()) + "x" + std::to_string(dq.cols()));
    }
    int changed = 0;
    for (Eigen::Index i = 0; i < dq.size(); ++i) {
        if (!mask.data()[i]) continue;
        uint32_t& v = dq.data()[i];
        const uint32_t updated = v | flags;
        if (updated != v) {
            v = updated;
            ++changed;
        }
    }
    return changed;
}

} // namespace outlier_detect::detection
