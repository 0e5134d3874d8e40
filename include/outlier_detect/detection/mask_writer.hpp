#pragma once

#include "outlier_detect/core/types.hpp"

#include <cstdint>

namespace outlier_detect::detection {

// OUTLIER, plus DO_NOT_USE when requested.
uint32_t outlier_flags(bool mark_do_not_use);

// ORs `flags` into dq wherever mask is set. Never clears bits.
// Returns the number of pixels whose DQ value changed, so a repeated call
// with the same mask returns 0. Throws ValidationError on shape mismatch.
int apply_outlier_mask(DQMatrix& dq, const BoolMatrix& mask, uint32_t flags);

} // namespace outlier_detect::detection
