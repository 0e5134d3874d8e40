#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/detection/mask_writer.hpp"

#include <catch2/catch_test_macros.hpp>

using outlier_detect::BoolMatrix;
using outlier_detect::DQMatrix;
namespace det = outlier_detect::detection;
namespace dq = outlier_detect::dq;

TEST_CASE("outlier_flags_respect_do_not_use_option") {
    REQUIRE(det::outlier_flags(true) == (dq::OUTLIER | dq::DO_NOT_USE));
    REQUIRE(det::outlier_flags(false) == dq::OUTLIER);
}

TEST_CASE("apply_outlier_mask_sets_bits_and_keeps_existing") {
    DQMatrix q = DQMatrix::Zero(2, 3);
    q(0, 0) = dq::SATURATED;
    q(1, 2) = dq::JUMP_DET;
    BoolMatrix mask = BoolMatrix::Constant(2, 3, false);
    mask(0, 0) = true;
    mask(1, 1) = true;

    const int changed = det::apply_outlier_mask(q, mask, det::outlier_flags(true));

    REQUIRE(changed == 2);
    REQUIRE(q(0, 0) == (dq::SATURATED | dq::OUTLIER | dq::DO_NOT_USE));
    REQUIRE(q(1, 1) == (dq::OUTLIER | dq::DO_NOT_USE));
    REQUIRE(q(1, 2) == dq::JUMP_DET);
    REQUIRE(q(0, 1) == 0u);
}

TEST_CASE("apply_outlier_mask_is_idempotent") {
    DQMatrix q = DQMatrix::Zero(3, 3);
    q(2, 2) = dq::HOT;
    BoolMatrix mask = BoolMatrix::Constant(3, 3, false);
    mask(1, 1) = true;
    mask(2, 2) = true;

    det::apply_outlier_mask(q, mask, det::outlier_flags(true));
    const DQMatrix once = q;
    const int second = det::apply_outlier_mask(q, mask, det::outlier_flags(true));

    REQUIRE(second == 0);
    REQUIRE(q == once);
}

TEST_CASE("apply_outlier_mask_rejects_shape_mismatch") {
    DQMatrix q = DQMatrix::Zero(2, 2);
    BoolMatrix mask = BoolMatrix::Constant(2, 3, true);
    REQUIRE_THROWS_AS(det::apply_outlier_mask(q, mask, dq::OUTLIER),
                      outlier_detect::ValidationError);
    REQUIRE(q == DQMatrix::Zero(2, 2));
}
